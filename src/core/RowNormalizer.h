#pragma once

#include <QList>
#include <QString>

#include "core/JsonValue.h"

// One flattened field of a node as the graph view shows it. An empty key means the
// node itself is a bare value rather than a member of an object.
struct DisplayRow {
    QString key;
    JsonValue value;
    JsonValue::Type type = JsonValue::Type::Null;

    bool hasKey() const { return !key.isEmpty(); }
    bool isStructural() const
    {
        return type == JsonValue::Type::Array || type == JsonValue::Type::Object;
    }
};

namespace RowNormalizer {
QString normalize(const QList<DisplayRow> &rows);
QList<DisplayRow> rowsFromValue(const JsonValue &node);

// Unquoted text for strings, JSON text for everything else.
QString plainText(const JsonValue &value);
}

#include "core/RowNormalizer.h"

#include "core/JsonCodec.h"

namespace RowNormalizer {
QString normalize(const QList<DisplayRow> &rows)
{
    if (rows.isEmpty()) {
        return QStringLiteral("{}");
    }
    if (rows.size() == 1 && !rows.first().hasKey()) {
        return plainText(rows.first().value);
    }

    JsonObject fields;
    for (const DisplayRow &row : rows) {
        if (row.isStructural() || !row.hasKey()) {
            continue;
        }
        fields.insert(row.key, row.value);
    }
    return QString::fromUtf8(JsonCodec::toJson(JsonValue(std::move(fields)), true));
}

QList<DisplayRow> rowsFromValue(const JsonValue &node)
{
    QList<DisplayRow> rows;
    if (!node.isObject()) {
        rows.append(DisplayRow{QString(), node, node.type()});
        return rows;
    }
    for (const JsonObject::Member &member : node.toObject()) {
        rows.append(DisplayRow{member.first, member.second, member.second.type()});
    }
    return rows;
}

QString plainText(const JsonValue &value)
{
    if (value.isString()) {
        return value.toString();
    }
    return QString::fromUtf8(JsonCodec::toJson(value));
}
}

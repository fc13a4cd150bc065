#pragma once

#include <QString>

#include "core/JsonValue.h"

namespace ValueCoercion {
// Attempts in precedence order. The first one that accepts the text wins.
enum class Interpretation {
    Json,
    QuotedString,
    Null,
    Boolean,
    Number,
    BareString
};

struct Result {
    JsonValue value;
    Interpretation interpretation = Interpretation::BareString;
};

Result interpret(const QString &text);
JsonValue coerce(const QString &text);

QString interpretationName(Interpretation interpretation);
}

#pragma once

#include <QByteArray>
#include <QString>

class JsonValue;

namespace JsonCodec {
// Parses UTF-8 JSON text with full number precision. Integers that fit in 64 bits
// stay integers; duplicate object keys keep the last value.
bool parse(const QByteArray &json, JsonValue *out, QString *errorMessage = nullptr,
           int *errorOffset = nullptr);

// Compact output, or pretty output with a two space indent.
QByteArray toJson(const JsonValue &value, bool pretty = false);
}

#include "core/JsonCodec.h"

#include "core/JsonValue.h"

#include <cmath>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace {
JsonValue fromRapidValue(const rapidjson::Value &value)
{
    switch (value.GetType()) {
    case rapidjson::kNullType:
        return JsonValue();
    case rapidjson::kFalseType:
        return JsonValue(false);
    case rapidjson::kTrueType:
        return JsonValue(true);
    case rapidjson::kNumberType:
        if (value.IsInt64()) {
            return JsonValue(static_cast<qint64>(value.GetInt64()));
        }
        return JsonValue(value.GetDouble());
    case rapidjson::kStringType:
        return JsonValue(QString::fromUtf8(value.GetString(),
                                           static_cast<int>(value.GetStringLength())));
    case rapidjson::kArrayType: {
        JsonArray array;
        array.reserve(static_cast<int>(value.Size()));
        for (auto it = value.Begin(); it != value.End(); ++it) {
            array.append(fromRapidValue(*it));
        }
        return JsonValue(std::move(array));
    }
    case rapidjson::kObjectType: {
        JsonObject object;
        for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
            QString key = QString::fromUtf8(it->name.GetString(),
                                            static_cast<int>(it->name.GetStringLength()));
            object.insert(key, fromRapidValue(it->value));
        }
        return JsonValue(std::move(object));
    }
    }
    return JsonValue();
}

template <typename Writer>
void writeValue(Writer &writer, const JsonValue &value)
{
    switch (value.type()) {
    case JsonValue::Type::Null:
        writer.Null();
        return;
    case JsonValue::Type::Bool:
        writer.Bool(value.toBool());
        return;
    case JsonValue::Type::Number:
        if (value.isInteger()) {
            writer.Int64(value.toInteger());
        } else if (std::isfinite(value.toDouble())) {
            writer.Double(value.toDouble());
        } else {
            writer.Null();
        }
        return;
    case JsonValue::Type::String: {
        QByteArray utf8 = value.toString().toUtf8();
        writer.String(utf8.constData(), static_cast<rapidjson::SizeType>(utf8.size()), true);
        return;
    }
    case JsonValue::Type::Array:
        writer.StartArray();
        for (const JsonValue &element : value.toArray()) {
            writeValue(writer, element);
        }
        writer.EndArray();
        return;
    case JsonValue::Type::Object:
        writer.StartObject();
        for (const JsonObject::Member &member : value.toObject()) {
            QByteArray key = member.first.toUtf8();
            writer.Key(key.constData(), static_cast<rapidjson::SizeType>(key.size()), true);
            writeValue(writer, member.second);
        }
        writer.EndObject();
        return;
    }
}
}

namespace JsonCodec {
bool parse(const QByteArray &json, JsonValue *out, QString *errorMessage, int *errorOffset)
{
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.constData(),
                                                   static_cast<size_t>(json.size()));
    if (doc.HasParseError()) {
        int offset = static_cast<int>(doc.GetErrorOffset());
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 at offset %2")
                                .arg(QString::fromUtf8(rapidjson::GetParseError_En(doc.GetParseError())))
                                .arg(offset);
        }
        if (errorOffset) {
            *errorOffset = offset;
        }
        return false;
    }
    if (out) {
        *out = fromRapidValue(doc);
    }
    return true;
}

QByteArray toJson(const JsonValue &value, bool pretty)
{
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        writeValue(writer, value);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        writeValue(writer, value);
    }
    return QByteArray(buffer.GetString(), static_cast<int>(buffer.GetSize()));
}
}

#include "core/JsonValue.h"

namespace {
const JsonArray &emptyArray()
{
    static const JsonArray empty;
    return empty;
}

const JsonObject &emptyObject()
{
    static const JsonObject empty;
    return empty;
}
}

JsonValue::JsonValue(bool value)
    : type_(Type::Bool)
    , bool_(value)
{
}

JsonValue::JsonValue(int value)
    : JsonValue(static_cast<qint64>(value))
{
}

JsonValue::JsonValue(qint64 value)
    : type_(Type::Number)
    , integral_(true)
    , integer_(value)
    , double_(static_cast<double>(value))
{
}

JsonValue::JsonValue(double value)
    : type_(Type::Number)
    , double_(value)
{
}

JsonValue::JsonValue(const QString &value)
    : type_(Type::String)
    , string_(value)
{
}

JsonValue::JsonValue(const char *value)
    : type_(Type::String)
    , string_(QString::fromUtf8(value))
{
}

JsonValue::JsonValue(const JsonArray &array)
    : type_(Type::Array)
    , array_(std::make_shared<const JsonArray>(array))
{
}

JsonValue::JsonValue(JsonArray &&array)
    : type_(Type::Array)
    , array_(std::make_shared<const JsonArray>(std::move(array)))
{
}

JsonValue::JsonValue(const JsonObject &object)
    : type_(Type::Object)
    , object_(std::make_shared<const JsonObject>(object))
{
}

JsonValue::JsonValue(JsonObject &&object)
    : type_(Type::Object)
    , object_(std::make_shared<const JsonObject>(std::move(object)))
{
}

bool JsonValue::toBool(bool fallback) const
{
    return type_ == Type::Bool ? bool_ : fallback;
}

double JsonValue::toDouble(double fallback) const
{
    return type_ == Type::Number ? double_ : fallback;
}

qint64 JsonValue::toInteger(qint64 fallback) const
{
    if (type_ != Type::Number) {
        return fallback;
    }
    return integral_ ? integer_ : static_cast<qint64>(double_);
}

QString JsonValue::toString() const
{
    return type_ == Type::String ? string_ : QString();
}

const JsonArray &JsonValue::toArray() const
{
    return array_ ? *array_ : emptyArray();
}

const JsonObject &JsonValue::toObject() const
{
    return object_ ? *object_ : emptyObject();
}

bool JsonValue::sharesDataWith(const JsonValue &other) const
{
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
    case Type::Array:
        return array_ == other.array_;
    case Type::Object:
        return object_ == other.object_;
    default:
        return *this == other;
    }
}

bool JsonValue::operator==(const JsonValue &other) const
{
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
    case Type::Null:
        return true;
    case Type::Bool:
        return bool_ == other.bool_;
    case Type::Number:
        if (integral_ && other.integral_) {
            return integer_ == other.integer_;
        }
        return double_ == other.double_;
    case Type::String:
        return string_ == other.string_;
    case Type::Array:
        return array_ == other.array_ || *array_ == *other.array_;
    case Type::Object:
        return object_ == other.object_ || *object_ == *other.object_;
    }
    return false;
}

QString JsonValue::typeName(Type type)
{
    switch (type) {
    case Type::Null:
        return QStringLiteral("null");
    case Type::Bool:
        return QStringLiteral("boolean");
    case Type::Number:
        return QStringLiteral("number");
    case Type::String:
        return QStringLiteral("string");
    case Type::Array:
        return QStringLiteral("array");
    case Type::Object:
        return QStringLiteral("object");
    }
    return QStringLiteral("null");
}

JsonObject::JsonObject(std::initializer_list<Member> members)
{
    for (const Member &member : members) {
        insert(member.first, member.second);
    }
}

int JsonObject::indexOf(const QString &key) const
{
    return positions_.value(key, -1);
}

const JsonValue *JsonObject::find(const QString &key) const
{
    int index = indexOf(key);
    return index >= 0 ? &members_.at(index).second : nullptr;
}

JsonValue JsonObject::value(const QString &key) const
{
    const JsonValue *found = find(key);
    return found ? *found : JsonValue();
}

QStringList JsonObject::keys() const
{
    QStringList out;
    out.reserve(members_.size());
    for (const Member &member : members_) {
        out << member.first;
    }
    return out;
}

void JsonObject::insert(const QString &key, const JsonValue &value)
{
    int index = indexOf(key);
    if (index >= 0) {
        members_[index].second = value;
        return;
    }
    positions_.insert(key, static_cast<int>(members_.size()));
    members_.append(Member(key, value));
}

bool JsonObject::operator==(const JsonObject &other) const
{
    if (members_.size() != other.members_.size()) {
        return false;
    }
    for (const Member &member : members_) {
        const JsonValue *counterpart = other.find(member.first);
        if (!counterpart || *counterpart != member.second) {
            return false;
        }
    }
    return true;
}

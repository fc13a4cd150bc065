#pragma once

#include <QHash>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>
#include <cstddef>
#include <initializer_list>
#include <memory>

class JsonValue;
class JsonObject;

using JsonArray = QVector<JsonValue>;

// Immutable JSON value. Arrays and objects are held through shared pointers, so
// copying a value shares its containers instead of cloning them.
class JsonValue
{
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    JsonValue() = default;
    JsonValue(std::nullptr_t) {}
    JsonValue(bool value);
    JsonValue(int value);
    JsonValue(qint64 value);
    JsonValue(double value);
    JsonValue(const QString &value);
    JsonValue(const char *value);
    JsonValue(const JsonArray &array);
    JsonValue(JsonArray &&array);
    JsonValue(const JsonObject &object);
    JsonValue(JsonObject &&object);

    Type type() const { return type_; }
    bool isNull() const { return type_ == Type::Null; }
    bool isBool() const { return type_ == Type::Bool; }
    bool isNumber() const { return type_ == Type::Number; }
    bool isInteger() const { return type_ == Type::Number && integral_; }
    bool isString() const { return type_ == Type::String; }
    bool isArray() const { return type_ == Type::Array; }
    bool isObject() const { return type_ == Type::Object; }
    bool isContainer() const { return isArray() || isObject(); }

    bool toBool(bool fallback = false) const;
    double toDouble(double fallback = 0.0) const;
    qint64 toInteger(qint64 fallback = 0) const;
    QString toString() const;
    const JsonArray &toArray() const;
    const JsonObject &toObject() const;

    // True when both values refer to the same container storage. Scalars have no
    // identity and compare by value.
    bool sharesDataWith(const JsonValue &other) const;

    bool operator==(const JsonValue &other) const;
    bool operator!=(const JsonValue &other) const { return !(*this == other); }

    static QString typeName(Type type);

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    bool integral_ = false;
    qint64 integer_ = 0;
    double double_ = 0.0;
    QString string_;
    std::shared_ptr<const JsonArray> array_;
    std::shared_ptr<const JsonObject> object_;
};

// Ordered string-keyed mapping. Keys keep their first insertion position.
class JsonObject
{
public:
    using Member = QPair<QString, JsonValue>;
    using const_iterator = QVector<Member>::const_iterator;

    JsonObject() = default;
    JsonObject(std::initializer_list<Member> members);

    int size() const { return static_cast<int>(members_.size()); }
    bool isEmpty() const { return members_.isEmpty(); }
    bool contains(const QString &key) const { return indexOf(key) >= 0; }
    int indexOf(const QString &key) const;
    const JsonValue *find(const QString &key) const;
    JsonValue value(const QString &key) const;
    const Member &at(int index) const { return members_.at(index); }
    QStringList keys() const;

    void insert(const QString &key, const JsonValue &value);

    const_iterator begin() const { return members_.cbegin(); }
    const_iterator end() const { return members_.cend(); }

    bool operator==(const JsonObject &other) const;
    bool operator!=(const JsonObject &other) const { return !(*this == other); }

private:
    QVector<Member> members_;
    QHash<QString, int> positions_;
};

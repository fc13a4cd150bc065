#include "core/JsonPath.h"

#include "core/JsonValue.h"

#include <QObject>
#include <cmath>
#include <limits>

PathSegment::PathSegment(int index)
    : isIndex_(true)
    , index_(index)
{
}

PathSegment::PathSegment(const QString &key)
    : key_(key)
{
}

PathSegment::PathSegment(const char *key)
    : key_(QString::fromUtf8(key))
{
}

bool PathSegment::operator==(const PathSegment &other) const
{
    if (isIndex_ != other.isIndex_) {
        return false;
    }
    return isIndex_ ? index_ == other.index_ : key_ == other.key_;
}

bool pathFromJson(const JsonValue &value, JsonPath *out, QString *errorMessage)
{
    if (!value.isArray()) {
        if (errorMessage) {
            *errorMessage = QObject::tr("Path must be a JSON array, got %1")
                                .arg(JsonValue::typeName(value.type()));
        }
        return false;
    }

    JsonPath path;
    const JsonArray &segments = value.toArray();
    path.reserve(segments.size());
    for (int i = 0; i < segments.size(); ++i) {
        const JsonValue &segment = segments.at(i);
        if (segment.isString()) {
            path.append(PathSegment(segment.toString()));
            continue;
        }
        if (segment.isNumber()) {
            double number = segment.toDouble();
            if (number >= 0 && number <= std::numeric_limits<int>::max()
                && std::floor(number) == number) {
                path.append(PathSegment(static_cast<int>(number)));
                continue;
            }
        }
        if (errorMessage) {
            *errorMessage = QObject::tr("Path segment %1 must be a string or a non-negative integer")
                                .arg(i);
        }
        return false;
    }

    if (out) {
        *out = path;
    }
    return true;
}

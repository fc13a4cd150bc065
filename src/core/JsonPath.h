#pragma once

#include <QString>
#include <QVector>

class JsonValue;

class PathSegment
{
public:
    PathSegment(int index);
    PathSegment(const QString &key);
    PathSegment(const char *key);

    bool isIndex() const { return isIndex_; }
    bool isKey() const { return !isIndex_; }
    int index() const { return index_; }
    const QString &key() const { return key_; }

    bool operator==(const PathSegment &other) const;
    bool operator!=(const PathSegment &other) const { return !(*this == other); }

private:
    bool isIndex_ = false;
    int index_ = -1;
    QString key_;
};

using JsonPath = QVector<PathSegment>;

// Reads a path written as a JSON array of keys and non-negative indices,
// e.g. ["items", 2, "name"].
bool pathFromJson(const JsonValue &value, JsonPath *out, QString *errorMessage = nullptr);

#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

#include "core/JsonPath.h"
#include "core/JsonValue.h"
#include "core/RowNormalizer.h"

struct NodeData {
    QList<DisplayRow> rows;
    JsonPath path;
    bool hasPath = false;

    static NodeData fromDocument(const JsonValue &document, const JsonPath &path);
};

struct EditResult {
    enum class Status { Applied, MissingPath, MalformedInput };

    Status status = Status::Applied;
    QString message;
    JsonValue document;
    QByteArray json;

    bool ok() const { return status == Status::Applied; }
};

class NodeEditSession
{
public:
    explicit NodeEditSession(const NodeData &node);

    const NodeData &node() const { return node_; }

    // Editable text for the node; cancelling an edit resets the editor to this.
    QString content() const;
    QString pathText() const;

    EditResult save(const QByteArray &documentJson, const QString &editedText) const;
    EditResult saveDocument(const JsonValue &document, const QString &editedText) const;

private:
    NodeData node_;
};

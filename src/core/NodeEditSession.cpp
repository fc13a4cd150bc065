#include "core/NodeEditSession.h"

#include "core/JsonCodec.h"
#include "core/ParseDiagnostics.h"
#include "core/PathFormatter.h"
#include "core/PathUpdater.h"
#include "core/ValueCoercion.h"

#include <QDebug>
#include <QObject>

namespace {
EditResult missingPathResult()
{
    EditResult result;
    result.status = EditResult::Status::MissingPath;
    result.message = QObject::tr("Cannot update: node path is missing");
    qWarning() << "NodeEditSession::save" << result.message;
    return result;
}
}

NodeData NodeData::fromDocument(const JsonValue &document, const JsonPath &path)
{
    NodeData node;
    node.path = path;
    node.hasPath = true;
    node.rows = RowNormalizer::rowsFromValue(PathUpdater::valueAt(document, path));
    return node;
}

NodeEditSession::NodeEditSession(const NodeData &node)
    : node_(node)
{
}

QString NodeEditSession::content() const
{
    return RowNormalizer::normalize(node_.rows);
}

QString NodeEditSession::pathText() const
{
    if (!node_.hasPath) {
        return QStringLiteral("$");
    }
    return PathFormatter::format(node_.path);
}

EditResult NodeEditSession::save(const QByteArray &documentJson, const QString &editedText) const
{
    if (!node_.hasPath) {
        return missingPathResult();
    }

    JsonValue document;
    QString parseError;
    int errorOffset = -1;
    if (!JsonCodec::parse(documentJson, &document, &parseError, &errorOffset)) {
        EditResult result;
        result.status = EditResult::Status::MalformedInput;
        result.message = QObject::tr("Invalid JSON: %1").arg(parseError);
        qWarning() << "NodeEditSession::save" << result.message;
        ParseDiagnostics::logParseError(documentJson, errorOffset);
        return result;
    }
    return saveDocument(document, editedText);
}

EditResult NodeEditSession::saveDocument(const JsonValue &document, const QString &editedText) const
{
    if (!node_.hasPath) {
        return missingPathResult();
    }

    ValueCoercion::Result coerced = ValueCoercion::interpret(editedText);
    const QString where = PathFormatter::format(node_.path);
    qInfo() << "NodeEditSession::save" << where << "as"
            << ValueCoercion::interpretationName(coerced.interpretation);

    if (!PathUpdater::canApply(document, node_.path)) {
        qWarning() << "Path" << where << "does not resolve in the document; it is left unchanged.";
    }

    EditResult result;
    result.document = PathUpdater::update(document, node_.path, coerced.value);
    result.json = JsonCodec::toJson(result.document, true);
    result.message = QObject::tr("Node updated successfully");
    return result;
}

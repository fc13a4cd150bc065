#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

#include "core/CommandLine.h"
#include "core/EditorConfig.h"
#include "core/JsonCodec.h"
#include "core/NodeEditSession.h"
#include "core/ParseDiagnostics.h"
#include "core/PathUpdater.h"

namespace {
QFile *g_logFile = nullptr;
bool g_debugLogging = false;

enum ExitCode { kExitOk = 0, kExitFailed = 1, kExitUsage = 2 };

QString logLevelText(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtInfoMsg:
        return QStringLiteral("INFO");
    case QtWarningMsg:
        return QStringLiteral("WARN");
    case QtCriticalMsg:
        return QStringLiteral("CRIT");
    case QtFatalMsg:
        return QStringLiteral("FATAL");
    }
    return QStringLiteral("LOG");
}

void logMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    if (type == QtDebugMsg && !g_debugLogging) {
        return;
    }

    QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    QString contextInfo;
    if (context.file && context.line > 0) {
        contextInfo = QString("%1:%2").arg(context.file).arg(context.line);
    }
    QString line = QString("%1 [%2] %3 %4\n")
                       .arg(timestamp, logLevelText(type), contextInfo, msg);

    if (g_logFile && g_logFile->isOpen()) {
        QTextStream stream(g_logFile);
        stream << line;
        stream.flush();
    } else {
        fprintf(stderr, "%s", line.toLocal8Bit().constData());
        fflush(stderr);
    }

    if (type == QtFatalMsg) {
        abort();
    }
}

void installLogging(const EditorConfig &config)
{
    g_debugLogging = config.debugLogging;
    if (!config.logFilePath.isEmpty()) {
        g_logFile = new QFile(config.logFilePath);
        if (!g_logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            fprintf(stderr, "Unable to open log file %s, logging to stderr.\n",
                    config.logFilePath.toLocal8Bit().constData());
        }
    }
    qInstallMessageHandler(logMessageHandler);
}

void printUsage(const QString &program)
{
    QTextStream out(stderr);
    out << "Usage: " << program << " <show|get|set> <file.json> [options]\n"
        << "  --path <json-array>   node path, e.g. '[\"items\", 2]'; required for set,\n"
        << "                        root for show and get when omitted\n"
        << "  --value <text>        edited text for set (default: read stdin)\n"
        << "  --output <file>       write the updated document to file\n"
        << "  --in-place            write the updated document back to <file.json>\n"
        << "  --log-file <file>     append log output to file\n"
        << "  --debug               include debug messages in the log\n";
}

bool readFile(const QString &filePath, QByteArray *bytes, QString *errorMessage)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorMessage = QString("Unable to open %1").arg(filePath);
        return false;
    }
    *bytes = file.readAll();
    qInfo() << "Loaded" << filePath << "length:" << bytes->size();
    return true;
}

bool writeFile(const QString &filePath, const QByteArray &bytes, QString *errorMessage)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        *errorMessage = QString("Unable to write %1").arg(filePath);
        return false;
    }
    file.write(bytes);
    if (!file.commit()) {
        *errorMessage = QString("Unable to write %1").arg(filePath);
        return false;
    }
    qInfo() << "Wrote" << filePath << "length:" << bytes.size();
    return true;
}

bool resolvePath(const CommandLine &cli, JsonPath *path, QString *errorMessage)
{
    if (!cli.hasPath) {
        path->clear();
        return true;
    }
    JsonValue parsed;
    QString parseError;
    if (!JsonCodec::parse(cli.pathJson.toUtf8(), &parsed, &parseError)) {
        *errorMessage = QString("Invalid --path: %1").arg(parseError);
        return false;
    }
    QString pathError;
    if (!pathFromJson(parsed, path, &pathError)) {
        *errorMessage = QString("Invalid --path: %1").arg(pathError);
        return false;
    }
    return true;
}

bool loadDocument(const QByteArray &bytes, JsonValue *document, QString *errorMessage)
{
    QString parseError;
    int errorOffset = -1;
    if (!JsonCodec::parse(bytes, document, &parseError, &errorOffset)) {
        *errorMessage = QString("Invalid JSON: %1").arg(parseError);
        ParseDiagnostics::logParseError(bytes, errorOffset);
        return false;
    }
    return true;
}

int runRead(const CommandLine &cli, const QByteArray &bytes, const JsonPath &path)
{
    QTextStream out(stdout);
    QTextStream err(stderr);
    JsonValue document;
    QString errorMessage;
    if (!loadDocument(bytes, &document, &errorMessage)) {
        err << errorMessage << "\n";
        return kExitFailed;
    }
    bool found = false;
    JsonValue node = PathUpdater::valueAt(document, path, &found);
    if (!found) {
        err << "No value at the given path in " << cli.filePath << "\n";
        return kExitFailed;
    }

    if (cli.command == "get") {
        out << JsonCodec::toJson(node, true) << "\n";
        return kExitOk;
    }
    NodeEditSession session(NodeData::fromDocument(document, path));
    out << "Content\n" << session.content() << "\n\nJSON Path\n" << session.pathText() << "\n";
    return kExitOk;
}

int runSet(const CommandLine &cli, const QByteArray &bytes, const JsonPath &path)
{
    QTextStream err(stderr);
    QString editedText = cli.value;
    if (!cli.hasValue) {
        QFile in;
        if (!in.open(stdin, QIODevice::ReadOnly)) {
            err << "Unable to read the edited value from stdin\n";
            return kExitFailed;
        }
        editedText = QString::fromUtf8(in.readAll());
    }

    NodeData node;
    node.path = path;
    node.hasPath = cli.hasPath;
    NodeEditSession session(node);
    EditResult result = session.save(bytes, editedText);
    if (!result.ok()) {
        err << result.message << "\n";
        return kExitFailed;
    }

    QByteArray output = result.json + '\n';
    QString target = cli.inPlace ? cli.filePath : cli.outputPath;
    if (target.isEmpty()) {
        QTextStream out(stdout);
        out << QString::fromUtf8(output);
    } else {
        QString errorMessage;
        if (!writeFile(target, output, &errorMessage)) {
            err << errorMessage << "\n";
            return kExitFailed;
        }
    }
    err << result.message << "\n";
    return kExitOk;
}
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QStringList args = QCoreApplication::arguments();
    const QString program = QFileInfo(args.value(0)).fileName();
    args.removeFirst();

    EditorConfig config = EditorConfig::fromEnvironment();
    QString errorMessage;
    if (!config.applyArguments(&args, &errorMessage)) {
        QTextStream(stderr) << errorMessage << "\n";
        printUsage(program);
        return kExitUsage;
    }
    installLogging(config);
    qInfo() << "jsonnodeedit starting.";

    CommandLine cli;
    if (!CommandLine::parse(args, &cli, &errorMessage)) {
        QTextStream(stderr) << errorMessage << "\n";
        printUsage(program);
        return kExitUsage;
    }

    JsonPath path;
    if (!resolvePath(cli, &path, &errorMessage)) {
        QTextStream(stderr) << errorMessage << "\n";
        return kExitUsage;
    }

    QByteArray bytes;
    if (!readFile(cli.filePath, &bytes, &errorMessage)) {
        QTextStream(stderr) << errorMessage << "\n";
        return kExitFailed;
    }

    if (cli.command == "set") {
        return runSet(cli, bytes, path);
    }
    return runRead(cli, bytes, path);
}

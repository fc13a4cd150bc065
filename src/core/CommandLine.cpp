#include "core/CommandLine.h"

#include <QObject>

namespace {
bool fail(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
    return false;
}
}

bool CommandLine::takesValue(const QString &option)
{
    return option == "--path" || option == "--value" || option == "--output";
}

bool CommandLine::parse(const QStringList &args, CommandLine *out, QString *errorMessage)
{
    CommandLine cli;
    QStringList positional;
    for (int i = 0; i < args.size(); ++i) {
        const QString arg = args.at(i);
        if (arg == "--in-place") {
            cli.inPlace = true;
        } else if (takesValue(arg)) {
            if (i + 1 >= args.size()) {
                return fail(errorMessage, QObject::tr("%1 needs an argument").arg(arg));
            }
            const QString next = args.at(++i);
            if (arg == "--path") {
                cli.pathJson = next;
                cli.hasPath = true;
            } else if (arg == "--value") {
                cli.value = next;
                cli.hasValue = true;
            } else {
                cli.outputPath = next;
            }
        } else if (arg.startsWith("--")) {
            return fail(errorMessage, QObject::tr("Unknown option %1").arg(arg));
        } else {
            positional << arg;
        }
    }

    if (positional.size() != 2) {
        return fail(errorMessage, QObject::tr("Expected a command and a file"));
    }
    cli.command = positional.at(0);
    cli.filePath = positional.at(1);
    if (cli.command != "show" && cli.command != "get" && cli.command != "set") {
        return fail(errorMessage, QObject::tr("Unknown command %1").arg(cli.command));
    }
    if (cli.command == "set" && !cli.hasPath) {
        return fail(errorMessage, QObject::tr("set needs --path; use --path '[]' to replace the whole document"));
    }
    if (cli.command != "set" && (cli.hasValue || cli.inPlace || !cli.outputPath.isEmpty())) {
        return fail(errorMessage, QObject::tr("--value, --output and --in-place only apply to set"));
    }
    if (cli.inPlace && !cli.outputPath.isEmpty()) {
        return fail(errorMessage, QObject::tr("--in-place and --output cannot be combined"));
    }

    if (out) {
        *out = cli;
    }
    return true;
}

#include "core/EditorConfig.h"

#include "core/CommandLine.h"

#include <QObject>

namespace {
const char *kEnvLogFile = "JSON_NODE_EDIT_LOG_FILE";
const char *kEnvDebug = "JSON_NODE_EDIT_DEBUG";
}

EditorConfig EditorConfig::fromEnvironment()
{
    EditorConfig config;
    config.logFilePath = qEnvironmentVariable(kEnvLogFile);
    config.debugLogging = qEnvironmentVariableIntValue(kEnvDebug) == 1;
    return config;
}

bool EditorConfig::applyArguments(QStringList *args, QString *errorMessage)
{
    if (!args) {
        return true;
    }
    QStringList remaining;
    for (int i = 0; i < args->size(); ++i) {
        const QString arg = args->at(i);
        if (arg == "--debug") {
            debugLogging = true;
        } else if (arg == "--log-file") {
            if (i + 1 >= args->size()) {
                if (errorMessage) {
                    *errorMessage = QObject::tr("--log-file needs a path");
                }
                return false;
            }
            logFilePath = args->at(++i);
        } else if (CommandLine::takesValue(arg) && i + 1 < args->size()) {
            remaining << arg << args->at(++i);
        } else {
            remaining << arg;
        }
    }
    *args = remaining;
    return true;
}

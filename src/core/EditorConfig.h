#pragma once

#include <QString>
#include <QStringList>

struct EditorConfig {
    QString logFilePath;
    bool debugLogging = false;

    static EditorConfig fromEnvironment();

    // Consumes --log-file <path> and --debug from args, leaving everything else. The
    // argument of a tool option such as --value is never taken as a flag.
    bool applyArguments(QStringList *args, QString *errorMessage = nullptr);
};

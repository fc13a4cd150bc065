#pragma once

#include <QString>
#include <QStringList>

// Parsed arguments of the jsonnodeedit tool, after EditorConfig has taken its flags.
struct CommandLine {
    QString command;
    QString filePath;
    QString pathJson;
    bool hasPath = false;
    QString value;
    bool hasValue = false;
    QString outputPath;
    bool inPlace = false;

    // Options that take the next argument as their value.
    static bool takesValue(const QString &option);

    static bool parse(const QStringList &args, CommandLine *out, QString *errorMessage = nullptr);
};

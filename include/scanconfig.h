#pragma once

#include <QString>
#include <QStringList>

struct ScanConfig {
    // Print the trimmed source line under each finding.
    bool withContext = false;
    // Treat every file as plain text instead of PHP-like source.
    bool plaintext = false;
    // Extensions checked when walking folders; empty checks every file.
    QStringList fileExtensions = {"php"};
    QString dictionaryPath;
    QString ignoreWordsFile;
    bool countEscapedNewlines = true;
    bool verbose = false;
    QStringList paths;
};

namespace ScanConfigParser {

enum class Result {
    Ok,
    Error,
    HelpRequested,
    VersionRequested
};

// arguments includes the program name first, as QCoreApplication::arguments() does.
Result parseCommandLine(const QStringList &arguments, ScanConfig *config, QString *errorMessage);
QString helpText();

} // namespace ScanConfigParser

#pragma once

#include "scanconfig.h"
#include "textspan.h"
#include "typoscanner.h"

#include <QByteArray>
#include <QSet>
#include <QString>
#include <QStringList>

class IgnoreList;
class QTextStream;
class TypoDictionary;

// Standalone checking of files and folders, printing one line per finding.
class BatchScanner {
public:
    BatchScanner(const TypoDictionary &dictionary, const ScanConfig &config, QTextStream &out);

    // Not owned; may be null.
    void setIgnoreList(const IgnoreList *ignoreList) { m_ignoreList = ignoreList; }

    // Returns the number of findings printed.
    int run(const QStringList &paths);
    int checkPath(const QString &path);
    int checkFolder(const QString &directory);
    int checkFile(const QString &path);

    // Files below directory that pass the extension filter, in checking order.
    QStringList collectFiles(const QString &directory) const;

    // Control bytes other than tab, carriage return and newline in head.
    static bool looksBinary(const QByteArray &contents);

    // Orders paths so that the contents of a folder stay together: separators
    // compare lower than any other character.
    static bool pathLessThan(const QString &a, const QString &b);
    static QString normalizePath(const QString &path);

    static QString formatFinding(const QString &path, const TypoFinding &finding);

private:
    bool acceptsExtension(const QString &suffix) const;
    void collectRecursively(const QString &directory, QStringList *files, QSet<QString> *visited) const;
    QList<TypoFinding> findTypos(const QString &path, const QByteArray &contents) const;

    const ScanConfig &m_config;
    TypoScanner m_scanner;
    QTextStream &m_out;
    const IgnoreList *m_ignoreList = nullptr;
    QSet<QString> m_checkedFiles;
};

#include "batchscanner.h"

#include "ignorelist.h"
#include "sourcetokenizer.h"
#include "suggestionfilter.h"
#include "typodictionary.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTextStream>

#include <algorithm>
#include <cstring>

namespace {

constexpr int BinaryProbeSize = 1024;

ScanOptions scanOptionsFor(const ScanConfig &config)
{
    ScanOptions options;
    options.countEscapedNewlines = config.countEscapedNewlines;
    return options;
}

QByteArray sortKey(const QString &path)
{
    static const QRegularExpression separators("[/\\\\]+");
    QString key = path;
    key.replace(separators, QString(QChar(0)));
    return key.toUtf8();
}

QString sourceLine(const QByteArray &contents, int line)
{
    const QList<QByteArray> lines = contents.split('\n');
    if (line < 1 || line > lines.size()) {
        return QString();
    }
    return QString::fromUtf8(lines.at(line - 1)).trimmed();
}

} // namespace

BatchScanner::BatchScanner(const TypoDictionary &dictionary, const ScanConfig &config, QTextStream &out)
    : m_config(config), m_scanner(dictionary, scanOptionsFor(config)), m_out(out)
{
}

int BatchScanner::run(const QStringList &paths)
{
    int total = 0;
    for (const QString &path : paths) {
        total += checkPath(path);
    }
    m_out.flush();
    return total;
}

int BatchScanner::checkPath(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        qWarning().noquote() << QString("Failed to find file/folder '%1'").arg(path);
        return 0;
    }
    qDebug() << "[BatchScanner] Checking" << path << m_config.fileExtensions;
    if (info.isDir()) {
        return checkFolder(path);
    }
    return checkFile(path);
}

int BatchScanner::checkFolder(const QString &directory)
{
    int total = 0;
    for (const QString &file : collectFiles(directory)) {
        total += checkFile(file);
    }
    return total;
}

QStringList BatchScanner::collectFiles(const QString &directory) const
{
    QStringList files;
    QSet<QString> visited;
    collectRecursively(directory, &files, &visited);

    QStringList normalized;
    QSet<QString> seen;
    for (const QString &file : files) {
        const QString path = normalizePath(file);
        if (!seen.contains(path)) {
            seen.insert(path);
            normalized.append(path);
        }
    }
    std::sort(normalized.begin(), normalized.end(), &BatchScanner::pathLessThan);
    return normalized;
}

void BatchScanner::collectRecursively(const QString &directory, QStringList *files, QSet<QString> *visited) const
{
    const QFileInfo dirInfo(directory);
    const QString canonical = dirInfo.canonicalFilePath();
    if (!canonical.isEmpty()) {
        // Symlinked folders are followed, but each folder is listed once.
        if (visited->contains(canonical)) {
            return;
        }
        visited->insert(canonical);
    }

    const QDir dir(directory);
    if (!dirInfo.isReadable() || !dir.exists()) {
        qWarning().noquote() << QString("Failed reading files in directory '%1'").arg(directory);
        return;
    }

    const QFileInfoList entries = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);
    for (const QFileInfo &entry : entries) {
        const QString path = directory.endsWith('/') ? directory + entry.fileName()
                                                     : directory + '/' + entry.fileName();
        if (entry.isDir()) {
            collectRecursively(path, files, visited);
            continue;
        }
        if (!acceptsExtension(entry.suffix())) {
            continue;
        }
        if (!entry.isFile() || !entry.isReadable()) {
            if (!m_config.fileExtensions.isEmpty()) {
                qWarning().noquote() << QString("Unable to read file %1").arg(entry.absoluteFilePath());
            }
            continue;
        }
        files->append(path);
    }
}

bool BatchScanner::acceptsExtension(const QString &suffix) const
{
    return m_config.fileExtensions.isEmpty() || m_config.fileExtensions.contains(suffix);
}

int BatchScanner::checkFile(const QString &path)
{
    if (m_checkedFiles.contains(path)) {
        return 0;
    }
    m_checkedFiles.insert(path);

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning().noquote() << QString("Failed to read contents of '%1'").arg(path);
        return 0;
    }
    const QByteArray contents = file.readAll();
    file.close();

    if (looksBinary(contents)) {
        qInfo().noquote() << QString("Skipping '%1': looks like a binary file").arg(path);
        return 0;
    }

    int printed = 0;
    for (const TypoFinding &finding : findTypos(path, contents)) {
        if (m_ignoreList && m_ignoreList->contains(finding.word)) {
            continue;
        }
        m_out << formatFinding(path, finding) << '\n';
        if (m_config.withContext) {
            m_out << "    " << sourceLine(contents, finding.line) << '\n';
        }
        ++printed;
    }
    return printed;
}

QList<TypoFinding> BatchScanner::findTypos(const QString &path, const QByteArray &contents) const
{
    if (m_config.plaintext) {
        return m_scanner.scanFile(contents, std::nullopt);
    }

    QList<TextSpan> spans;
    QString error;
    if (!SourceTokenizer::tokenize(contents, &spans, &error)) {
        qWarning().noquote() << QString("%1: %2; checking the tokens read so far").arg(path, error);
    }
    return m_scanner.scanFile(contents, spans);
}

bool BatchScanner::looksBinary(const QByteArray &contents)
{
    const int probe = qMin(static_cast<int>(contents.size()), BinaryProbeSize);
    for (int i = 0; i < probe; ++i) {
        const uchar c = static_cast<uchar>(contents.at(i));
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
            return true;
        }
    }
    return false;
}

bool BatchScanner::pathLessThan(const QString &a, const QString &b)
{
    const QByteArray keyA = sortKey(a);
    const QByteArray keyB = sortKey(b);
    const size_t common = static_cast<size_t>(qMin(keyA.size(), keyB.size()));
    const int cmp = std::memcmp(keyA.constData(), keyB.constData(), common);
    if (cmp != 0) {
        return cmp < 0;
    }
    return keyA.size() < keyB.size();
}

QString BatchScanner::normalizePath(const QString &path)
{
    static const QRegularExpression leadingDot("^(\\.[/\\\\]+)+");
    QString normalized = path;
    normalized.remove(leadingDot);
    return normalized;
}

QString BatchScanner::formatFinding(const QString &path, const TypoFinding &finding)
{
    return QString("%1:%2: Saw a possible typo %3 in %4 (%5)")
        .arg(path,
             QString::number(finding.line),
             SuggestionFilter::quoted(finding.word),
             describeSpanKind(finding.spanKind),
             SuggestionFilter::formatSuggestionText(finding.suggestions, finding.word));
}

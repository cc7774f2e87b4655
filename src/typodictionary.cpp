#include "typodictionary.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace {
const QByteArray Separator = QByteArrayLiteral("->");
}

TypoDictionary TypoDictionary::fromData(const QByteArray &contents)
{
    TypoDictionary dictionary;
    dictionary.loadFromData(contents);
    return dictionary;
}

bool TypoDictionary::loadFromFile(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QString("failed to load %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    const QByteArray contents = file.readAll();
    file.close();
    if (contents.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QString("failed to load %1: file is empty").arg(path);
        }
        return false;
    }

    loadFromData(contents);
    if (m_entries.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QString("failed to load %1: no 'typo->correction' entries").arg(path);
        }
        return false;
    }

    qDebug() << "[TypoDictionary] Loaded" << m_entries.size() << "entries from" << path;
    return true;
}

void TypoDictionary::loadFromData(const QByteArray &contents)
{
    m_entries.clear();
    const QList<QByteArray> lines = contents.split('\n');
    for (const QByteArray &rawLine : lines) {
        const QByteArray line = rawLine.trimmed();
        const int separator = line.indexOf(Separator);
        if (separator < 0) {
            continue;
        }

        const QString typo = QString::fromUtf8(line.left(separator));
        const QString corrections = QString::fromUtf8(line.mid(separator + Separator.size()));
        m_entries.insert(typo, corrections.split(','));
    }
}

const QStringList *TypoDictionary::lookup(const QString &lowercaseWord) const
{
    const auto it = m_entries.constFind(lowercaseWord);
    if (it == m_entries.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

QString TypoDictionary::defaultDictionaryPath()
{
    const QString fromEnvironment = qEnvironmentVariable("TYPOSCAN_DICTIONARY");
    if (!fromEnvironment.isEmpty()) {
        return fromEnvironment;
    }

    if (QCoreApplication::instance()) {
        const QDir appDir(QCoreApplication::applicationDirPath());
        const QString installed = appDir.filePath("../share/typoscan/dictionary.txt");
        if (QFileInfo::exists(installed)) {
            return QDir::cleanPath(installed);
        }
    }

    return QStringLiteral(TYPOSCAN_DATA_DIR "/dictionary.txt");
}

#include "ignorelist.h"

#include <QDebug>
#include <QFile>

bool IgnoreList::loadFromFile(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QString("ignore words file '%1' could not be read: %2").arg(path, file.errorString());
        }
        return false;
    }

    loadFromData(file.readAll());
    file.close();
    qDebug() << "[IgnoreList] Loaded" << m_words.size() << "words from" << path;
    return true;
}

void IgnoreList::loadFromData(const QByteArray &contents)
{
    m_words.clear();
    for (const QByteArray &rawLine : contents.split('\n')) {
        const QString line = QString::fromUtf8(rawLine).trimmed();
        if (line.isEmpty() || line.startsWith('#')) {
            continue;
        }
        m_words.insert(line.toLower());
    }
}

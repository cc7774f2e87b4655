#pragma once

#include <QByteArray>
#include <QSet>
#include <QString>

// Words that are never reported, matched case-insensitively.
class IgnoreList {
public:
    bool loadFromFile(const QString &path, QString *errorMessage = nullptr);
    void loadFromData(const QByteArray &contents);

    bool contains(const QString &word) const { return m_words.contains(word.toLower()); }
    int size() const { return m_words.size(); }
    bool isEmpty() const { return m_words.isEmpty(); }

private:
    QSet<QString> m_words;
};

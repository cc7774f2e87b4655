#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>

// Immutable mapping from a lowercase misspelling to its corrections.
//
// When an entry has two or more values the last one is a caveat explaining
// why the fix may not always apply (it may be empty).
class TypoDictionary {
public:
    TypoDictionary() = default;

    static TypoDictionary fromData(const QByteArray &contents);

    // Fails when the file cannot be read or holds nothing.
    bool loadFromFile(const QString &path, QString *errorMessage = nullptr);
    void loadFromData(const QByteArray &contents);

    // Expects an already lowercased word. Returns nullptr when absent.
    const QStringList *lookup(const QString &lowercaseWord) const;
    bool contains(const QString &lowercaseWord) const { return m_entries.contains(lowercaseWord); }

    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    static QString defaultDictionaryPath();

private:
    QHash<QString, QStringList> m_entries;
};

#pragma once

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <utility>

namespace WordExtractor {

struct WordMatch {
    QString word;
    int offset = 0;
};

// Lazily walks the candidate words of one text. Each extract call hands out
// a fresh iterator.
class WordIterator {
public:
    explicit WordIterator(QRegularExpressionMatchIterator it) : m_it(std::move(it)) {}

    bool hasNext() const { return m_it.hasNext(); }
    WordMatch next();

private:
    QRegularExpressionMatchIterator m_it;
};

// Runs of three or more letters/digits, optionally followed by a contraction
// suffix such as "n't" in "wasn't".
WordIterator extractWords(const QString &text);

// Splits camelCase, PascalCase, ACRONYMCase and snake_case identifiers,
// e.g. "parseHTMLFile" -> ("parse", "HTML", "File").
QStringList extractIdentifierParts(const QString &text);

// True for words with an underscore or an internal case transition.
bool looksLikeCompoundWord(const QString &word);

// Word pattern applied to text passed to gettext-style functions.
WordIterator extractTranslatableWords(const QString &text);

} // namespace WordExtractor

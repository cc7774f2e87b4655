#include "wordextractor.h"

namespace {

const QRegularExpression &plainWordRegex()
{
    static const QRegularExpression regex("[A-Za-z0-9]{3,}(?:'[A-Za-z]+)?");
    return regex;
}

const QRegularExpression &identifierPartRegex()
{
    static const QRegularExpression regex("[a-z]+|[A-Z](?:[a-z]+|[A-Z]+(?![a-z]))");
    return regex;
}

const QRegularExpression &compoundWordRegex()
{
    static const QRegularExpression regex("_|[a-z][A-Z]|[A-Z]{2}[a-z]");
    return regex;
}

const QRegularExpression &translatableWordRegex()
{
    static const QRegularExpression regex("\\w{3,}(?:'\\w+)?", QRegularExpression::UseUnicodePropertiesOption);
    return regex;
}

} // namespace

namespace WordExtractor {

WordMatch WordIterator::next()
{
    const QRegularExpressionMatch match = m_it.next();
    WordMatch result;
    result.word = match.captured(0);
    result.offset = static_cast<int>(match.capturedStart(0));
    return result;
}

WordIterator extractWords(const QString &text)
{
    return WordIterator(plainWordRegex().globalMatch(text));
}

QStringList extractIdentifierParts(const QString &text)
{
    QStringList parts;
    QRegularExpressionMatchIterator it = identifierPartRegex().globalMatch(text);
    while (it.hasNext()) {
        parts.append(it.next().captured(0));
    }
    return parts;
}

bool looksLikeCompoundWord(const QString &word)
{
    return compoundWordRegex().match(word).hasMatch();
}

WordIterator extractTranslatableWords(const QString &text)
{
    return WordIterator(translatableWordRegex().globalMatch(text));
}

} // namespace WordExtractor

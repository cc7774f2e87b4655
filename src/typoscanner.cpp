#include "typoscanner.h"

#include "linecounter.h"
#include "stringescape.h"
#include "suggestionfilter.h"
#include "typodictionary.h"
#include "wordextractor.h"

#include <QDebug>

TypoScanner::TypoScanner(const TypoDictionary &dictionary)
    : m_dictionary(dictionary)
{
}

TypoScanner::TypoScanner(const TypoDictionary &dictionary, const ScanOptions &options)
    : m_dictionary(dictionary), m_options(options)
{
}

QList<TypoFinding> TypoScanner::scan(const QList<TextSpan> &spans) const
{
    QList<TypoFinding> findings;
    for (const TextSpan &span : spans) {
        scanSpan(span, &findings);
    }
    return findings;
}

QList<TypoFinding> TypoScanner::scanPlainText(const QByteArray &text) const
{
    TextSpan span;
    span.kind = SpanKind::InlineText;
    span.text = text;
    span.startLine = 1;
    return scan({span});
}

QList<TypoFinding> TypoScanner::scanFile(const QByteArray &fileText,
                                         const std::optional<QList<TextSpan>> &tokens) const
{
    if (!tokens) {
        return scanPlainText(fileText);
    }
    return scan(*tokens);
}

QList<TypoFinding> TypoScanner::scanTranslatableText(const QString &text, int line) const
{
    QList<TypoFinding> findings;
    WordExtractor::WordIterator it = WordExtractor::extractTranslatableWords(text);
    while (it.hasNext()) {
        addIfTypo(it.next().word, SpanKind::StringLiteralEscaped, line, &findings);
    }
    return findings;
}

void TypoScanner::scanSpan(const TextSpan &span, QList<TypoFinding> *findings) const
{
    switch (span.kind) {
    case SpanKind::StringLiteralEscaped: {
        QByteArray decoded;
        QString error;
        if (!StringEscape::decode(span.text, StringEscape::QuoteStyle::Double, &decoded, &error)) {
            qDebug() << "[TypoScanner] Skipping string literal on line" << span.startLine << ":" << error;
            return;
        }
        scanText(span, QString::fromUtf8(decoded), findings);
        return;
    }
    case SpanKind::StringLiteralRaw: {
        QByteArray decoded;
        if (!StringEscape::decode(span.text, StringEscape::QuoteStyle::Single, &decoded)) {
            return;
        }
        scanText(span, QString::fromUtf8(decoded), findings);
        return;
    }
    case SpanKind::Identifier:
        scanIdentifier(span, QString::fromUtf8(span.text), findings);
        return;
    case SpanKind::Variable: {
        QString name = QString::fromUtf8(span.text);
        while (name.startsWith('$')) {
            name.remove(0, 1);
        }
        scanIdentifier(span, name, findings);
        return;
    }
    case SpanKind::InlineText:
    case SpanKind::Comment:
        scanText(span, QString::fromUtf8(span.text), findings);
        return;
    }
}

void TypoScanner::scanText(const TextSpan &span, const QString &text, QList<TypoFinding> *findings) const
{
    LineCounter counter = LineCounter::forSpan(span, text, m_options.countEscapedNewlines);
    WordExtractor::WordIterator it = WordExtractor::extractWords(text);
    while (it.hasNext()) {
        const WordExtractor::WordMatch match = it.next();
        const int line = span.startLine + counter.lineForOffset(match.offset);
        if (m_dictionary.contains(match.word.toLower())) {
            addIfTypo(match.word, span.kind, line, findings);
            continue;
        }

        // Code such as "parseHTMLFle" quoted inside comments and strings.
        if (!WordExtractor::looksLikeCompoundWord(match.word)) {
            continue;
        }
        const QStringList parts = WordExtractor::extractIdentifierParts(match.word);
        if (parts.size() < 2) {
            continue;
        }
        for (const QString &part : parts) {
            addIfTypo(part, span.kind, line, findings);
        }
    }
}

void TypoScanner::scanIdentifier(const TextSpan &span, const QString &name, QList<TypoFinding> *findings) const
{
    for (const QString &part : WordExtractor::extractIdentifierParts(name)) {
        addIfTypo(part, span.kind, span.startLine, findings);
    }
}

void TypoScanner::addIfTypo(const QString &word, SpanKind kind, int line, QList<TypoFinding> *findings) const
{
    const QStringList *suggestions = m_dictionary.lookup(word.toLower());
    if (!suggestions) {
        return;
    }

    const std::optional<QStringList> filtered = SuggestionFilter::filter(*suggestions, isIdentifierLike(kind));
    if (!filtered) {
        return;
    }

    TypoFinding finding;
    finding.word = word;
    finding.spanKind = kind;
    finding.line = line;
    finding.suggestions = *filtered;
    findings->append(finding);
}

#include "linecounter.h"

#include "stringescape.h"
#include "textspan.h"

LineCounter::LineCounter(const QString &countingText, bool countEscapedNewlines)
    : m_countingText(countingText),
      m_length(static_cast<int>(countingText.size())),
      m_countEscapedNewlines(countEscapedNewlines)
{
}

LineCounter LineCounter::forSpan(const TextSpan &span, const QString &text, bool countEscapedNewlines)
{
    if (!isStringLiteral(span.kind)) {
        return LineCounter(text, countEscapedNewlines);
    }

    const StringEscape::QuoteStyle style = span.kind == SpanKind::StringLiteralRaw
        ? StringEscape::QuoteStyle::Single
        : StringEscape::QuoteStyle::Double;
    const QByteArray counting = StringEscape::decodeWithNewlinePlaceholder(span.text, style);
    return LineCounter(QString::fromUtf8(counting), countEscapedNewlines);
}

int LineCounter::lineForOffset(int offset)
{
    if (offset < 0) {
        offset = 0;
    } else if (offset > m_length) {
        offset = m_length;
    }

    if (offset > m_lastOffset) {
        m_lastLine += countBreaks(m_lastOffset, offset);
        m_lastOffset = offset;
    } else if (offset < m_lastOffset) {
        m_lastLine -= countBreaks(offset, m_lastOffset);
        m_lastOffset = offset;
    }
    return m_lastLine;
}

int LineCounter::countBreaks(int from, int to) const
{
    const QChar placeholder = QLatin1Char(StringEscape::NewlinePlaceholder);
    int breaks = 0;
    for (int i = from; i < to; ++i) {
        const QChar c = m_countingText.at(i);
        if (c == QLatin1Char('\n') || (m_countEscapedNewlines && c == placeholder)) {
            ++breaks;
        }
    }
    return breaks;
}

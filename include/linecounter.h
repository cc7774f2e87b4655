#pragma once

#include <QString>

struct TextSpan;

// Maps offsets within one span's text to the number of line breaks before
// them. The cursor moves by the distance between successive queries, so
// nearby lookups never rescan the whole text. Not meant to be shared between
// spans.
class LineCounter {
public:
    explicit LineCounter(const QString &countingText, bool countEscapedNewlines = true);

    // For string literals the counting text is the placeholder decode of the
    // raw literal, which lines up with the decoded text offsets.
    static LineCounter forSpan(const TextSpan &span, const QString &text, bool countEscapedNewlines = true);

    // 0-based line of offset; out of range offsets are clamped.
    int lineForOffset(int offset);

    int length() const { return m_length; }

private:
    int countBreaks(int from, int to) const;

    QString m_countingText;
    int m_length = 0;
    int m_lastOffset = 0;
    int m_lastLine = 0;
    bool m_countEscapedNewlines = true;
};

#include "sourcetokenizer.h"

#include <QDebug>
#include <QPair>

namespace {

bool isNameStart(char c)
{
    const uchar u = static_cast<uchar>(c);
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || u == '_' || u >= 0x80;
}

bool isNameChar(char c)
{
    return isNameStart(c) || (c >= '0' && c <= '9');
}

bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

class Lexer {
public:
    explicit Lexer(const QByteArray &source) : m_src(source), m_size(static_cast<int>(source.size())) {}

    bool run(QList<TextSpan> *spans, QString *errorMessage);

private:
    char at(int pos) const { return pos < m_size ? m_src.at(pos) : '\0'; }
    bool matches(int pos, const char *text, bool caseInsensitive = false) const;
    int lineAt(int pos);
    int nameEnd(int pos) const;

    void addSpan(SpanKind kind, int from, int to);
    void fail(const QString &message);

    void lexInline();
    void lexCode();
    void lexLineComment();
    void lexBlockComment();
    void lexSingleQuoted(int start);
    void lexDoubleQuoted(int start);
    bool lexHeredoc();
    void lexInterpolated(int bodyStart, int bodyEnd, int literalStart, int literalEnd);

    const QByteArray &m_src;
    const int m_size;
    int m_pos = 0;
    bool m_inCode = false;

    // Cursor for lineAt(); queries only move forward.
    int m_linePos = 0;
    int m_line = 1;

    QList<TextSpan> m_spans;
    QString m_error;
};

bool Lexer::matches(int pos, const char *text, bool caseInsensitive) const
{
    for (int i = 0; text[i] != '\0'; ++i) {
        if (pos + i >= m_size) {
            return false;
        }
        char c = m_src.at(pos + i);
        char expected = text[i];
        if (caseInsensitive) {
            c = static_cast<char>(c >= 'A' && c <= 'Z' ? c + ('a' - 'A') : c);
            expected = static_cast<char>(expected >= 'A' && expected <= 'Z' ? expected + ('a' - 'A') : expected);
        }
        if (c != expected) {
            return false;
        }
    }
    return true;
}

int Lexer::lineAt(int pos)
{
    while (m_linePos < pos && m_linePos < m_size) {
        if (m_src.at(m_linePos) == '\n') {
            ++m_line;
        }
        ++m_linePos;
    }
    return m_line;
}

int Lexer::nameEnd(int pos) const
{
    while (pos < m_size && isNameChar(m_src.at(pos))) {
        ++pos;
    }
    return pos;
}

void Lexer::addSpan(SpanKind kind, int from, int to)
{
    if (to <= from) {
        return;
    }
    TextSpan span;
    span.kind = kind;
    span.text = m_src.mid(from, to - from);
    span.startLine = lineAt(from);
    m_spans.append(span);
}

void Lexer::fail(const QString &message)
{
    if (m_error.isEmpty()) {
        m_error = message;
    }
}

bool Lexer::run(QList<TextSpan> *spans, QString *errorMessage)
{
    while (m_pos < m_size) {
        if (m_inCode) {
            lexCode();
        } else {
            lexInline();
        }
    }

    spans->append(m_spans);
    if (!m_error.isEmpty()) {
        if (errorMessage) {
            *errorMessage = m_error;
        }
        return false;
    }
    return true;
}

void Lexer::lexInline()
{
    int tag = m_pos;
    int tagLength = 0;
    while ((tag = m_src.indexOf("<?", tag)) >= 0) {
        if (matches(tag, "<?php", true) && (tag + 5 >= m_size || isSpace(at(tag + 5)))) {
            tagLength = tag + 5 < m_size ? 6 : 5;
            break;
        }
        if (matches(tag, "<?=")) {
            tagLength = 3;
            break;
        }
        if (isSpace(at(tag + 2))) {
            tagLength = 3;
            break;
        }
        tag += 2;
    }

    if (tag < 0) {
        addSpan(SpanKind::InlineText, m_pos, m_size);
        m_pos = m_size;
        return;
    }

    addSpan(SpanKind::InlineText, m_pos, tag);
    m_pos = tag + tagLength;
    m_inCode = true;
}

void Lexer::lexCode()
{
    while (m_pos < m_size) {
        const char c = m_src.at(m_pos);
        const char next = at(m_pos + 1);

        if (c == '?' && next == '>') {
            m_pos += 2;
            if (at(m_pos) == '\n') {
                ++m_pos;
            } else if (at(m_pos) == '\r' && at(m_pos + 1) == '\n') {
                m_pos += 2;
            }
            m_inCode = false;
            return;
        }
        if (c == '#' && next == '[') {
            // Attribute; its contents are lexed as code.
            m_pos += 2;
        } else if (c == '#' || (c == '/' && next == '/')) {
            lexLineComment();
        } else if (c == '/' && next == '*') {
            lexBlockComment();
        } else if (c == '\'') {
            lexSingleQuoted(m_pos);
        } else if (c == '"') {
            lexDoubleQuoted(m_pos);
        } else if ((c == 'b' || c == 'B') && next == '\'') {
            lexSingleQuoted(m_pos);
        } else if ((c == 'b' || c == 'B') && next == '"') {
            lexDoubleQuoted(m_pos);
        } else if (c == '<' && matches(m_pos, "<<<")) {
            if (!lexHeredoc()) {
                m_pos += 3;
            }
        } else if (c == '$' && isNameStart(next)) {
            const int end = nameEnd(m_pos + 1);
            addSpan(SpanKind::Variable, m_pos, end);
            m_pos = end;
        } else if (isNameStart(c)) {
            const int end = nameEnd(m_pos);
            addSpan(SpanKind::Identifier, m_pos, end);
            m_pos = end;
        } else if (c >= '0' && c <= '9') {
            // Numbers such as 0xDEADBEEF or 1_000 are not identifiers.
            while (m_pos < m_size && (isNameChar(m_src.at(m_pos)) || m_src.at(m_pos) == '.')) {
                ++m_pos;
            }
        } else {
            ++m_pos;
        }
    }
}

void Lexer::lexLineComment()
{
    int end = m_pos;
    while (end < m_size && m_src.at(end) != '\n' && !(m_src.at(end) == '?' && at(end + 1) == '>')) {
        ++end;
    }
    addSpan(SpanKind::Comment, m_pos, end);
    m_pos = end;
}

void Lexer::lexBlockComment()
{
    const int close = m_src.indexOf("*/", m_pos + 2);
    if (close < 0) {
        fail(QString("unterminated comment starting on line %1").arg(lineAt(m_pos)));
        addSpan(SpanKind::Comment, m_pos, m_size);
        m_pos = m_size;
        return;
    }
    addSpan(SpanKind::Comment, m_pos, close + 2);
    m_pos = close + 2;
}

void Lexer::lexSingleQuoted(int start)
{
    int i = m_src.at(start) == '\'' ? start + 1 : start + 2;
    while (i < m_size && m_src.at(i) != '\'') {
        i += m_src.at(i) == '\\' ? 2 : 1;
    }
    if (i >= m_size) {
        fail(QString("unterminated string starting on line %1").arg(lineAt(start)));
        addSpan(SpanKind::StringLiteralRaw, start, m_size);
        m_pos = m_size;
        return;
    }
    addSpan(SpanKind::StringLiteralRaw, start, i + 1);
    m_pos = i + 1;
}

void Lexer::lexDoubleQuoted(int start)
{
    const int bodyStart = m_src.at(start) == '"' ? start + 1 : start + 2;
    int i = bodyStart;
    while (i < m_size && m_src.at(i) != '"') {
        i += m_src.at(i) == '\\' ? 2 : 1;
    }
    if (i >= m_size) {
        fail(QString("unterminated string starting on line %1").arg(lineAt(start)));
        lexInterpolated(bodyStart, m_size, -1, -1);
        m_pos = m_size;
        return;
    }
    lexInterpolated(bodyStart, i, start, i + 1);
    m_pos = i + 1;
}

// <<<ID, <<<"ID" (heredoc) and <<<'ID' (nowdoc). Returns false when the
// opener is malformed, leaving "<<<" to be skipped as an operator.
bool Lexer::lexHeredoc()
{
    int i = m_pos + 3;
    while (at(i) == ' ' || at(i) == '\t') {
        ++i;
    }
    char quote = '\0';
    if (at(i) == '\'' || at(i) == '"') {
        quote = at(i);
        ++i;
    }
    if (!isNameStart(at(i))) {
        return false;
    }
    const int labelEnd = nameEnd(i);
    const QByteArray label = m_src.mid(i, labelEnd - i);
    i = labelEnd;
    if (quote != '\0') {
        if (at(i) != quote) {
            return false;
        }
        ++i;
    }
    if (at(i) == '\r') {
        ++i;
    }
    if (at(i) != '\n') {
        return false;
    }
    const int bodyStart = i + 1;

    // The closing label sits alone at the start of a line, possibly indented.
    int lineStart = bodyStart;
    while (lineStart < m_size) {
        int j = lineStart;
        while (at(j) == ' ' || at(j) == '\t') {
            ++j;
        }
        if (matches(j, label.constData()) && !isNameChar(at(j + static_cast<int>(label.size())))) {
            int bodyEnd = lineStart > bodyStart ? lineStart - 1 : bodyStart;
            if (bodyEnd > bodyStart && m_src.at(bodyEnd - 1) == '\r') {
                --bodyEnd;
            }
            if (quote == '\'') {
                addSpan(SpanKind::StringLiteralEscaped, bodyStart, bodyEnd);
            } else {
                lexInterpolated(bodyStart, bodyEnd, -1, -1);
            }
            m_pos = j + static_cast<int>(label.size());
            return true;
        }
        const int newline = m_src.indexOf('\n', lineStart);
        if (newline < 0) {
            break;
        }
        lineStart = newline + 1;
    }

    fail(QString("unterminated heredoc '%1' starting on line %2")
             .arg(QString::fromUtf8(label))
             .arg(lineAt(m_pos)));
    if (quote == '\'') {
        addSpan(SpanKind::StringLiteralEscaped, bodyStart, m_size);
    } else {
        lexInterpolated(bodyStart, m_size, -1, -1);
    }
    m_pos = m_size;
    return true;
}

// Emits a literal body, splitting it around "$name" and "{$name...}"
// interpolations. A body without interpolation becomes one span, covering
// the quotes too when literalStart/literalEnd are given.
void Lexer::lexInterpolated(int bodyStart, int bodyEnd, int literalStart, int literalEnd)
{
    QList<QPair<int, int>> variables;
    QList<QPair<int, int>> fragments;
    int fragmentStart = bodyStart;
    int i = bodyStart;
    while (i < bodyEnd) {
        const char c = m_src.at(i);
        if (c == '\\') {
            i += 2;
            continue;
        }
        const bool braced = c == '{' && at(i + 1) == '$';
        const int dollar = braced ? i + 1 : i;
        if (m_src.at(dollar) != '$' || dollar + 1 >= bodyEnd || !isNameStart(m_src.at(dollar + 1))) {
            ++i;
            continue;
        }

        const int end = qMin(nameEnd(dollar + 1), bodyEnd);
        fragments.append(qMakePair(fragmentStart, i));
        variables.append(qMakePair(dollar, end));
        i = end;
        if (braced) {
            const int close = m_src.indexOf('}', end);
            i = (close < 0 || close >= bodyEnd) ? bodyEnd : close + 1;
        }
        fragmentStart = i;
    }

    if (variables.isEmpty()) {
        if (literalStart >= 0) {
            addSpan(SpanKind::StringLiteralEscaped, literalStart, literalEnd);
        } else {
            addSpan(SpanKind::StringLiteralEscaped, bodyStart, bodyEnd);
        }
        return;
    }

    for (int k = 0; k < variables.size(); ++k) {
        addSpan(SpanKind::StringLiteralEscaped, fragments.at(k).first, fragments.at(k).second);
        addSpan(SpanKind::Variable, variables.at(k).first, variables.at(k).second);
    }
    addSpan(SpanKind::StringLiteralEscaped, fragmentStart, bodyEnd);
}

} // namespace

namespace SourceTokenizer {

bool tokenize(const QByteArray &source, QList<TextSpan> *spans, QString *errorMessage)
{
    Lexer lexer(source);
    const bool ok = lexer.run(spans, errorMessage);
    qDebug() << "[SourceTokenizer] Produced" << spans->size() << "spans from" << source.size() << "bytes";
    return ok;
}

} // namespace SourceTokenizer

#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

// Lexical region a span of source text was classified as.
enum class SpanKind {
    StringLiteralEscaped, // double-quoted, heredoc and nowdoc text
    StringLiteralRaw,     // single-quoted text
    Identifier,
    Variable,             // identifier carrying a leading '$'
    InlineText,
    Comment
};

struct TextSpan {
    SpanKind kind = SpanKind::InlineText;
    QByteArray text;
    int startLine = 1;
};

struct TypoFinding {
    QString word;
    SpanKind spanKind = SpanKind::InlineText;
    int line = 1;
    QStringList suggestions;
};

bool isStringLiteral(SpanKind kind);
bool isIdentifierLike(SpanKind kind);

// Human readable description used in "Saw a possible typo ... in <description>".
QString describeSpanKind(SpanKind kind);

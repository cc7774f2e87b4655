#include "textspan.h"

bool isStringLiteral(SpanKind kind)
{
    return kind == SpanKind::StringLiteralEscaped || kind == SpanKind::StringLiteralRaw;
}

bool isIdentifierLike(SpanKind kind)
{
    return kind == SpanKind::Identifier || kind == SpanKind::Variable;
}

QString describeSpanKind(SpanKind kind)
{
    switch (kind) {
    case SpanKind::StringLiteralEscaped:
    case SpanKind::StringLiteralRaw:
        return "a string literal";
    case SpanKind::Identifier:
        return "a token";
    case SpanKind::Variable:
        return "a variable";
    case SpanKind::InlineText:
        return "inline HTML";
    case SpanKind::Comment:
        return "a comment";
    }
    return "unknown token type";
}

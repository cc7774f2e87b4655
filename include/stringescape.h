#pragma once

#include <QByteArray>
#include <QString>

// Decoding of escape sequences inside quoted string literal text.
//
// Literals are passed exactly as lexed. Surrounding quotes (and an optional
// 'b' prefix) are stripped when present; quote-less text is treated as the
// body of an interpolated string fragment or heredoc.
namespace StringEscape {

enum class QuoteStyle {
    Single, // only \' and \\ are escapes
    Double  // full escape set: \n \r \t \v \f \e \\ \$ \" \xHH \ooo \u{HHHH}
};

// Stands in for escapes that decode to a newline in decodeWithNewlinePlaceholder().
constexpr char NewlinePlaceholder = '\x1f';

QByteArray stripQuotes(const QByteArray &raw, QuoteStyle style);

// Returns false and fills errorMessage when an escape sequence is malformed
// (\x without hex digits, unterminated \u{...}, code point beyond U+10FFFF).
bool decode(const QByteArray &raw, QuoteStyle style, QByteArray *out, QString *errorMessage = nullptr);

// Same as decode(), except escapes that would produce '\n' produce
// NewlinePlaceholder instead and malformed escapes are copied verbatim.
// Newlines written literally in the source are kept.
QByteArray decodeWithNewlinePlaceholder(const QByteArray &raw, QuoteStyle style);

// UTF-8 encoding of a code point; empty for values beyond U+10FFFF.
QByteArray encodeCodePoint(uint codePoint);

} // namespace StringEscape

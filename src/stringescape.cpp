#include "stringescape.h"

namespace {

using StringEscape::QuoteStyle;

char quoteChar(QuoteStyle style)
{
    return style == QuoteStyle::Single ? '\'' : '"';
}

bool isHexDigit(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool isOctalDigit(char c)
{
    return c >= '0' && c <= '7';
}

uint hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return static_cast<uint>(c - '0');
    if (c >= 'a' && c <= 'f')
        return static_cast<uint>(10 + (c - 'a'));
    return static_cast<uint>(10 + (c - 'A'));
}

// Writes decoded output, optionally masking newlines produced by escapes.
class EscapeSink {
public:
    EscapeSink(QByteArray *out, bool placeholderMode)
        : m_out(out), m_placeholderMode(placeholderMode) {}

    void literal(char c) { m_out->append(c); }

    void escaped(char c)
    {
        if (m_placeholderMode && c == '\n') {
            m_out->append(StringEscape::NewlinePlaceholder);
        } else {
            m_out->append(c);
        }
    }

    void escaped(const QByteArray &bytes)
    {
        for (char c : bytes) {
            escaped(c);
        }
    }

private:
    QByteArray *m_out;
    bool m_placeholderMode;
};

bool decodeSingleQuoted(const QByteArray &body, EscapeSink &sink)
{
    const int n = body.size();
    for (int i = 0; i < n; ++i) {
        const char c = body.at(i);
        if (c == '\\' && i + 1 < n && (body.at(i + 1) == '\\' || body.at(i + 1) == '\'')) {
            sink.escaped(body.at(i + 1));
            ++i;
            continue;
        }
        sink.literal(c);
    }
    return true;
}

// On a malformed escape: strict mode fails, placeholder mode copies the
// backslash and carries on.
bool decodeDoubleQuoted(const QByteArray &body, EscapeSink &sink, bool strict, QString *errorMessage)
{
    const int n = body.size();
    auto fail = [&](const QString &message) {
        if (strict) {
            if (errorMessage) {
                *errorMessage = message;
            }
            return false;
        }
        sink.literal('\\');
        return true;
    };

    for (int i = 0; i < n; ++i) {
        const char c = body.at(i);
        if (c != '\\' || i + 1 >= n) {
            sink.literal(c);
            continue;
        }

        const char next = body.at(i + 1);
        switch (next) {
        case 'n': sink.escaped('\n'); ++i; continue;
        case 'r': sink.escaped('\r'); ++i; continue;
        case 't': sink.escaped('\t'); ++i; continue;
        case 'v': sink.escaped('\v'); ++i; continue;
        case 'f': sink.escaped('\f'); ++i; continue;
        case 'e': sink.escaped('\x1b'); ++i; continue;
        case '\\': sink.escaped('\\'); ++i; continue;
        case '$': sink.escaped('$'); ++i; continue;
        case '"': sink.escaped('"'); ++i; continue;
        default:
            break;
        }

        if (next == 'x') {
            int digits = 0;
            uint value = 0;
            while (digits < 2 && i + 2 + digits < n && isHexDigit(body.at(i + 2 + digits))) {
                value = value * 16 + hexValue(body.at(i + 2 + digits));
                ++digits;
            }
            if (digits == 0) {
                if (!fail(QString("invalid hex escape at offset %1").arg(i)))
                    return false;
                continue;
            }
            sink.escaped(static_cast<char>(value));
            i += 1 + digits;
            continue;
        }

        if (isOctalDigit(next)) {
            int digits = 0;
            uint value = 0;
            while (digits < 3 && i + 1 + digits < n && isOctalDigit(body.at(i + 1 + digits))) {
                value = value * 8 + static_cast<uint>(body.at(i + 1 + digits) - '0');
                ++digits;
            }
            sink.escaped(static_cast<char>(value & 0xff));
            i += digits;
            continue;
        }

        if (next == 'u' && i + 2 < n && body.at(i + 2) == '{') {
            const int close = body.indexOf('}', i + 3);
            const QByteArray hex = close < 0 ? QByteArray() : body.mid(i + 3, close - i - 3);
            bool valid = !hex.isEmpty() && hex.size() <= 8;
            uint codePoint = 0;
            for (char h : hex) {
                if (!isHexDigit(h)) {
                    valid = false;
                    break;
                }
                codePoint = codePoint * 16 + hexValue(h);
            }
            const QByteArray encoded = valid ? StringEscape::encodeCodePoint(codePoint) : QByteArray();
            if (encoded.isEmpty()) {
                if (!fail(QString("invalid unicode escape at offset %1").arg(i)))
                    return false;
                continue;
            }
            sink.escaped(encoded);
            i = close;
            continue;
        }

        // Unknown escapes keep their backslash.
        sink.literal(c);
    }
    return true;
}

bool decodeBody(const QByteArray &raw, QuoteStyle style, QByteArray *out, bool strict, QString *errorMessage)
{
    const QByteArray body = StringEscape::stripQuotes(raw, style);
    out->clear();
    out->reserve(body.size());
    EscapeSink sink(out, !strict);
    if (style == QuoteStyle::Single) {
        return decodeSingleQuoted(body, sink);
    }
    return decodeDoubleQuoted(body, sink, strict, errorMessage);
}

} // namespace

namespace StringEscape {

QByteArray stripQuotes(const QByteArray &raw, QuoteStyle style)
{
    const char quote = quoteChar(style);
    QByteArray text = raw;
    if (text.size() >= 3 && (text.at(0) == 'b' || text.at(0) == 'B') && text.at(1) == quote) {
        text.remove(0, 1);
    }
    if (text.size() >= 2 && text.front() == quote && text.back() == quote) {
        return text.mid(1, text.size() - 2);
    }
    return text;
}

bool decode(const QByteArray &raw, QuoteStyle style, QByteArray *out, QString *errorMessage)
{
    QByteArray decoded;
    if (!decodeBody(raw, style, &decoded, true, errorMessage)) {
        return false;
    }
    if (out) {
        *out = decoded;
    }
    return true;
}

QByteArray decodeWithNewlinePlaceholder(const QByteArray &raw, QuoteStyle style)
{
    QByteArray decoded;
    decodeBody(raw, style, &decoded, false, nullptr);
    return decoded;
}

QByteArray encodeCodePoint(uint codePoint)
{
    QByteArray bytes;
    if (codePoint < 0x80) {
        bytes.append(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        bytes.append(static_cast<char>(0xc0 | (codePoint >> 6)));
        bytes.append(static_cast<char>(0x80 | (codePoint & 0x3f)));
    } else if (codePoint < 0x10000) {
        bytes.append(static_cast<char>(0xe0 | (codePoint >> 12)));
        bytes.append(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3f)));
        bytes.append(static_cast<char>(0x80 | (codePoint & 0x3f)));
    } else if (codePoint <= 0x10ffff) {
        bytes.append(static_cast<char>(0xf0 | (codePoint >> 18)));
        bytes.append(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3f)));
        bytes.append(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3f)));
        bytes.append(static_cast<char>(0x80 | (codePoint & 0x3f)));
    }
    return bytes;
}

} // namespace StringEscape

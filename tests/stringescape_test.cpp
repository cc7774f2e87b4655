#include <QObject>
#include <QTest>

#include "stringescape.h"

using StringEscape::QuoteStyle;

class StringEscapeTests : public QObject {
    Q_OBJECT

private:
    QByteArray decoded(const QByteArray &raw, QuoteStyle style)
    {
        QByteArray out;
        QString error;
        const bool ok = StringEscape::decode(raw, style, &out, &error);
        if (!ok) {
            qWarning() << "unexpected decode failure:" << error;
        }
        return out;
    }

private slots:
    void decodesCommonEscapes()
    {
        QCOMPARE(decoded("\"a\\nb\\tc\\rd\"", QuoteStyle::Double), QByteArray("a\nb\tc\rd"));
        QCOMPARE(decoded("\"\\v\\f\\e\"", QuoteStyle::Double), QByteArray("\v\f\x1b"));
        QCOMPARE(decoded("\"\\$name \\\"q\\\" \\\\\"", QuoteStyle::Double), QByteArray("$name \"q\" \\"));
    }

    void decodesNumericEscapes()
    {
        QCOMPARE(decoded("\"\\x41\\x4a\\101\\7\"", QuoteStyle::Double), QByteArray("AJA\x07"));
        QCOMPARE(decoded("\"\\u{e9}\\u{1F600}\"", QuoteStyle::Double), QByteArray("\xc3\xa9\xf0\x9f\x98\x80"));
        // Octal values wrap to one byte.
        QCOMPARE(decoded("\"\\777\"", QuoteStyle::Double), QByteArray("\xff"));
    }

    void keepsUnknownEscapes()
    {
        QCOMPARE(decoded("\"\\q \\u00e9\"", QuoteStyle::Double), QByteArray("\\q \\u00e9"));
        QCOMPARE(decoded("\"trailing\\\"", QuoteStyle::Double), QByteArray("trailing\\"));
    }

    void stripsQuotesAndBinaryPrefix()
    {
        QCOMPARE(decoded("b\"abc\"", QuoteStyle::Double), QByteArray("abc"));
        QCOMPARE(decoded("B'abc'", QuoteStyle::Single), QByteArray("abc"));
        // Interpolated fragments arrive without quotes.
        QCOMPARE(decoded("Hello\\n", QuoteStyle::Double), QByteArray("Hello\n"));
        QCOMPARE(StringEscape::stripQuotes("\"", QuoteStyle::Double), QByteArray("\""));
    }

    void singleQuotedOnlyEscapesQuoteAndBackslash()
    {
        QCOMPARE(decoded("'it\\'s'", QuoteStyle::Single), QByteArray("it's"));
        QCOMPARE(decoded("'a\\\\b'", QuoteStyle::Single), QByteArray("a\\b"));
        QCOMPARE(decoded("'a\\nb'", QuoteStyle::Single), QByteArray("a\\nb"));
    }

    void rejectsMalformedEscapes()
    {
        QByteArray out;
        QString error;
        QVERIFY(!StringEscape::decode("\"\\xZZ\"", QuoteStyle::Double, &out, &error));
        QVERIFY(!error.isEmpty());

        error.clear();
        QVERIFY(!StringEscape::decode("\"\\u{12\"", QuoteStyle::Double, &out, &error));
        QVERIFY(!error.isEmpty());

        QVERIFY(!StringEscape::decode("\"\\u{}\"", QuoteStyle::Double, &out));
        QVERIFY(!StringEscape::decode("\"\\u{110000}\"", QuoteStyle::Double, &out));
    }

    void placeholderReplacesEscapedNewlinesOnly()
    {
        const QByteArray raw("\"a\\nb\\x0ac\\012d\\u{a}e\nf\"");
        const QByteArray counting = StringEscape::decodeWithNewlinePlaceholder(raw, QuoteStyle::Double);
        QCOMPARE(counting, QByteArray("a\x1f" "b\x1f" "c\x1f" "d\x1f" "e\nf"));

        QByteArray out;
        QVERIFY(StringEscape::decode(raw, QuoteStyle::Double, &out));
        QCOMPARE(counting.size(), out.size());
    }

    void placeholderDecodeNeverFails()
    {
        const QByteArray counting = StringEscape::decodeWithNewlinePlaceholder("\"\\xZZ\\n\"", QuoteStyle::Double);
        QCOMPARE(counting, QByteArray("\\xZZ\x1f"));
    }

    void encodesCodePoints()
    {
        QCOMPARE(StringEscape::encodeCodePoint(0x41), QByteArray("A"));
        QCOMPARE(StringEscape::encodeCodePoint(0x20ac), QByteArray("\xe2\x82\xac"));
        QVERIFY(StringEscape::encodeCodePoint(0x110000).isEmpty());
    }
};

QTEST_MAIN(StringEscapeTests)
#include "stringescape_test.moc"

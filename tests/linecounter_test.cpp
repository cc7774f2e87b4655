#include <QObject>
#include <QTest>

#include "linecounter.h"
#include "textspan.h"

class LineCounterTests : public QObject {
    Q_OBJECT

private slots:
    void countsForwardAndBackward()
    {
        LineCounter counter("a\nb\nc\nd");
        QCOMPARE(counter.lineForOffset(0), 0);
        QCOMPARE(counter.lineForOffset(2), 1);
        QCOMPARE(counter.lineForOffset(6), 3);
        QCOMPARE(counter.lineForOffset(2), 1);
        QCOMPARE(counter.lineForOffset(0), 0);
    }

    void clampsOffsets()
    {
        LineCounter counter("a\nb\nc\nd");
        QCOMPARE(counter.lineForOffset(-5), 0);
        QCOMPARE(counter.lineForOffset(100), 3);
        QCOMPARE(counter.length(), 7);
    }

    void arbitraryOrderMatchesFreshCounter()
    {
        const QString text("one\ntwo\n\nthree\nfour\n");
        LineCounter reused(text);
        const QList<int> offsets = {12, 3, 19, 0, 8, 9, 4, 20, 15};
        for (int offset : offsets) {
            LineCounter fresh(text);
            QCOMPARE(reused.lineForOffset(offset), fresh.lineForOffset(offset));
        }
    }

    void escapedNewlinesCountInStringLiterals()
    {
        TextSpan span;
        span.kind = SpanKind::StringLiteralEscaped;
        span.text = "\"line1\\nlinetwo\"";
        const QString decoded("line1\nlinetwo");

        LineCounter counter = LineCounter::forSpan(span, decoded);
        QCOMPARE(counter.lineForOffset(decoded.indexOf("linetwo")), 1);

        LineCounter physical = LineCounter::forSpan(span, decoded, false);
        QCOMPARE(physical.lineForOffset(decoded.indexOf("linetwo")), 0);
    }

    void sourceNewlinesAlwaysCount()
    {
        TextSpan span;
        span.kind = SpanKind::StringLiteralEscaped;
        span.text = "\"first\n\\tsecond\"";
        const QString decoded("first\n\tsecond");

        LineCounter physical = LineCounter::forSpan(span, decoded, false);
        QCOMPARE(physical.lineForOffset(decoded.indexOf("second")), 1);
    }

    void rawLiteralsHaveNoNewlineEscapes()
    {
        TextSpan span;
        span.kind = SpanKind::StringLiteralRaw;
        span.text = "'x\\ny'";
        const QString decoded("x\\ny");

        LineCounter counter = LineCounter::forSpan(span, decoded);
        QCOMPARE(counter.lineForOffset(decoded.size()), 0);
    }

    void commentsCountTheirOwnText()
    {
        TextSpan span;
        span.kind = SpanKind::Comment;
        span.text = "/* a\n\\n b */";
        const QString text = QString::fromUtf8(span.text);

        LineCounter counter = LineCounter::forSpan(span, text);
        QCOMPARE(counter.lineForOffset(text.indexOf('b')), 1);
    }
};

QTEST_MAIN(LineCounterTests)
#include "linecounter_test.moc"

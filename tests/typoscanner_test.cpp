#include <QObject>
#include <QTest>

#include "sourcetokenizer.h"
#include "suggestionfilter.h"
#include "typodictionary.h"
#include "typoscanner.h"

namespace {

TextSpan makeSpan(SpanKind kind, const QByteArray &text, int line)
{
    TextSpan span;
    span.kind = kind;
    span.text = text;
    span.startLine = line;
    return span;
}

QStringList wordsOf(const QList<TypoFinding> &findings)
{
    QStringList words;
    for (const TypoFinding &finding : findings) {
        words.append(finding.word);
    }
    return words;
}

} // namespace

class TypoScannerTests : public QObject {
    Q_OBJECT

private:
    TypoDictionary m_dictionary = TypoDictionary::fromData(
        "barr->bar\n"
        "typoo->typo\n"
        "teh->the\n"
        "wasnt->wasn't,contraction reason text\n"
        "recieve->receive\n");

private slots:
    void reportsLineWithinComment()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scan({makeSpan(SpanKind::Comment, "foo\nbarr\n", 10)});

        QCOMPARE(findings.size(), 1);
        QCOMPARE(findings.at(0).word, QString("barr"));
        QCOMPARE(findings.at(0).line, 11);
        QCOMPARE(findings.at(0).spanKind, SpanKind::Comment);
        QCOMPARE(findings.at(0).suggestions, QStringList({"bar"}));
    }

    void escapedNewlineAdvancesLine()
    {
        const TextSpan span = makeSpan(SpanKind::StringLiteralEscaped, "\"line1\\nlinetwo-typoo\"", 5);

        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scan({span});
        QCOMPARE(findings.size(), 1);
        QCOMPARE(findings.at(0).word, QString("typoo"));
        QCOMPARE(findings.at(0).line, 6);

        ScanOptions physical;
        physical.countEscapedNewlines = false;
        TypoScanner physicalScanner(m_dictionary, physical);
        const QList<TypoFinding> physicalFindings = physicalScanner.scan({span});
        QCOMPARE(physicalFindings.size(), 1);
        QCOMPARE(physicalFindings.at(0).line, 5);
    }

    void invalidEscapeSkipsOnlyThatSpan()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scan({
            makeSpan(SpanKind::StringLiteralEscaped, "\"teh \\u{zz}\"", 1),
            makeSpan(SpanKind::Comment, "// teh", 2),
        });

        QCOMPARE(findings.size(), 1);
        QCOMPARE(findings.at(0).line, 2);
    }

    void decodesRawLiterals()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scan({makeSpan(SpanKind::StringLiteralRaw, "'it\\'s teh'", 4)});
        QCOMPARE(wordsOf(findings), QStringList({"teh"}));
        QCOMPARE(findings.at(0).line, 4);
    }

    void decomposesIdentifiers()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scan({makeSpan(SpanKind::Identifier, "getHTMLTeh", 3)});

        QCOMPARE(findings.size(), 1);
        QCOMPARE(findings.at(0).word, QString("Teh"));
        QCOMPARE(findings.at(0).line, 3);
        QCOMPARE(findings.at(0).suggestions, QStringList({"the"}));
        QCOMPARE(SuggestionFilter::formatSuggestionText(findings.at(0).suggestions, findings.at(0).word),
                 QString("Did you mean \"The\"?"));
    }

    void variablesDropTheirSigil()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scan({makeSpan(SpanKind::Variable, "$tehValue", 8)});
        QCOMPARE(wordsOf(findings), QStringList({"teh"}));
        QCOMPARE(findings.at(0).spanKind, SpanKind::Variable);
    }

    void suppressesUnfixableIdentifierTypos()
    {
        TypoScanner scanner(m_dictionary);
        QVERIFY(scanner.scan({makeSpan(SpanKind::Identifier, "isWasnt", 1)}).isEmpty());

        const QList<TypoFinding> inComment = scanner.scan({makeSpan(SpanKind::Comment, "# it wasnt", 1)});
        QCOMPARE(inComment.size(), 1);
        QCOMPARE(inComment.at(0).suggestions, QStringList({"wasn't", "contraction reason text"}));
    }

    void plainTextMode()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scanPlainText("Recieve the form");

        QCOMPARE(findings.size(), 1);
        QCOMPARE(findings.at(0).word, QString("Recieve"));
        QCOMPARE(findings.at(0).line, 1);
        QCOMPARE(findings.at(0).spanKind, SpanKind::InlineText);
        QVERIFY(SuggestionFilter::formatSuggestionText(findings.at(0).suggestions, findings.at(0).word)
                    .contains("Receive"));
    }

    void scanFileWithoutTokensIsPlainText()
    {
        TypoScanner scanner(m_dictionary);
        const QByteArray source("<?php\n$tehValue = 'ok';\n");

        const QList<TypoFinding> plain = scanner.scanFile(source, std::nullopt);
        QCOMPARE(plain.size(), 1);
        QCOMPARE(plain.at(0).spanKind, SpanKind::InlineText);
        QCOMPARE(plain.at(0).line, 2);

        QList<TextSpan> spans;
        QVERIFY(SourceTokenizer::tokenize(source, &spans));
        const QList<TypoFinding> tokenized = scanner.scanFile(source, spans);
        QCOMPARE(tokenized.size(), 1);
        QCOMPARE(tokenized.at(0).spanKind, SpanKind::Variable);
    }

    void caseVariantsShareSuggestions()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scan({makeSpan(SpanKind::Comment, "TEH Teh teh tEh", 1)});

        QCOMPARE(wordsOf(findings), QStringList({"TEH", "Teh", "teh", "tEh"}));
        for (const TypoFinding &finding : findings) {
            QCOMPARE(finding.suggestions, QStringList({"the"}));
        }
    }

    void findingsFollowSpanAndOffsetOrder()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TextSpan> spans = {
            makeSpan(SpanKind::Comment, "teh barr", 1),
            makeSpan(SpanKind::Identifier, "barrTeh", 2),
            makeSpan(SpanKind::InlineText, "recieve\nteh", 3),
        };

        const QList<TypoFinding> first = scanner.scan(spans);
        QCOMPARE(wordsOf(first), QStringList({"teh", "barr", "barr", "Teh", "recieve", "teh"}));
        QCOMPARE(first.last().line, 4);

        const QList<TypoFinding> second = scanner.scan(spans);
        QCOMPARE(second.size(), first.size());
        for (int i = 0; i < first.size(); ++i) {
            QCOMPARE(second.at(i).word, first.at(i).word);
            QCOMPARE(second.at(i).line, first.at(i).line);
            QCOMPARE(second.at(i).suggestions, first.at(i).suggestions);
        }
    }

    void decomposesCodeQuotedInText()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scan({makeSpan(SpanKind::Comment, "// see\n// getTehValue() here", 1)});

        QCOMPARE(wordsOf(findings), QStringList({"Teh"}));
        QCOMPARE(findings.at(0).line, 2);

        // Ordinary capitalized words are not split.
        QVERIFY(scanner.scan({makeSpan(SpanKind::Comment, "Tehran", 1)}).isEmpty());
    }

    void checksTranslatableText()
    {
        TypoScanner scanner(m_dictionary);
        const QList<TypoFinding> findings = scanner.scanTranslatableText("Could not recieve it", 7);
        QCOMPARE(wordsOf(findings), QStringList({"recieve"}));
        QCOMPARE(findings.at(0).line, 7);
    }
};

QTEST_MAIN(TypoScannerTests)
#include "typoscanner_test.moc"

#pragma once

#include "textspan.h"

#include <QByteArray>
#include <QList>
#include <QString>

#include <optional>

class TypoDictionary;

struct ScanOptions {
    // Count newlines produced by escapes such as "\n" inside string literals
    // as line breaks when resolving line numbers.
    bool countEscapedNewlines = true;
};

// Finds dictionary typos in the spans of one file.
//
// Findings come out in span order, and left to right within a span. The
// scanner holds a reference to the dictionary, which must outlive it.
class TypoScanner {
public:
    explicit TypoScanner(const TypoDictionary &dictionary);
    TypoScanner(const TypoDictionary &dictionary, const ScanOptions &options);

    QList<TypoFinding> scan(const QList<TextSpan> &spans) const;

    // The whole text as one inline text span starting on line 1.
    QList<TypoFinding> scanPlainText(const QByteArray &text) const;

    // Entry point for hosts: without tokens the file is scanned as plain text.
    QList<TypoFinding> scanFile(const QByteArray &fileText,
                                const std::optional<QList<TextSpan>> &tokens) const;

    // Text handed to gettext-style functions, reported on the given line.
    QList<TypoFinding> scanTranslatableText(const QString &text, int line) const;

private:
    void scanSpan(const TextSpan &span, QList<TypoFinding> *findings) const;
    void scanText(const TextSpan &span, const QString &text, QList<TypoFinding> *findings) const;
    void scanIdentifier(const TextSpan &span, const QString &name, QList<TypoFinding> *findings) const;
    void addIfTypo(const QString &word, SpanKind kind, int line, QList<TypoFinding> *findings) const;

    const TypoDictionary &m_dictionary;
    ScanOptions m_options;
};

#pragma once

#include "textspan.h"

#include <QByteArray>
#include <QList>
#include <QString>

// Splits PHP-like source into the spans the typo scanner looks at: inline
// text outside of <?php ... ?>, comments, string literals, variables and
// identifiers. Operators, numbers, whitespace and casts produce no spans.
namespace SourceTokenizer {

// Returns false for unterminated comments, strings or heredocs. The spans
// lexed so far, including one covering the unterminated construct, are still
// appended to spans.
bool tokenize(const QByteArray &source, QList<TextSpan> *spans, QString *errorMessage = nullptr);

} // namespace SourceTokenizer

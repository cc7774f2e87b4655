#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace SuggestionFilter {

// True when the suggestion could replace a bare identifier.
bool isValidIdentifierWord(const QString &suggestion);

// Outside identifier context the list is returned as is. Inside it,
// corrections that could not be spelled as an identifier are dropped; the
// trailing caveat of a multi-entry list is kept. Returns nullopt when that
// leaves no correction.
std::optional<QStringList> filter(const QStringList &suggestions, bool identifierContext);

// "Did you mean \"receive\"?" with corrections re-cased to match originalWord
// and the caveat, if any, appended.
QString formatSuggestionText(const QStringList &suggestions, const QString &originalWord);

// JSON string literal for text, as used in messages.
QString quoted(const QString &text);

} // namespace SuggestionFilter

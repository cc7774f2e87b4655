#include "suggestionfilter.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace {

QString capitalizeFirst(const QString &word)
{
    if (word.isEmpty()) {
        return word;
    }
    return word.left(1).toUpper() + word.mid(1);
}

} // namespace

namespace SuggestionFilter {

bool isValidIdentifierWord(const QString &suggestion)
{
    for (const QChar c : suggestion) {
        const ushort u = c.unicode();
        const bool valid = (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9')
            || u == '_' || u >= 0x7f;
        if (!valid) {
            return false;
        }
    }
    return true;
}

std::optional<QStringList> filter(const QStringList &suggestions, bool identifierContext)
{
    if (!identifierContext) {
        return suggestions;
    }

    const int count = static_cast<int>(suggestions.size());
    QStringList kept;
    bool droppedAny = false;
    for (int i = 0; i < count; ++i) {
        const bool isCaveat = count >= 2 && i == count - 1;
        if (!isCaveat && !isValidIdentifierWord(suggestions.at(i))) {
            droppedAny = true;
            continue;
        }
        kept.append(suggestions.at(i));
    }

    if (droppedAny && kept.size() <= 1) {
        // Only the caveat, or nothing at all, is left.
        return std::nullopt;
    }
    return kept;
}

QString formatSuggestionText(const QStringList &suggestions, const QString &originalWord)
{
    QStringList corrections;
    for (const QString &suggestion : suggestions) {
        corrections.append(suggestion.trimmed());
    }

    QString caveat;
    if (corrections.size() > 1) {
        caveat = corrections.takeLast();
    }

    int firstLower = -1;
    for (int i = 0; i < originalWord.size(); ++i) {
        const QChar c = originalWord.at(i);
        if (c >= QLatin1Char('a') && c <= QLatin1Char('z')) {
            firstLower = i;
            break;
        }
    }

    QStringList quotedCorrections;
    for (const QString &correction : corrections) {
        QString recased = correction;
        if (firstLower < 0) {
            recased = correction.toUpper();
        } else if (firstLower > 0) {
            recased = capitalizeFirst(correction);
        }
        quotedCorrections.append(quoted(recased));
    }

    QString text = QString("Did you mean %1?").arg(quotedCorrections.join(" or "));
    if (!caveat.isEmpty()) {
        text += QString(" : not always fixable: %1").arg(caveat);
    }
    return text;
}

QString quoted(const QString &text)
{
    const QByteArray json = QJsonDocument(QJsonArray{text}).toJson(QJsonDocument::Compact);
    // Strip the surrounding "[" and "]".
    return QString::fromUtf8(json.mid(1, json.size() - 2));
}

} // namespace SuggestionFilter

#ifndef TODOD_UTILS_IDUTILS_HPP
#define TODOD_UTILS_IDUTILS_HPP

#include <QString>
#include <QUuid>
#include <optional>

// Canonical form only: 8-4-4-4-12 hex digits, no braces, 36 chars.
inline bool isCanonicalUuid(const QString &string) {
    if (string.size() != 36) {
        return false;
    }

    for (int i = 0; i < string.size(); ++i) {
        const QChar c = string.at(i);
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != QLatin1Char('-')) {
                return false;
            }
            continue;
        }

        const bool hex = (c >= QLatin1Char('0') && c <= QLatin1Char('9')) ||
                         (c >= QLatin1Char('a') && c <= QLatin1Char('f')) ||
                         (c >= QLatin1Char('A') && c <= QLatin1Char('F'));
        if (!hex) {
            return false;
        }
    }

    return true;
}

inline std::optional<QUuid> parseTodoId(const QString &string) {
    if (!isCanonicalUuid(string)) {
        return std::nullopt;
    }
    // The nil uuid is well-formed; it just never matches a stored item.
    return QUuid::fromString(string);
}

#endif // TODOD_UTILS_IDUTILS_HPP

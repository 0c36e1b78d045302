#include "passwordcharsets.h"

#include <QSet>

namespace PasswordCharsets {

QLatin1String classChars(CharClass cls)
{
    switch (cls) {
    case CharClass::Lower:
        return kLowercase;
    case CharClass::Upper:
        return kUppercase;
    case CharClass::Digit:
        return kDigits;
    case CharClass::Symbol:
        return kSymbols;
    }
    return QLatin1String();
}

int classAlphabetSize(CharClass cls)
{
    return static_cast<int>(classChars(cls).size());
}

bool belongsTo(QChar ch, CharClass cls)
{
    // ASCII only: QChar::isLower() and friends would accept non-Latin letters.
    return classChars(cls).contains(ch);
}

bool isAmbiguous(QChar ch)
{
    return kAmbiguous.contains(ch);
}

QString withoutAmbiguous(const QString &chars)
{
    QString out;
    out.reserve(chars.size());
    for (const auto &ch : chars) {
        if (!isAmbiguous(ch))
            out.append(ch);
    }
    return out;
}

int distinctCount(const QString &chars)
{
    QSet<QChar> uniq;
    for (const auto &ch : chars)
        uniq.insert(ch);
    return static_cast<int>(uniq.size());
}

} // namespace PasswordCharsets

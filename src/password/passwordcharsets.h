#pragma once

#include <QChar>
#include <QLatin1String>
#include <QString>

namespace PasswordCharsets {

enum class CharClass : int
{
    Lower = 0,
    Upper = 1,
    Digit = 2,
    Symbol = 3,
};

constexpr int kClassCount = 4;

inline const QLatin1String kLowercase("abcdefghijklmnopqrstuvwxyz");
inline const QLatin1String kUppercase("ABCDEFGHIJKLMNOPQRSTUVWXYZ");
inline const QLatin1String kDigits("0123456789");
inline const QLatin1String kSymbols("!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~");
inline const QLatin1String kAmbiguous("0O1lI");

QLatin1String classChars(CharClass cls);
int classAlphabetSize(CharClass cls);
bool belongsTo(QChar ch, CharClass cls);

bool isAmbiguous(QChar ch);
QString withoutAmbiguous(const QString &chars);
int distinctCount(const QString &chars);

} // namespace PasswordCharsets

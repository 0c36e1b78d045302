#include "passwordstrength.h"

#include "passwordcharsets.h"

#include <cmath>

namespace {

using PasswordCharsets::CharClass;

int impliedAlphabetSize(const QString &password)
{
    bool present[PasswordCharsets::kClassCount] = {false, false, false, false};
    for (const auto &ch : password) {
        for (int c = 0; c < PasswordCharsets::kClassCount; ++c) {
            if (!present[c] && PasswordCharsets::belongsTo(ch, static_cast<CharClass>(c)))
                present[c] = true;
        }
    }

    int size = 0;
    for (int c = 0; c < PasswordCharsets::kClassCount; ++c) {
        if (present[c])
            size += PasswordCharsets::classAlphabetSize(static_cast<CharClass>(c));
    }
    return size;
}

} // namespace

double calculatePasswordEntropy(const QString &password)
{
    if (password.isEmpty())
        return 0.0;

    // no recognised glyph at all, log2(0) would be -inf
    const int alphabet = impliedAlphabetSize(password);
    if (alphabet <= 0)
        return 0.0;

    return std::log2(static_cast<double>(alphabet)) * static_cast<double>(password.size());
}

PasswordStrengthLevel strengthLevelForEntropy(double entropyBits)
{
    if (entropyBits < 30.0)
        return PasswordStrengthLevel::VeryWeak;
    if (entropyBits < 50.0)
        return PasswordStrengthLevel::Weak;
    if (entropyBits < 70.0)
        return PasswordStrengthLevel::Fair;
    if (entropyBits < 90.0)
        return PasswordStrengthLevel::Strong;
    return PasswordStrengthLevel::VeryStrong;
}

QString strengthLabel(PasswordStrengthLevel level)
{
    switch (level) {
    case PasswordStrengthLevel::VeryWeak:
        return "Very Weak";
    case PasswordStrengthLevel::Weak:
        return "Weak";
    case PasswordStrengthLevel::Fair:
        return "Fair";
    case PasswordStrengthLevel::Strong:
        return "Strong";
    case PasswordStrengthLevel::VeryStrong:
        return "Very Strong";
    }
    return "Very Weak";
}

QString assessPasswordStrength(const QString &password)
{
    return strengthLabel(strengthLevelForEntropy(calculatePasswordEntropy(password)));
}

PasswordStrength evaluatePasswordStrength(const QString &password)
{
    PasswordStrength out;
    out.entropyBits = calculatePasswordEntropy(password);
    out.level = strengthLevelForEntropy(out.entropyBits);
    out.label = strengthLabel(out.level);
    return out;
}

#pragma once

#include <QString>

enum class PasswordStrengthLevel : int
{
    VeryWeak = 0,
    Weak = 1,
    Fair = 2,
    Strong = 3,
    VeryStrong = 4,
};

struct PasswordStrength final
{
    double entropyBits = 0.0;
    PasswordStrengthLevel level = PasswordStrengthLevel::VeryWeak;
    QString label;
};

// log2 of the alphabet implied by the character classes present, times the
// length. It looks only at the string, not at how it was generated.
double calculatePasswordEntropy(const QString &password);

PasswordStrengthLevel strengthLevelForEntropy(double entropyBits);
QString strengthLabel(PasswordStrengthLevel level);
QString assessPasswordStrength(const QString &password);

PasswordStrength evaluatePasswordStrength(const QString &password);

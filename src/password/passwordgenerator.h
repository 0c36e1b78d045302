#pragma once

#include <QString>

struct PasswordGeneratorOptions final
{
    int length = 16;
    bool useUpper = true;
    bool useLower = true;
    bool useDigits = true;
    bool useSymbols = true;
    bool excludeAmbiguous = false;
    bool excludeConsecutiveRepeats = true;
};

enum class PasswordGenerationError : int
{
    None = 0,
    NoCharacterClass = 1,
    LengthTooShort = 2,
    DegenerateRepeatExclusion = 3,
};

struct PasswordGenerationResult final
{
    QString password;
    PasswordGenerationError error = PasswordGenerationError::None;
    QString errorMessage;

    bool ok() const { return error == PasswordGenerationError::None; }
};

// One character of every selected class is seeded from the full class string,
// so with excludeAmbiguous those seeds may still be ambiguous glyphs. Only the
// filled positions are drawn from the filtered pool.
PasswordGenerationResult generatePassword(const PasswordGeneratorOptions &options);

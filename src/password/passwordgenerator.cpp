#include "passwordgenerator.h"

#include "passwordcharsets.h"

#include <QRandomGenerator>
#include <QVector>
#include <QtDebug>

#include <utility>

namespace {

using PasswordCharsets::CharClass;

constexpr int kMaxDrawAttempts = 64;
constexpr int kMaxReshuffles = 1000;

QVector<CharClass> selectedClasses(const PasswordGeneratorOptions &options)
{
    QVector<CharClass> classes;
    if (options.useLower)
        classes.push_back(CharClass::Lower);
    if (options.useUpper)
        classes.push_back(CharClass::Upper);
    if (options.useDigits)
        classes.push_back(CharClass::Digit);
    if (options.useSymbols)
        classes.push_back(CharClass::Symbol);
    return classes;
}

QChar randomChar(const QString &chars, QRandomGenerator *rng)
{
    const auto idx = rng->bounded(chars.size());
    return chars.at(idx);
}

void shuffle(QString &s, QRandomGenerator *rng)
{
    for (qsizetype i = s.size() - 1; i > 0; --i) {
        const auto j = rng->bounded(i + 1);
        if (i != j) {
            const auto tmp = s.at(i);
            s[i] = s.at(j);
            s[j] = tmp;
        }
    }
}

qsizetype firstAdjacentRepeat(const QString &s)
{
    for (qsizetype i = 1; i < s.size(); ++i) {
        if (s.at(i) == s.at(i - 1))
            return i;
    }
    return -1;
}

bool fitsAt(const QString &s, qsizetype pos)
{
    if (pos > 0 && s.at(pos) == s.at(pos - 1))
        return false;
    if (pos + 1 < s.size() && s.at(pos) == s.at(pos + 1))
        return false;
    return true;
}

// Swaps every repeated character with one elsewhere in the string so that
// neither position ends up next to an equal character.
bool repairAdjacentRepeats(QString &s)
{
    for (auto i = firstAdjacentRepeat(s); i >= 0; i = firstAdjacentRepeat(s)) {
        bool swapped = false;
        for (qsizetype j = 0; j < s.size() && !swapped; ++j) {
            if (j == i || s.at(j) == s.at(i))
                continue;

            std::swap(s[i], s[j]);
            if (fitsAt(s, i) && fitsAt(s, j))
                swapped = true;
            else
                std::swap(s[i], s[j]);
        }
        if (!swapped)
            return false;
    }
    return true;
}

PasswordGenerationResult fail(PasswordGenerationError error, const QString &message)
{
    PasswordGenerationResult result;
    result.error = error;
    result.errorMessage = message;
    return result;
}

} // namespace

PasswordGenerationResult generatePassword(const PasswordGeneratorOptions &options)
{
    auto *rng = QRandomGenerator::system();
    const auto classes = selectedClasses(options);

    QString pool;
    QString out;
    for (const auto cls : classes) {
        const QString chars = PasswordCharsets::classChars(cls);
        pool.append(chars);
        out.append(randomChar(chars, rng));
    }

    if (options.excludeAmbiguous)
        pool = PasswordCharsets::withoutAmbiguous(pool);

    if (pool.isEmpty())
        return fail(PasswordGenerationError::NoCharacterClass,
                    "At least one character type must be selected");

    if (options.length < static_cast<int>(classes.size()))
        return fail(PasswordGenerationError::LengthTooShort,
                    QString("Length %1 is too short to include %2 required characters")
                        .arg(options.length)
                        .arg(classes.size()));

    if (options.excludeConsecutiveRepeats && PasswordCharsets::distinctCount(pool) < 2)
        return fail(PasswordGenerationError::DegenerateRepeatExclusion,
                    "Consecutive repeats cannot be avoided with fewer than 2 distinct characters");

    out.reserve(options.length);

    // seeds come from distinct classes, so continuing from the last one keeps
    // the unshuffled sequence free of adjacent repeats
    auto last = out.back();
    while (out.size() < options.length) {
        auto ch = randomChar(pool, rng);
        if (options.excludeConsecutiveRepeats) {
            for (int attempt = 1; ch == last && attempt < kMaxDrawAttempts; ++attempt)
                ch = randomChar(pool, rng);
            if (ch == last) {
                auto k = pool.indexOf(ch);
                while (pool.at(k) == last)
                    k = (k + 1) % pool.size();
                ch = pool.at(k);
            }
        }
        out.append(ch);
        last = ch;
    }

    const auto ordered = out;
    shuffle(out, rng);

    if (options.excludeConsecutiveRepeats) {
        for (int attempt = 0; attempt < kMaxReshuffles && firstAdjacentRepeat(out) >= 0; ++attempt)
            shuffle(out, rng);

        if (firstAdjacentRepeat(out) >= 0) {
            qWarning() << "Reshuffle limit reached, repairing adjacent repeats in place";
            if (!repairAdjacentRepeats(out))
                out = ordered;
        }
    }

    PasswordGenerationResult result;
    result.password = out;
    return result;
}

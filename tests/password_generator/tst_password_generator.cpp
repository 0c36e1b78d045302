#include "password/passwordcharsets.h"
#include "password/passwordgenerator.h"
#include "password/passwordstrength.h"

#include <QSet>
#include <QtTest>

#include <cmath>

using PasswordCharsets::CharClass;

namespace {

bool containsClass(const QString &password, CharClass cls)
{
    for (const auto &ch : password) {
        if (PasswordCharsets::belongsTo(ch, cls))
            return true;
    }
    return false;
}

bool hasAdjacentRepeat(const QString &password)
{
    for (int i = 1; i < password.size(); ++i) {
        if (password.at(i) == password.at(i - 1))
            return true;
    }
    return false;
}

PasswordGeneratorOptions makeOptions(int length, bool upper, bool lower, bool digits, bool symbols)
{
    PasswordGeneratorOptions opt;
    opt.length = length;
    opt.useUpper = upper;
    opt.useLower = lower;
    opt.useDigits = digits;
    opt.useSymbols = symbols;
    return opt;
}

} // namespace

class PasswordGeneratorTests final : public QObject
{
    Q_OBJECT

private slots:
    void generator_rules_data()
    {
        QTest::addColumn<int>("length");
        QTest::addColumn<bool>("upper");
        QTest::addColumn<bool>("lower");
        QTest::addColumn<bool>("digits");
        QTest::addColumn<bool>("symbols");

        QTest::newRow("defaults") << 16 << true << true << true << true;
        QTest::newRow("exactly one per class") << 4 << true << true << true << true;
        QTest::newRow("single char") << 1 << false << true << false << false;
        QTest::newRow("digits only") << 12 << false << false << true << false;
        QTest::newRow("two digits") << 2 << false << false << true << false;
        QTest::newRow("four lowercase") << 4 << false << true << false << false;
        QTest::newRow("upper and digits") << 12 << true << false << true << false;
        QTest::newRow("symbols only") << 40 << false << false << false << true;
        QTest::newRow("long") << 128 << true << true << true << true;
    }

    void generator_rules()
    {
        QFETCH(int, length);
        QFETCH(bool, upper);
        QFETCH(bool, lower);
        QFETCH(bool, digits);
        QFETCH(bool, symbols);

        const auto opt = makeOptions(length, upper, lower, digits, symbols);

        for (int round = 0; round < 200; ++round) {
            const auto result = generatePassword(opt);
            QVERIFY2(result.ok(), qPrintable(result.errorMessage));

            const auto &pwd = result.password;
            QCOMPARE(pwd.size(), length);
            QCOMPARE(containsClass(pwd, CharClass::Upper), upper);
            QCOMPARE(containsClass(pwd, CharClass::Lower), lower);
            QCOMPARE(containsClass(pwd, CharClass::Digit), digits);
            QCOMPARE(containsClass(pwd, CharClass::Symbol), symbols);
            QVERIFY2(!hasAdjacentRepeat(pwd), qPrintable(pwd));
        }
    }

    void short_single_class_never_fails_data()
    {
        QTest::addColumn<int>("length");
        QTest::addColumn<bool>("excludeAmbiguous");

        QTest::newRow("2") << 2 << false;
        QTest::newRow("3") << 3 << false;
        QTest::newRow("4") << 4 << false;
        QTest::newRow("6") << 6 << false;
        QTest::newRow("2 unambiguous") << 2 << true;
    }

    void short_single_class_never_fails()
    {
        QFETCH(int, length);
        QFETCH(bool, excludeAmbiguous);

        auto opt = makeOptions(length, false, false, true, false);
        opt.excludeAmbiguous = excludeAmbiguous;

        for (int round = 0; round < 5000; ++round) {
            const auto result = generatePassword(opt);
            QVERIFY2(result.ok(), qPrintable(result.errorMessage));
            QCOMPARE(result.password.size(), length);
            QVERIFY2(!hasAdjacentRepeat(result.password), qPrintable(result.password));
        }
    }

    void repeats_allowed_when_not_excluded()
    {
        auto opt = makeOptions(64, false, false, true, false);
        opt.excludeConsecutiveRepeats = false;

        // 63 adjacent pairs over 10 digits, a repeat is all but certain in 50 tries
        bool sawRepeat = false;
        for (int round = 0; round < 50 && !sawRepeat; ++round) {
            const auto result = generatePassword(opt);
            QVERIFY(result.ok());
            QCOMPARE(result.password.size(), 64);
            sawRepeat = hasAdjacentRepeat(result.password);
        }
        QVERIFY(sawRepeat);
    }

    void ambiguous_only_in_required_seats()
    {
        auto opt = makeOptions(64, true, true, true, true);
        opt.excludeAmbiguous = true;

        // the seeded character of each class may be ambiguous, the filled ones never are
        for (int round = 0; round < 200; ++round) {
            const auto result = generatePassword(opt);
            QVERIFY(result.ok());

            int upperAmbiguous = 0;
            int lowerAmbiguous = 0;
            int digitAmbiguous = 0;
            for (const auto &ch : result.password) {
                if (ch == 'O' || ch == 'I')
                    upperAmbiguous++;
                else if (ch == 'l')
                    lowerAmbiguous++;
                else if (ch == '0' || ch == '1')
                    digitAmbiguous++;
            }
            QVERIFY(upperAmbiguous <= 1);
            QVERIFY(lowerAmbiguous <= 1);
            QVERIFY(digitAmbiguous <= 1);
        }
    }

    void ambiguous_kept_by_default()
    {
        const auto opt = makeOptions(128, false, false, true, false);

        bool sawAmbiguous = false;
        for (int round = 0; round < 20 && !sawAmbiguous; ++round) {
            const auto result = generatePassword(opt);
            QVERIFY(result.ok());
            for (const auto &ch : result.password) {
                if (PasswordCharsets::isAmbiguous(ch))
                    sawAmbiguous = true;
            }
        }
        QVERIFY(sawAmbiguous);
    }

    void no_class_selected()
    {
        const auto result = generatePassword(makeOptions(16, false, false, false, false));
        QVERIFY(!result.ok());
        QVERIFY(result.error == PasswordGenerationError::NoCharacterClass);
        QVERIFY(result.password.isEmpty());
        QVERIFY(!result.errorMessage.isEmpty());
    }

    void length_too_short()
    {
        const auto result = generatePassword(makeOptions(2, true, true, true, false));
        QVERIFY(!result.ok());
        QVERIFY(result.error == PasswordGenerationError::LengthTooShort);
        QVERIFY(result.password.isEmpty());

        const auto zero = generatePassword(makeOptions(0, false, true, false, false));
        QVERIFY(zero.error == PasswordGenerationError::LengthTooShort);
    }

    void outputs_differ()
    {
        const PasswordGeneratorOptions opt;

        QSet<QString> seen;
        for (int i = 0; i < 1000; ++i) {
            const auto result = generatePassword(opt);
            QVERIFY(result.ok());
            seen.insert(result.password);
        }
        QVERIFY(seen.size() >= 999);
    }

    void entropy_basic()
    {
        QCOMPARE(calculatePasswordEntropy(""), 0.0);
        QVERIFY(qFuzzyCompare(calculatePasswordEntropy("abcd"), std::log2(26.0) * 4));
        QVERIFY(std::abs(calculatePasswordEntropy("abcd") - 18.8) < 0.05);
        QVERIFY(qFuzzyCompare(calculatePasswordEntropy("aB3!"), std::log2(94.0) * 4));
        QVERIFY(qFuzzyCompare(calculatePasswordEntropy("Ab"), std::log2(52.0) * 2));
        QCOMPARE(calculatePasswordEntropy("    "), 0.0);
    }

    void strength_labels_data()
    {
        QTest::addColumn<QString>("password");
        QTest::addColumn<QString>("label");

        // symbols alone give an alphabet of 32, i.e. exactly 5 bits per character
        QTest::newRow("25 bits") << QString("!!!!!") << QString("Very Weak");
        QTest::newRow("30 bits") << QString("!!!!!!") << QString("Weak");
        QTest::newRow("50 bits") << QString("!!!!!!!!!!") << QString("Fair");
        QTest::newRow("70 bits") << QString("!!!!!!!!!!!!!!") << QString("Strong");
        QTest::newRow("90 bits") << QString("!!!!!!!!!!!!!!!!!!") << QString("Very Strong");
        QTest::newRow("empty") << QString() << QString("Very Weak");
    }

    void strength_labels()
    {
        QFETCH(QString, password);
        QFETCH(QString, label);

        QCOMPARE(assessPasswordStrength(password), label);
        QCOMPARE(evaluatePasswordStrength(password).label, label);
    }

    void strength_levels()
    {
        QVERIFY(strengthLevelForEntropy(0.0) == PasswordStrengthLevel::VeryWeak);
        QVERIFY(strengthLevelForEntropy(29.99) == PasswordStrengthLevel::VeryWeak);
        QVERIFY(strengthLevelForEntropy(30.0) == PasswordStrengthLevel::Weak);
        QVERIFY(strengthLevelForEntropy(69.99) == PasswordStrengthLevel::Fair);
        QVERIFY(strengthLevelForEntropy(89.99) == PasswordStrengthLevel::Strong);
        QVERIFY(strengthLevelForEntropy(512.0) == PasswordStrengthLevel::VeryStrong);

        const auto s = evaluatePasswordStrength("!!!!!!!!!!!!!!");
        QVERIFY(qFuzzyCompare(s.entropyBits, 70.0));
        QVERIFY(s.level == PasswordStrengthLevel::Strong);
    }

    void generated_default_is_strong()
    {
        const auto result = generatePassword(PasswordGeneratorOptions());
        QVERIFY(result.ok());

        // 16 characters over all four classes: log2(94) * 16 ~= 104.9
        const auto s = evaluatePasswordStrength(result.password);
        QVERIFY(qFuzzyCompare(s.entropyBits, std::log2(94.0) * 16));
        QCOMPARE(s.label, QString("Very Strong"));
    }
};

QTEST_GUILESS_MAIN(PasswordGeneratorTests)

#include "tst_password_generator.moc"

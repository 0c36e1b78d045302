#include "passwordapi.h"

#include "password/passwordstrength.h"

#include <QJsonDocument>
#include <QJsonValue>

#include <cmath>

namespace {

constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusUnprocessable = 422;

bool jsonBool(const QJsonObject &params, const QString &key, bool defaultValue)
{
    const auto value = params.value(key);
    return value.isBool() ? value.toBool() : defaultValue;
}

bool parseBodyObject(const QByteArray &body, QJsonObject *out, QString *errorOut)
{
    if (body.trimmed().isEmpty()) {
        *errorOut = "No body provided";
        return false;
    }

    QJsonParseError parseError;
    const auto doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        *errorOut = QString("Malformed JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        *errorOut = "Request body must be a JSON object";
        return false;
    }

    *out = doc.object();
    return true;
}

ApiReply reply(int status, const QJsonObject &body)
{
    ApiReply out;
    out.status = status;
    out.body = body;
    return out;
}

} // namespace

PasswordApi::PasswordApi(int maxPasswordLength) : maxPasswordLength_(maxPasswordLength) {}

int PasswordApi::maxPasswordLength() const
{
    return maxPasswordLength_;
}

GenerateRequestParseResult PasswordApi::parseGenerateRequest(const QByteArray &body) const
{
    GenerateRequestParseResult result;

    QJsonObject params;
    if (!parseBodyObject(body, &params, &result.error))
        return result;

    auto &opt = result.options;

    const auto length = params.value("length");
    if (!length.isUndefined() && !length.isNull()) {
        const auto value = length.toDouble();
        if (!length.isDouble() || std::floor(value) != value) {
            result.error = "length must be an integer";
            return result;
        }
        if (value < 1 || value > maxPasswordLength_) {
            result.error = QString("length must be between 1 and %1").arg(maxPasswordLength_);
            return result;
        }
        opt.length = static_cast<int>(value);
    }

    opt.useUpper = jsonBool(params, "includeUppercase", opt.useUpper);
    opt.useLower = jsonBool(params, "includeLowercase", opt.useLower);
    opt.useDigits = jsonBool(params, "includeDigits", opt.useDigits);
    opt.useSymbols = jsonBool(params, "includeSymbols", opt.useSymbols);
    opt.excludeAmbiguous = jsonBool(params, "excludeAmbiguous", opt.excludeAmbiguous);
    opt.excludeConsecutiveRepeats = jsonBool(params, "excludeConsecutiveRepeats", opt.excludeConsecutiveRepeats);

    return result;
}

ApiReply PasswordApi::generate(const QByteArray &body) const
{
    const auto request = parseGenerateRequest(body);
    if (!request.ok())
        return reply(kStatusBadRequest, errorBody(request.error));

    const auto generated = generatePassword(request.options);
    if (!generated.ok())
        return reply(kStatusUnprocessable, errorBody(generated.errorMessage));

    const auto strength = evaluatePasswordStrength(generated.password);

    QJsonObject out;
    out.insert("password", generated.password);
    out.insert("entropy", strength.entropyBits);
    out.insert("strength", strength.label);
    out.insert("length", static_cast<int>(generated.password.size()));
    return reply(kStatusOk, out);
}

ApiReply PasswordApi::strength(const QByteArray &body) const
{
    QJsonObject params;
    QString error;
    if (!parseBodyObject(body, &params, &error))
        return reply(kStatusBadRequest, errorBody(error));

    const auto password = params.value("password");
    if (!password.isString() || password.toString().isEmpty())
        return reply(kStatusBadRequest, errorBody("Password is required"));

    const auto text = password.toString();
    const auto strength = evaluatePasswordStrength(text);

    QJsonObject out;
    out.insert("entropy", strength.entropyBits);
    out.insert("strength", strength.label);
    out.insert("length", static_cast<int>(text.size()));
    return reply(kStatusOk, out);
}

QJsonObject PasswordApi::errorBody(const QString &message)
{
    QJsonObject out;
    out.insert("error", message);
    return out;
}

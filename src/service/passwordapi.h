#pragma once

#include "password/passwordgenerator.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

struct ApiReply final
{
    int status = 200;
    QJsonObject body;
};

struct GenerateRequestParseResult final
{
    PasswordGeneratorOptions options;
    QString error;

    bool ok() const { return error.isEmpty(); }
};

// JSON boundary in front of the generator and the strength scorer. Requests
// are JSON objects; every generation field is optional and defaults on its own.
class PasswordApi final
{
public:
    explicit PasswordApi(int maxPasswordLength = 128);

    int maxPasswordLength() const;

    GenerateRequestParseResult parseGenerateRequest(const QByteArray &body) const;

    ApiReply generate(const QByteArray &body) const;
    ApiReply strength(const QByteArray &body) const;

    static QJsonObject errorBody(const QString &message);

private:
    int maxPasswordLength_ = 128;
};

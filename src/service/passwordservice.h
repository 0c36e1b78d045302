#pragma once

#include "passwordapi.h"
#include "serviceconfig.h"

#include <QObject>

class QHttpServer;
class QHttpServerRequest;
class QHttpServerResponse;

class PasswordService final : public QObject
{
    Q_OBJECT

public:
    explicit PasswordService(const ServiceConfig &config, QObject *parent = nullptr);
    ~PasswordService() override;

    bool start(QString *errorOut = nullptr);
    quint16 serverPort() const;

private:
    using ApiHandler = ApiReply (PasswordApi::*)(const QByteArray &) const;

    void setupRoutes();
    QHttpServerResponse handle(const QHttpServerRequest &request, ApiHandler handler) const;

    ServiceConfig config_;
    PasswordApi api_;
    QHttpServer *server_ = nullptr;
    quint16 port_ = 0;
};

#include "passwordservice.h"

#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QTcpServer>
#include <QtDebug>

#include <memory>
#include <utility>

namespace {

QString methodName(QHttpServerRequest::Method method)
{
    switch (method) {
    case QHttpServerRequest::Method::Get:
        return "GET";
    case QHttpServerRequest::Method::Post:
        return "POST";
    case QHttpServerRequest::Method::Put:
        return "PUT";
    case QHttpServerRequest::Method::Delete:
        return "DELETE";
    case QHttpServerRequest::Method::Head:
        return "HEAD";
    case QHttpServerRequest::Method::Options:
        return "OPTIONS";
    case QHttpServerRequest::Method::Patch:
        return "PATCH";
    default:
        return "OTHER";
    }
}

QHttpServerResponse withCors(QHttpServerResponse &&response)
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 8, 0)
    auto headers = response.headers();
    headers.append("Access-Control-Allow-Origin", "*");
    headers.append("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    headers.append("Access-Control-Allow-Headers", "Content-Type");
    response.setHeaders(std::move(headers));
#else
    response.setHeader("Access-Control-Allow-Origin", "*");
    response.setHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    response.setHeader("Access-Control-Allow-Headers", "Content-Type");
#endif
    return std::move(response);
}

} // namespace

PasswordService::PasswordService(const ServiceConfig &config, QObject *parent)
    : QObject(parent), config_(config), api_(config.maxPasswordLength)
{
    server_ = new QHttpServer(this);
    setupRoutes();
}

PasswordService::~PasswordService() = default;

void PasswordService::setupRoutes()
{
    server_->route("/api/v1/generate", [this](const QHttpServerRequest &request) {
        return handle(request, &PasswordApi::generate);
    });
    server_->route("/api/v1/strength", [this](const QHttpServerRequest &request) {
        return handle(request, &PasswordApi::strength);
    });
}

bool PasswordService::start(QString *errorOut)
{
    auto tcp = std::make_unique<QTcpServer>();
    if (!tcp->listen(config_.address, config_.port)) {
        if (errorOut)
            *errorOut = QString("Cannot listen on %1:%2: %3")
                            .arg(config_.address.toString())
                            .arg(config_.port)
                            .arg(tcp->errorString());
        return false;
    }

#if QT_VERSION >= QT_VERSION_CHECK(6, 8, 0)
    if (!server_->bind(tcp.get())) {
        if (errorOut)
            *errorOut = "Cannot bind HTTP server to the listening socket";
        return false;
    }
#else
    server_->bind(tcp.get());
#endif

    port_ = tcp->serverPort();
    tcp.release()->setParent(server_);

    qInfo().noquote() << QString("Password service listening on http://%1:%2")
                             .arg(config_.address.toString())
                             .arg(port_);
    return true;
}

quint16 PasswordService::serverPort() const
{
    return port_;
}

QHttpServerResponse PasswordService::handle(const QHttpServerRequest &request, ApiHandler handler) const
{
    const auto method = request.method();
    const auto path = request.url().path();

    if (method == QHttpServerRequest::Method::Options) {
        qDebug().noquote() << "OPTIONS" << path << 200;
        return withCors(QHttpServerResponse(QHttpServerResponder::StatusCode::Ok));
    }

    if (method != QHttpServerRequest::Method::Post) {
        qInfo().noquote() << methodName(method) << path << 405;
        return withCors(QHttpServerResponse(PasswordApi::errorBody("Method Not Allowed"),
                                            QHttpServerResponder::StatusCode::MethodNotAllowed));
    }

    const auto reply = (api_.*handler)(request.body());
    if (reply.status >= 400)
        qWarning().noquote() << "POST" << path << reply.status << reply.body.value("error").toString();
    else
        qInfo().noquote() << "POST" << path << reply.status;

    return withCors(QHttpServerResponse(reply.body, static_cast<QHttpServerResponder::StatusCode>(reply.status)));
}

#include "daemon/http_api_server.hpp"

#include <QDebug>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QTcpServer>
#include <QUrlQuery>
#include <QUuid>

#include "common/logging.hpp"

namespace foldermind {

namespace {

const char *const kRoutes[] = {
    "/api/v1/health",
    "/api/v1/server/info",
    "/api/v1/folders",
    "/api/v1/folders/status",
    "/api/v1/folders/retry",
    "/api/v1/search",
    "/api/v1/notifications",
    "/api/v1/connection",
    "/api/v1/connection/request",
    "/api/v1/connection/primary",
    "/mcp",
};

std::string methodString(QHttpServerRequest::Method method)
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
    case QHttpServerRequest::Method::Patch:
        return "PATCH";
    case QHttpServerRequest::Method::Head:
        return "HEAD";
    case QHttpServerRequest::Method::Options:
        return "OPTIONS";
    default:
        return "UNKNOWN";
    }
}

} // namespace

HttpApiServer::HttpApiServer(ApiRouter &router, QObject *parent)
    : QObject(parent)
    , m_router(router)
{
    for (const char *route : kRoutes) {
        m_server.route(QString::fromLatin1(route),
                       [this](const QHttpServerRequest &request) {
                           return respond(request);
                       });
    }
}

HttpApiServer::~HttpApiServer() = default;

bool HttpApiServer::start(const QHostAddress &address, quint16 port)
{
    auto tcpServer = std::make_unique<QTcpServer>();
    if (!tcpServer->listen(address, port)) {
        FMLOG_ERROR(QStringLiteral("HttpApiServer"),
                    QStringLiteral("HttpApiServer::start"),
                    QStringLiteral("listen_failed"),
                    tcpServer->errorString(),
                    QStringLiteral("tcp_listen"),
                    QString(),
                    QString(),
                    (nlohmann::json{{"address", address.toString().toStdString()},
                                    {"port", port}}));
        return false;
    }
    m_port = tcpServer->serverPort();
    // QHttpServer takes ownership of the listening socket.
    m_server.bind(tcpServer.release());

    qInfo() << "Foldermind API server listening on" << address.toString() << m_port;
    return true;
}

quint16 HttpApiServer::serverPort() const
{
    return m_port;
}

QHttpServerResponse HttpApiServer::respond(const QHttpServerRequest &request)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    ApiRequest apiRequest;
    apiRequest.method = methodString(request.method());
    apiRequest.path = request.url().path().toStdString();
    const QUrlQuery query = request.query();
    for (const auto &item : query.queryItems(QUrl::FullyDecoded)) {
        apiRequest.query[item.first.toStdString()] = item.second.toStdString();
    }
    apiRequest.body = request.body().toStdString();

    const ApiResponse response = m_router.handle(apiRequest);
    const auto status = static_cast<QHttpServerResponder::StatusCode>(response.status);
    if (response.body.is_null()) {
        return QHttpServerResponse(status);
    }
    return QHttpServerResponse(QByteArrayLiteral("application/json"),
                               QByteArray::fromStdString(response.body.dump()),
                               status);
}

} // namespace foldermind

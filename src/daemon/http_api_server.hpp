#pragma once

#include <memory>

#include <QHostAddress>
#include <QHttpServer>
#include <QObject>

#include "daemon/api_router.hpp"

namespace foldermind {

/**
 * HttpApiServer exposes the ApiRouter on the fallback channel
 * (127.0.0.1:<httpPort> by default). Each request runs under its own
 * correlation id; the client id is taken from the "client" query parameter.
 */
class HttpApiServer : public QObject
{
    Q_OBJECT
public:
    explicit HttpApiServer(ApiRouter &router, QObject *parent = nullptr);
    ~HttpApiServer() override;

    // port 0 picks a free port. Returns false when the socket cannot be bound.
    bool start(const QHostAddress &address, quint16 port);
    quint16 serverPort() const;

private:
    QHttpServerResponse respond(const QHttpServerRequest &request);

    ApiRouter &m_router;
    QHttpServer m_server;
    quint16 m_port = 0;
};

} // namespace foldermind

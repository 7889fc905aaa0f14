#include "common/http_request.hpp"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QScopedPointer>
#include <QTimer>

namespace foldermind {

HttpResponse performHttpRequest(const QByteArray &method,
                                const QUrl &url,
                                const QByteArray &body,
                                std::chrono::milliseconds timeout)
{
    QNetworkAccessManager manager;
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::ManualRedirectPolicy);

    // Released through deleteLater; the manager reclaims it on return if no
    // event loop gets to it first.
    const QScopedPointer<QNetworkReply, QScopedPointerDeleteLater> reply(
        manager.sendCustomRequest(request, method, body));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(timeout.count()));
    if (!reply->isFinished()) {
        loop.exec();
    }
    timer.stop();

    HttpResponse response;
    response.timedOut = timedOut;
    response.networkError = reply->error();
    response.errorString = reply->errorString();
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!timedOut && status.isValid()) {
        response.received = true;
        response.status = status.toInt();
        response.body = reply->readAll();
    }
    return response;
}

} // namespace foldermind

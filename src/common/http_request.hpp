#pragma once

#include <chrono>

#include <QByteArray>
#include <QNetworkReply>
#include <QString>
#include <QUrl>

namespace foldermind {

struct HttpResponse {
    // False when no HTTP response arrived (refused, reset, DNS, timeout).
    bool received = false;
    bool timedOut = false;
    QNetworkReply::NetworkError networkError = QNetworkReply::NoError;
    QString errorString;
    int status = 0;
    QByteArray body;
};

// Blocking request on the calling thread. Runs a local event loop, so it is
// safe from worker threads and from the main thread before exec().
HttpResponse performHttpRequest(const QByteArray &method,
                                const QUrl &url,
                                const QByteArray &body,
                                std::chrono::milliseconds timeout);

} // namespace foldermind

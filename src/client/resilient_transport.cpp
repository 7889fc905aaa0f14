#include "client/resilient_transport.hpp"

#include <QEventLoop>
#include <QTimer>
#include <QUrl>

#include "common/daemon_config.hpp"
#include "common/daemon_registry.hpp"
#include "common/errors.hpp"
#include "common/http_request.hpp"
#include "common/logging.hpp"

namespace foldermind {

namespace {

void waitFor(std::chrono::milliseconds delay)
{
    if (delay.count() <= 0) {
        return;
    }
    QEventLoop loop;
    QTimer::singleShot(delay, &loop, &QEventLoop::quit);
    loop.exec();
}

TransportErrorKind kindOf(const HttpResponse &response)
{
    if (response.timedOut) {
        return TransportErrorKind::Timeout;
    }
    switch (response.networkError) {
    case QNetworkReply::ConnectionRefusedError:
        return TransportErrorKind::ConnectionRefused;
    case QNetworkReply::RemoteHostClosedError:
        return TransportErrorKind::ConnectionReset;
    case QNetworkReply::HostNotFoundError:
        return TransportErrorKind::HostNotFound;
    default:
        return TransportErrorKind::Other;
    }
}

bool isRetryable(TransportErrorKind kind)
{
    return kind == TransportErrorKind::ConnectionRefused
        || kind == TransportErrorKind::ConnectionReset
        || kind == TransportErrorKind::HostNotFound;
}

bool looksLikeDaemonAbsent(TransportErrorKind kind)
{
    return kind == TransportErrorKind::ConnectionRefused
        || kind == TransportErrorKind::HostNotFound;
}

std::string registryFilePath(const ClientTransportOptions &options)
{
    if (!options.registryPath.empty()) {
        return options.registryPath;
    }
    DaemonConfig defaults;
    defaults.dataDir = defaultDataDir();
    return defaults.registryPath();
}

} // namespace

nlohmann::json TransportResponse::json() const
{
    nlohmann::json parsed = nlohmann::json::parse(body.toStdString(), nullptr, false);
    if (parsed.is_discarded()) {
        return nullptr;
    }
    return parsed;
}

ResilientTransport::ResilientTransport(ClientTransportOptions options,
                                       std::shared_ptr<DaemonLauncher> launcher)
    : m_options(std::move(options))
    , m_launcher(std::move(launcher))
{
    if (m_options.maxAttempts < 1) {
        m_options.maxAttempts = 1;
    }
    if (!m_launcher) {
        m_launcher = std::make_shared<ProcessDaemonLauncher>();
    }
    m_baseUrl = resolveBaseUrl(m_options);
}

std::string ResilientTransport::resolveBaseUrl(const ClientTransportOptions &options)
{
    if (!options.baseUrl.empty()) {
        return options.baseUrl;
    }
    const QString fromEnv = qEnvironmentVariable("FOLDERMIND_DAEMON_URL");
    if (!fromEnv.isEmpty()) {
        return fromEnv.toStdString();
    }
    const std::optional<DaemonRegistration> registration =
        readDaemonRegistration(registryFilePath(options));
    if (registration.has_value()) {
        return registration->baseUrl();
    }
    return kDefaultBaseUrl;
}

bool ResilientTransport::checkHealth()
{
    const QUrl url(QString::fromStdString(m_baseUrl + "/api/v1/health"));
    const HttpResponse response = performHttpRequest(QByteArrayLiteral("GET"), url, QByteArray(),
                                                     m_options.pollInterval * 5);
    return response.received && response.status == 200;
}

TransportResponse ResilientTransport::request(const std::string &method,
                                              const std::string &path,
                                              const QByteArray &body)
{
    const QByteArray verb = QByteArray::fromStdString(method);
    auto send = [&]() {
        const QUrl url(QString::fromStdString(m_baseUrl + path));
        return performHttpRequest(verb, url, body, m_options.requestTimeout);
    };

    TransportErrorKind lastKind = TransportErrorKind::Other;
    QString lastError;
    for (int attempt = 1; attempt <= m_options.maxAttempts; ++attempt) {
        const HttpResponse response = send();
        if (response.received) {
            return TransportResponse{response.status, response.body};
        }

        lastKind = kindOf(response);
        lastError = response.errorString;
        if (lastKind == TransportErrorKind::Timeout) {
            throw TransportError(TransportErrorKind::Timeout,
                                 "daemon busy: no response to " + method + " " + path
                                 + " within "
                                 + std::to_string(m_options.requestTimeout.count()) + " ms");
        }
        if (!isRetryable(lastKind)) {
            throw TransportError(lastKind, lastError.toStdString());
        }

        FMLOG_DEBUG(QStringLiteral("ResilientTransport"),
                    QStringLiteral("ResilientTransport::request"),
                    QStringLiteral("transport_retry"),
                    lastError,
                    QStringLiteral("exponential_backoff"),
                    QString(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"attempt", attempt},
                                    {"path", path},
                                    {"baseUrl", m_baseUrl}}));
        if (attempt < m_options.maxAttempts) {
            waitFor(m_options.initialBackoff * (1LL << (attempt - 1)));
        }
    }

    if (!m_options.autoStart || !looksLikeDaemonAbsent(lastKind)) {
        throw TransportError(lastKind, "daemon unreachable at " + m_baseUrl + ": "
                             + lastError.toStdString());
    }

    autoStart();

    const HttpResponse replay = send();
    if (replay.received) {
        return TransportResponse{replay.status, replay.body};
    }
    const TransportErrorKind replayKind = kindOf(replay);
    if (replayKind == TransportErrorKind::Timeout) {
        throw TransportError(TransportErrorKind::Timeout,
                             "daemon busy: no response to replayed " + method + " " + path);
    }
    throw TransportError(replayKind, "replay after auto-start failed: "
                         + replay.errorString.toStdString());
}

void ResilientTransport::autoStart()
{
    FMLOG_INFO(QStringLiteral("ResilientTransport"),
               QStringLiteral("ResilientTransport::autoStart"),
               QStringLiteral("daemon_auto_start"),
               QStringLiteral("daemon_not_running"),
               QStringLiteral("spawn_and_poll_health"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"baseUrl", m_baseUrl}}));

    QString error;
    if (!m_launcher->launch(&error)) {
        throw DaemonUnavailableError(error.toStdString());
    }

    const auto deadline = std::chrono::steady_clock::now() + m_options.healthTimeout;
    const bool pinned = !m_options.baseUrl.empty()
        || !qEnvironmentVariable("FOLDERMIND_DAEMON_URL").isEmpty();
    while (std::chrono::steady_clock::now() < deadline) {
        if (!pinned) {
            // A freshly started daemon publishes its address in the registry.
            m_baseUrl = resolveBaseUrl(m_options);
        }
        if (checkHealth()) {
            return;
        }
        waitFor(m_options.pollInterval);
    }
    throw DaemonUnavailableError("health check did not succeed within "
                                 + std::to_string(m_options.healthTimeout.count()) + " ms");
}

} // namespace foldermind

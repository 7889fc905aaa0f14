#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <QByteArray>

#include <nlohmann/json.hpp>

#include "client/daemon_launcher.hpp"

namespace foldermind {

struct ClientTransportOptions {
    // Empty: FOLDERMIND_DAEMON_URL, the registry file, then the default.
    std::string baseUrl;
    int maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{250};
    std::chrono::milliseconds requestTimeout{5000};
    std::chrono::milliseconds healthTimeout{10000};
    std::chrono::milliseconds pollInterval{200};
    bool autoStart = true;
    std::string registryPath;
};

struct TransportResponse {
    int status = 0;
    QByteArray body;

    // Null when the body is not JSON.
    nlohmann::json json() const;
};

/**
 * ResilientTransport talks to the daemon's HTTP channel. Connection-level
 * failures are retried with exponential backoff; any HTTP status is returned
 * to the caller as-is. When the daemon looks absent after the retries it is
 * started once and the original request is replayed once.
 *
 * Waits run a local event loop, so the caller's thread needs no running loop.
 */
class ResilientTransport {
public:
    static constexpr const char *kDefaultBaseUrl = "http://127.0.0.1:3002";

    explicit ResilientTransport(ClientTransportOptions options = {},
                                std::shared_ptr<DaemonLauncher> launcher = nullptr);

    // Throws TransportError (timeout, or retries exhausted without a
    // daemon-absent signature) and DaemonUnavailableError.
    TransportResponse request(const std::string &method,
                              const std::string &path,
                              const QByteArray &body = QByteArray());

    // Single GET /api/v1/health; true on HTTP 200.
    bool checkHealth();

    const std::string &baseUrl() const { return m_baseUrl; }

    static std::string resolveBaseUrl(const ClientTransportOptions &options);

private:
    // Starts the daemon and polls health. Throws DaemonUnavailableError.
    void autoStart();

    ClientTransportOptions m_options;
    std::shared_ptr<DaemonLauncher> m_launcher;
    std::string m_baseUrl;
};

} // namespace foldermind

#pragma once

#include <optional>
#include <string>

#include <QTextStream>

#include <nlohmann/json.hpp>

#include "client/resilient_transport.hpp"

namespace foldermind {

/**
 * StdioBridge is the low-latency channel: newline-delimited JSON-RPC on
 * stdin/stdout, forwarded to the daemon's /mcp endpoint. It claims the
 * channel from the arbiter once at startup. A denied bridge keeps running
 * and answers every request with a redirect error so the client can switch
 * to the HTTP fallback on its own.
 */
class StdioBridge {
public:
    StdioBridge(ResilientTransport &transport, std::string clientId);

    // Asks the daemon for the low-latency channel. Throws what the transport throws.
    bool claimChannel();

    bool granted() const { return m_granted; }
    const nlohmann::json &denial() const { return m_denial; }

    // nullopt when nothing should be written back (notifications, blank lines).
    std::optional<std::string> handleLine(const std::string &line);

    // Reads until EOF. Returns the process exit code.
    int run(QTextStream &in, QTextStream &out);

private:
    std::string m_clientId;
    ResilientTransport &m_transport;
    bool m_granted = false;
    nlohmann::json m_denial;
};

} // namespace foldermind

#include "mcp/stdio_bridge.hpp"

#include <QUrl>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "daemon/mcp_handler.hpp"

namespace foldermind {

StdioBridge::StdioBridge(ResilientTransport &transport, std::string clientId)
    : m_clientId(std::move(clientId))
    , m_transport(transport)
{
}

bool StdioBridge::claimChannel()
{
    const nlohmann::json body = {{"clientId", m_clientId}};
    const TransportResponse response = m_transport.request(
        "POST", "/api/v1/connection/request", QByteArray::fromStdString(body.dump()));
    const nlohmann::json decision = response.json();
    if (response.status != 200 || !decision.is_object()) {
        throw std::runtime_error("unexpected channel response (HTTP "
                                 + std::to_string(response.status) + ")");
    }

    m_granted = decision.value("granted", false);
    if (!m_granted) {
        m_denial = {
            {"reason", decision.value("reason", "primary_held_by_other")},
            {"fallbackAddress", decision.value("fallbackAddress", "")},
            {"primaryClientId", decision.contains("primaryClientId")
                                    ? decision.at("primaryClientId")
                                    : nlohmann::json(nullptr)}
        };
    }

    FMLOG_INFO(QStringLiteral("StdioBridge"),
               QStringLiteral("StdioBridge::claimChannel"),
               m_granted ? QStringLiteral("channel_granted") : QStringLiteral("channel_denied"),
               QString::fromStdString(decision.value("reason", "")),
               QStringLiteral("arbiter_request"),
               QString::fromStdString(m_clientId),
               logging::currentCorrelationId(),
               decision);
    return m_granted;
}

std::optional<std::string> StdioBridge::handleLine(const std::string &line)
{
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    const nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        return McpHandler::makeError(nullptr, McpHandler::kParseError, "Parse error").dump();
    }
    const bool isNotification = !message.is_object() || !message.contains("id");
    const nlohmann::json id = isNotification ? nlohmann::json(nullptr) : message.at("id");

    if (!m_granted) {
        if (isNotification) {
            return std::nullopt;
        }
        return McpHandler::makeError(id, McpHandler::kChannelDenied,
                                     "low-latency channel held by another client",
                                     m_denial).dump();
    }

    const std::string path = "/mcp?client="
        + QString::fromUtf8(QUrl::toPercentEncoding(QString::fromStdString(m_clientId))).toStdString();
    try {
        const TransportResponse response =
            m_transport.request("POST", path, QByteArray::fromStdString(line));
        if (isNotification || response.body.isEmpty()) {
            return std::nullopt;
        }
        const nlohmann::json reply = response.json();
        if (reply.is_null()) {
            return McpHandler::makeError(id, McpHandler::kInternalError,
                                         "daemon returned HTTP "
                                         + std::to_string(response.status)).dump();
        }
        if (response.status >= 400 && !reply.contains("jsonrpc")) {
            return McpHandler::makeError(id, McpHandler::kInternalError,
                                         reply.value("message", "daemon error"), reply).dump();
        }
        return reply.dump();
    } catch (const std::exception &error) {
        FMLOG_WARN(QStringLiteral("StdioBridge"),
                   QStringLiteral("StdioBridge::handleLine"),
                   QStringLiteral("forward_failed"),
                   QString::fromStdString(error.what()),
                   QStringLiteral("jsonrpc_error"),
                   QString::fromStdString(m_clientId),
                   logging::currentCorrelationId(),
                   nlohmann::json::object());
        if (isNotification) {
            return std::nullopt;
        }
        return McpHandler::makeError(id, McpHandler::kInternalError, error.what()).dump();
    }
}

int StdioBridge::run(QTextStream &in, QTextStream &out)
{
    while (!in.atEnd()) {
        const QString line = in.readLine();
        const std::optional<std::string> reply = handleLine(line.toStdString());
        if (reply.has_value()) {
            out << QString::fromStdString(*reply) << '\n';
            out.flush();
        }
    }
    return 0;
}

} // namespace foldermind

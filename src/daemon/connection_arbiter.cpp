#include "daemon/connection_arbiter.hpp"

#include <chrono>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace foldermind {

namespace {

constexpr const char *kReasonGranted = "granted";
constexpr const char *kReasonAlreadyPrimary = "already_primary";
constexpr const char *kReasonHeldByOther = "primary_held_by_other";

} // namespace

ConnectionArbiter::ConnectionArbiter(DaemonStateStore &stateStore,
                                     ClientConfigWriter &configWriter,
                                     std::string fallbackAddress)
    : m_stateStore(stateStore)
    , m_configWriter(configWriter)
    , m_fallbackAddress(std::move(fallbackAddress))
{
    m_state = m_stateStore.loadConnectionState();
}

void ConnectionArbiter::rememberClientLocked(const std::string &clientId, TransportMode mode)
{
    KnownClient &client = m_state.knownClients[clientId];
    client.clientId = clientId;
    client.mode = mode;
    client.fallbackAddress = m_fallbackAddress;
}

ChannelDecision ConnectionArbiter::requestLowLatencyChannel(const std::string &clientId)
{
    if (clientId.empty()) {
        throw std::invalid_argument("client id must not be empty");
    }

    ChannelDecision decision;
    decision.fallbackAddress = m_fallbackAddress;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_state.primaryClientId.has_value()) {
            m_state.primaryClientId = clientId;
            rememberClientLocked(clientId, TransportMode::Stdio);
            m_stateStore.saveConnectionState(m_state);
            decision.granted = true;
            decision.reason = kReasonGranted;
        } else if (*m_state.primaryClientId == clientId) {
            decision.granted = true;
            decision.reason = kReasonAlreadyPrimary;
        } else {
            ConnectionConflict conflict;
            conflict.requestingClientId = clientId;
            conflict.primaryClientId = *m_state.primaryClientId;
            conflict.timestamp = std::chrono::system_clock::now();
            m_state.lastConflict = conflict;
            m_state.conflictHistory.push_back(conflict);
            if (m_state.conflictHistory.size() > kMaxConflictHistory) {
                m_state.conflictHistory.erase(
                    m_state.conflictHistory.begin(),
                    m_state.conflictHistory.end() - kMaxConflictHistory);
            }
            if (m_state.knownClients.count(clientId) == 0) {
                rememberClientLocked(clientId, TransportMode::Http);
            }
            m_stateStore.saveConnectionState(m_state);
            decision.granted = false;
            decision.reason = kReasonHeldByOther;
        }
        decision.primaryClientId = m_state.primaryClientId;
    }

    if (decision.granted) {
        FMLOG_INFO(QStringLiteral("ConnectionArbiter"),
                   QStringLiteral("ConnectionArbiter::requestLowLatencyChannel"),
                   QStringLiteral("channel_granted"),
                   QString::fromStdString(decision.reason),
                   QStringLiteral("compare_and_set"),
                   QString::fromStdString(clientId),
                   logging::currentCorrelationId(),
                   nlohmann::json::object());
    } else {
        FMLOG_WARN(QStringLiteral("ConnectionArbiter"),
                   QStringLiteral("ConnectionArbiter::requestLowLatencyChannel"),
                   QStringLiteral("channel_denied"),
                   QString::fromStdString(decision.reason),
                   QStringLiteral("redirect_to_fallback"),
                   QString::fromStdString(clientId),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"primaryClientId", decision.primaryClientId.value_or("")},
                                   {"fallbackAddress", decision.fallbackAddress}}));
    }
    return decision;
}

void ConnectionArbiter::requireLowLatencyChannel(const std::string &clientId)
{
    const ChannelDecision decision = requestLowLatencyChannel(clientId);
    if (!decision.granted) {
        throw ConnectionConflictError(decision.reason,
                                      decision.fallbackAddress,
                                      decision.primaryClientId.value_or(""));
    }
}

std::vector<ConfigWriteResult> ConnectionArbiter::setPrimary(const std::string &clientId)
{
    if (clientId.empty()) {
        throw std::invalid_argument("client id must not be empty");
    }

    std::lock_guard<std::mutex> rewriteLock(m_rewriteMutex);
    std::vector<ConfigWriteResult> plan;
    std::optional<std::string> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_state.primaryClientId;
        m_state.primaryClientId = clientId;
        for (auto &entry : m_state.knownClients) {
            entry.second.mode = TransportMode::Http;
            entry.second.fallbackAddress = m_fallbackAddress;
        }
        rememberClientLocked(clientId, TransportMode::Stdio);
        m_stateStore.saveConnectionState(m_state);

        for (const auto &entry : m_state.knownClients) {
            ConfigWriteResult result;
            result.clientId = entry.first;
            result.mode = entry.second.mode;
            plan.push_back(result);
        }
    }

    FMLOG_INFO(QStringLiteral("ConnectionArbiter"),
               QStringLiteral("ConnectionArbiter::setPrimary"),
               QStringLiteral("primary_assigned"),
               QStringLiteral("user_request"),
               QStringLiteral("persist_then_rewrite_configs"),
               QString::fromStdString(clientId),
               logging::currentCorrelationId(),
               (nlohmann::json{{"previous", previous.value_or("")},
                               {"clients", plan.size()}}));

    for (ConfigWriteResult &result : plan) {
        try {
            m_configWriter.writeConfig(result.clientId, result.mode, m_fallbackAddress);
            result.ok = true;
        } catch (const std::exception &error) {
            result.ok = false;
            result.error = error.what();
            FMLOG_WARN(QStringLiteral("ConnectionArbiter"),
                       QStringLiteral("ConnectionArbiter::setPrimary"),
                       QStringLiteral("client_config_failed"),
                       QStringLiteral("write_error"),
                       QStringLiteral("report_per_client"),
                       QString::fromStdString(result.clientId),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"error", result.error}}));
        }
    }
    return plan;
}

void ConnectionArbiter::clearPrimary()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_state.primaryClientId.has_value()) {
        return;
    }
    const std::string previous = *m_state.primaryClientId;
    m_state.primaryClientId.reset();
    m_stateStore.saveConnectionState(m_state);

    FMLOG_INFO(QStringLiteral("ConnectionArbiter"),
               QStringLiteral("ConnectionArbiter::clearPrimary"),
               QStringLiteral("primary_cleared"),
               QStringLiteral("user_request"),
               QStringLiteral("persist"),
               QString::fromStdString(previous),
               logging::currentCorrelationId(),
               nlohmann::json::object());
}

void ConnectionArbiter::registerClient(const std::string &clientId)
{
    if (clientId.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.knownClients.count(clientId) > 0) {
        return;
    }
    const bool primary = m_state.primaryClientId.has_value() && *m_state.primaryClientId == clientId;
    rememberClientLocked(clientId, primary ? TransportMode::Stdio : TransportMode::Http);
    m_stateStore.saveConnectionState(m_state);
}

ClientConnectionState ConnectionArbiter::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::vector<ConnectionConflict> ConnectionArbiter::conflicts() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.conflictHistory;
}

void to_json(nlohmann::json &j, const ChannelDecision &decision)
{
    j = nlohmann::json{
        {"granted", decision.granted},
        {"reason", decision.reason},
        {"fallbackAddress", decision.fallbackAddress}
    };
    if (decision.primaryClientId.has_value()) {
        j["primaryClientId"] = *decision.primaryClientId;
    } else {
        j["primaryClientId"] = nullptr;
    }
}

void to_json(nlohmann::json &j, const ConfigWriteResult &result)
{
    j = nlohmann::json{
        {"clientId", result.clientId},
        {"mode", toTransportModeString(result.mode)},
        {"ok", result.ok},
        {"error", result.error}
    };
}

} // namespace foldermind

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "daemon/client_config_writer.hpp"
#include "store/daemon_state_store.hpp"

namespace foldermind {

struct ChannelDecision {
    bool granted = false;
    // "granted", "already_primary" or "primary_held_by_other".
    std::string reason;
    std::string fallbackAddress;
    std::optional<std::string> primaryClientId;
};

struct ConfigWriteResult {
    std::string clientId;
    TransportMode mode = TransportMode::Http;
    bool ok = false;
    std::string error;
};

/**
 * ConnectionArbiter hands the single low-latency channel to one client at a
 * time. Every read and mutation happens under one mutex and is persisted to
 * the DaemonStateStore before the lock is released, so a restarted daemon
 * keeps the same primary.
 */
class ConnectionArbiter {
public:
    static constexpr std::size_t kMaxConflictHistory = 50;

    ConnectionArbiter(DaemonStateStore &stateStore,
                      ClientConfigWriter &configWriter,
                      std::string fallbackAddress);

    ChannelDecision requestLowLatencyChannel(const std::string &clientId);

    // Same as requestLowLatencyChannel but throws ConnectionConflictError on denial.
    void requireLowLatencyChannel(const std::string &clientId);

    // Assigns the primary, then rewrites every known client's configuration.
    // Each file is written independently and reported on its own.
    std::vector<ConfigWriteResult> setPrimary(const std::string &clientId);
    void clearPrimary();

    // Records a client so it receives configuration rewrites.
    void registerClient(const std::string &clientId);

    ClientConnectionState state() const;
    std::vector<ConnectionConflict> conflicts() const;
    const std::string &fallbackAddress() const { return m_fallbackAddress; }

private:
    void rememberClientLocked(const std::string &clientId, TransportMode mode);

    DaemonStateStore &m_stateStore;
    ClientConfigWriter &m_configWriter;
    std::string m_fallbackAddress;

    // Held by setPrimary from the state change through the last config write
    // so concurrent reassignments cannot interleave their rewrites. Taken
    // before m_mutex.
    std::mutex m_rewriteMutex;
    mutable std::mutex m_mutex;
    ClientConnectionState m_state;
};

void to_json(nlohmann::json &j, const ChannelDecision &decision);
void to_json(nlohmann::json &j, const ConfigWriteResult &result);

} // namespace foldermind

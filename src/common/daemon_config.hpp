#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace foldermind {

// Retry schedule for transient folder failures. Attempt n (1-based) waits
// min(initialDelay * multiplier^(n-1), maxDelay).
struct RetryPolicy {
    int maxAttempts = 5;
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{60000};
    double multiplier = 2.0;

    std::chrono::milliseconds delayForAttempt(int attempt) const;
};

struct ChunkingOptions {
    int targetTokens = 400;
    int maxTokens = 800;
};

struct DaemonConfig {
    std::string bindHost = "127.0.0.1";
    int httpPort = 3002;
    std::string dataDir;
    int workerThreads = 2;
    RetryPolicy retryPolicy;
    std::chrono::milliseconds auditInterval{30 * 60 * 1000};
    int auditSampleSize = 25;
    std::chrono::milliseconds watchDebounce{750};
    ChunkingOptions chunking;
    std::string defaultModelId = "hash-384";
    std::string ollamaUrl = "http://127.0.0.1:11434";
    std::string bridgeExecutable;
    // debug, info, warn or error.
    std::string logLevel = "info";
    // Empty: ~/.local/share/foldermind/logs.
    std::string logDir;
    bool logToStderr = false;

    std::string fallbackAddress() const;
    std::string indexDatabasePath() const;
    std::string stateDatabasePath() const;
    std::string registryPath() const;
};

// ~/.local/share/foldermind, honoring $HOME.
std::string defaultDataDir();

// ~/.config/foldermind/daemon.json
std::string defaultConfigPath();

// Defaults, then the JSON file (when present), then FOLDERMIND_* environment overrides.
// Throws std::runtime_error when the file exists but cannot be parsed, or
// names an unknown log level.
DaemonConfig loadDaemonConfig(const std::string &path = defaultConfigPath());

DaemonConfig daemonConfigFromJson(const nlohmann::json &j);
nlohmann::json daemonConfigToJson(const DaemonConfig &config);

logging::LogOptions logOptionsFor(const DaemonConfig &config);

} // namespace foldermind

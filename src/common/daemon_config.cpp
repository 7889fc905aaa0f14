#include "common/daemon_config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <QString>

#include "common/logging.hpp"

namespace foldermind {

namespace {

std::string homeDir()
{
    const char *home = std::getenv("HOME");
    return home ? home : ".";
}

std::string envValue(const char *name)
{
    const char *value = std::getenv(name);
    return value ? value : std::string();
}

int envInt(const char *name, int fallback)
{
    const std::string value = envValue(name);
    if (value.empty()) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception &) {
        return fallback;
    }
}

std::chrono::milliseconds msValue(const nlohmann::json &j, const char *key,
                                  std::chrono::milliseconds fallback)
{
    if (!j.contains(key) || !j.at(key).is_number_integer()) {
        return fallback;
    }
    return std::chrono::milliseconds(j.at(key).get<long long>());
}

} // namespace

std::chrono::milliseconds RetryPolicy::delayForAttempt(int attempt) const
{
    if (attempt < 1) {
        attempt = 1;
    }
    const double scaled = static_cast<double>(initialDelay.count())
        * std::pow(multiplier, attempt - 1);
    const double capped = std::min(scaled, static_cast<double>(maxDelay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

std::string DaemonConfig::fallbackAddress() const
{
    return "http://" + bindHost + ":" + std::to_string(httpPort) + "/mcp";
}

std::string DaemonConfig::indexDatabasePath() const
{
    return (std::filesystem::path(dataDir) / "index.db").string();
}

std::string DaemonConfig::stateDatabasePath() const
{
    return (std::filesystem::path(dataDir) / "state.db").string();
}

std::string DaemonConfig::registryPath() const
{
    return (std::filesystem::path(dataDir) / "daemon.json").string();
}

std::string defaultDataDir()
{
    return (std::filesystem::path(homeDir()) / ".local/share/foldermind").string();
}

std::string defaultConfigPath()
{
    return (std::filesystem::path(homeDir()) / ".config/foldermind/daemon.json").string();
}

DaemonConfig daemonConfigFromJson(const nlohmann::json &j)
{
    DaemonConfig config;
    config.dataDir = defaultDataDir();
    if (!j.is_object()) {
        return config;
    }

    config.bindHost = j.value("bindHost", config.bindHost);
    config.httpPort = j.value("httpPort", config.httpPort);
    config.dataDir = j.value("dataDir", config.dataDir);
    config.workerThreads = std::max(1, j.value("workerThreads", config.workerThreads));
    config.auditInterval = msValue(j, "auditIntervalMs", config.auditInterval);
    config.auditSampleSize = j.value("auditSampleSize", config.auditSampleSize);
    config.watchDebounce = msValue(j, "watchDebounceMs", config.watchDebounce);
    config.defaultModelId = j.value("defaultModel", config.defaultModelId);
    config.ollamaUrl = j.value("ollamaUrl", config.ollamaUrl);
    config.bridgeExecutable = j.value("bridgeExecutable", config.bridgeExecutable);

    if (j.contains("retry") && j.at("retry").is_object()) {
        const auto &retry = j.at("retry");
        config.retryPolicy.maxAttempts =
            std::max(0, retry.value("maxAttempts", config.retryPolicy.maxAttempts));
        config.retryPolicy.initialDelay =
            msValue(retry, "initialDelayMs", config.retryPolicy.initialDelay);
        config.retryPolicy.maxDelay =
            msValue(retry, "maxDelayMs", config.retryPolicy.maxDelay);
        config.retryPolicy.multiplier =
            std::max(1.0, retry.value("multiplier", config.retryPolicy.multiplier));
    }

    if (j.contains("logging") && j.at("logging").is_object()) {
        const auto &logSection = j.at("logging");
        config.logLevel = logSection.value("level", config.logLevel);
        config.logDir = logSection.value("directory", config.logDir);
        config.logToStderr = logSection.value("stderr", config.logToStderr);
    }

    if (j.contains("chunking") && j.at("chunking").is_object()) {
        const auto &chunking = j.at("chunking");
        config.chunking.targetTokens =
            std::max(16, chunking.value("targetTokens", config.chunking.targetTokens));
        config.chunking.maxTokens = std::max(
            config.chunking.targetTokens,
            chunking.value("maxTokens", config.chunking.maxTokens));
    }

    return config;
}

logging::LogOptions logOptionsFor(const DaemonConfig &config)
{
    logging::LogOptions options;
    options.directory = QString::fromStdString(config.logDir);
    options.minimumLevel = logging::parseLogLevel(QString::fromStdString(config.logLevel))
                               .value_or(logging::LogLevel::Info);
    options.mirrorToStderr = config.logToStderr;
    return options;
}

nlohmann::json daemonConfigToJson(const DaemonConfig &config)
{
    return nlohmann::json{
        {"bindHost", config.bindHost},
        {"httpPort", config.httpPort},
        {"dataDir", config.dataDir},
        {"workerThreads", config.workerThreads},
        {"auditIntervalMs", config.auditInterval.count()},
        {"auditSampleSize", config.auditSampleSize},
        {"watchDebounceMs", config.watchDebounce.count()},
        {"defaultModel", config.defaultModelId},
        {"ollamaUrl", config.ollamaUrl},
        {"bridgeExecutable", config.bridgeExecutable},
        {"retry", {
            {"maxAttempts", config.retryPolicy.maxAttempts},
            {"initialDelayMs", config.retryPolicy.initialDelay.count()},
            {"maxDelayMs", config.retryPolicy.maxDelay.count()},
            {"multiplier", config.retryPolicy.multiplier}
        }},
        {"chunking", {
            {"targetTokens", config.chunking.targetTokens},
            {"maxTokens", config.chunking.maxTokens}
        }},
        {"logging", {
            {"level", config.logLevel},
            {"directory", config.logDir},
            {"stderr", config.logToStderr}
        }}
    };
}

DaemonConfig loadDaemonConfig(const std::string &path)
{
    nlohmann::json fileJson = nlohmann::json::object();
    std::error_code error;
    if (!path.empty() && std::filesystem::exists(path, error)) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("cannot read config file " + path);
        }
        fileJson = nlohmann::json::parse(in, nullptr, false);
        if (fileJson.is_discarded()) {
            throw std::runtime_error("config file is not valid JSON: " + path);
        }
    }

    DaemonConfig config = daemonConfigFromJson(fileJson);

    config.httpPort = envInt("FOLDERMIND_HTTP_PORT", config.httpPort);
    config.workerThreads = std::max(1, envInt("FOLDERMIND_WORKERS", config.workerThreads));
    if (const std::string dataDir = envValue("FOLDERMIND_DATA_DIR"); !dataDir.empty()) {
        config.dataDir = dataDir;
    }
    if (const std::string model = envValue("FOLDERMIND_DEFAULT_MODEL"); !model.empty()) {
        config.defaultModelId = model;
    }
    if (const std::string ollama = envValue("FOLDERMIND_OLLAMA_URL"); !ollama.empty()) {
        config.ollamaUrl = ollama;
    }
    if (const std::string level = envValue("FOLDERMIND_LOG_LEVEL"); !level.empty()) {
        config.logLevel = level;
    }
    if (!logging::parseLogLevel(QString::fromStdString(config.logLevel)).has_value()) {
        throw std::runtime_error("unknown log level '" + config.logLevel + "'");
    }
    return config;
}

} // namespace foldermind

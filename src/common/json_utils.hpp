#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace foldermind {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

// Unset timestamps serialize as empty strings rather than the epoch.
inline std::string optionalIso8601(std::chrono::system_clock::time_point timestamp)
{
    if (timestamp == std::chrono::system_clock::time_point{}) {
        return {};
    }
    return toIso8601Utc(timestamp);
}

inline std::string toFolderStateString(FolderState state)
{
    switch (state) {
    case FolderState::Pending:
        return "pending";
    case FolderState::Scanning:
        return "scanning";
    case FolderState::Indexing:
        return "indexing";
    case FolderState::Active:
        return "active";
    case FolderState::Error:
        return "error";
    case FolderState::Removed:
        return "removed";
    }
    return "error";
}

inline FolderState parseFolderStateString(const std::string &value)
{
    if (value == "pending") {
        return FolderState::Pending;
    }
    if (value == "scanning") {
        return FolderState::Scanning;
    }
    if (value == "indexing") {
        return FolderState::Indexing;
    }
    if (value == "active") {
        return FolderState::Active;
    }
    if (value == "removed") {
        return FolderState::Removed;
    }
    return FolderState::Error;
}

inline std::string toTransportModeString(TransportMode mode)
{
    switch (mode) {
    case TransportMode::Stdio:
        return "stdio";
    case TransportMode::Http:
        return "http";
    }
    return "http";
}

inline TransportMode parseTransportModeString(const std::string &value)
{
    if (value == "stdio") {
        return TransportMode::Stdio;
    }
    return TransportMode::Http;
}

inline void to_json(nlohmann::json &j, const FolderState &state)
{
    j = toFolderStateString(state);
}

inline void from_json(const nlohmann::json &j, FolderState &state)
{
    if (j.is_string()) {
        state = parseFolderStateString(j.get<std::string>());
    } else {
        state = FolderState::Error;
    }
}

inline void to_json(nlohmann::json &j, const FolderConfig &config)
{
    j = nlohmann::json{
        {"model", config.embeddingModelId},
        {"exclude", config.exclusionPatterns}
    };
}

inline void from_json(const nlohmann::json &j, FolderConfig &config)
{
    config.embeddingModelId = j.value("model", "");
    if (j.contains("exclude") && j.at("exclude").is_array()) {
        config.exclusionPatterns = j.at("exclude").get<std::vector<std::string>>();
    } else {
        config.exclusionPatterns.clear();
    }
}

inline void to_json(nlohmann::json &j, const FolderErrorInfo &error)
{
    j = nlohmann::json{
        {"kind", error.kind},
        {"message", error.message},
        {"remediation", error.remediation},
        {"timestamp", optionalIso8601(error.timestamp)},
        {"environment", error.environment},
        {"terminal", error.terminal}
    };
}

inline void from_json(const nlohmann::json &j, FolderErrorInfo &error)
{
    error.kind = j.value("kind", "");
    error.message = j.value("message", "");
    error.remediation = j.value("remediation", "");
    error.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    error.environment = j.value("environment", false);
    error.terminal = j.value("terminal", false);
}

inline void to_json(nlohmann::json &j, const MonitoredFolder &folder)
{
    j = nlohmann::json{
        {"id", folder.id},
        {"path", folder.path},
        {"config", folder.config},
        {"state", folder.state},
        {"lastIndexed", optionalIso8601(folder.lastIndexed)},
        {"retryAttempts", folder.retryAttempts}
    };
    if (folder.lastError.has_value()) {
        j["lastError"] = *folder.lastError;
    } else {
        j["lastError"] = nullptr;
    }
}

inline void to_json(nlohmann::json &j, const Document &document)
{
    j = nlohmann::json{
        {"id", document.id},
        {"folderId", document.folderId},
        {"path", document.path},
        {"contentHash", document.contentHash},
        {"format", toFormatString(document.format)},
        {"mimeType", document.mimeType},
        {"modified", optionalIso8601(document.modifiedAt)},
        {"size", document.size},
        {"lastIndexed", optionalIso8601(document.lastIndexed)},
        {"needsReindex", document.needsReindex}
    };
}

inline void to_json(nlohmann::json &j, const SemanticMetadata &metadata)
{
    j = nlohmann::json{
        {"tokenCount", metadata.tokenCount},
        {"keyPhrases", metadata.keyPhrases},
        {"topics", metadata.topics},
        {"readabilityScore", metadata.readabilityScore}
    };
}

inline void from_json(const nlohmann::json &j, SemanticMetadata &metadata)
{
    metadata.tokenCount = j.value("tokenCount", 0);
    if (j.contains("keyPhrases") && j.at("keyPhrases").is_array()) {
        metadata.keyPhrases = j.at("keyPhrases").get<std::vector<std::string>>();
    }
    if (j.contains("topics") && j.at("topics").is_array()) {
        metadata.topics = j.at("topics").get<std::vector<std::string>>();
    }
    metadata.readabilityScore = j.value("readabilityScore", 0.0);
}

inline void to_json(nlohmann::json &j, const DocumentRef &document)
{
    j = nlohmann::json{
        {"id", document.id},
        {"folderId", document.folderId},
        {"path", document.path},
        {"format", toFormatString(document.format)},
        {"mimeType", document.mimeType}
    };
}

inline void to_json(nlohmann::json &j, const SimilarChunk &chunk)
{
    j = nlohmann::json{
        {"chunkId", chunk.chunkId},
        {"ordinal", chunk.ordinal},
        {"coordinates", chunk.coordinates},
        {"metadata", chunk.metadata},
        {"score", chunk.score},
        {"document", chunk.document}
    };
}

inline void to_json(nlohmann::json &j, const KnownClient &client)
{
    j = nlohmann::json{
        {"clientId", client.clientId},
        {"mode", toTransportModeString(client.mode)},
        {"fallbackAddress", client.fallbackAddress}
    };
}

inline void to_json(nlohmann::json &j, const ConnectionConflict &conflict)
{
    j = nlohmann::json{
        {"requestingClientId", conflict.requestingClientId},
        {"primaryClientId", conflict.primaryClientId},
        {"timestamp", toIso8601Utc(conflict.timestamp)}
    };
}

inline void to_json(nlohmann::json &j, const ClientConnectionState &state)
{
    j = nlohmann::json::object();
    if (state.primaryClientId.has_value()) {
        j["primaryClientId"] = *state.primaryClientId;
    } else {
        j["primaryClientId"] = nullptr;
    }
    nlohmann::json clients = nlohmann::json::array();
    for (const auto &entry : state.knownClients) {
        clients.push_back(entry.second);
    }
    j["knownClients"] = clients;
    if (state.lastConflict.has_value()) {
        j["lastConflict"] = *state.lastConflict;
    } else {
        j["lastConflict"] = nullptr;
    }
    j["conflictHistory"] = state.conflictHistory;
}

inline void to_json(nlohmann::json &j, const Notification &notification)
{
    j = nlohmann::json{
        {"folderId", notification.folderId},
        {"folderPath", notification.folderPath},
        {"severity", notification.severity},
        {"message", notification.message},
        {"remediation", notification.remediation},
        {"dataIntact", notification.dataIntact},
        {"raisedAt", toIso8601Utc(notification.raisedAt)}
    };
}

} // namespace foldermind

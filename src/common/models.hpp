#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"
#include "extraction/coordinates.hpp"

namespace foldermind {

using FolderId = std::int64_t;
using DocumentId = std::int64_t;
using ChunkId = std::int64_t;

struct FolderConfig {
    std::string embeddingModelId;
    std::vector<std::string> exclusionPatterns;
};

struct FolderErrorInfo {
    std::string kind;
    std::string message;
    std::string remediation;
    std::chrono::system_clock::time_point timestamp;
    bool environment = false;
    bool terminal = false;
};

struct MonitoredFolder {
    FolderId id = 0;
    std::string path;
    FolderConfig config;
    FolderState state = FolderState::Pending;
    std::chrono::system_clock::time_point lastIndexed;
    std::optional<FolderErrorInfo> lastError;
    int retryAttempts = 0;
};

struct Document {
    DocumentId id = 0;
    FolderId folderId = 0;
    std::string path;
    std::string contentHash;
    DocumentFormat format = DocumentFormat::Unknown;
    std::string mimeType;
    std::chrono::system_clock::time_point modifiedAt;
    std::int64_t size = 0;
    std::chrono::system_clock::time_point lastIndexed;
    bool needsReindex = false;
};

// Everything needed to re-open a document for extraction.
struct DocumentHandle {
    std::string path;
    DocumentFormat format = DocumentFormat::Unknown;
    std::string mimeType;
    // SHA-256 hex recorded at index time. Empty skips the content check.
    std::string contentHash;
};

struct SemanticMetadata {
    int tokenCount = 0;
    std::vector<std::string> keyPhrases;
    std::vector<std::string> topics;
    double readabilityScore = 0.0;
};

struct ChunkRecord {
    ChunkId id = 0;
    DocumentId documentId = 0;
    int ordinal = 0;
    ExtractionCoordinates coordinates;
    SemanticMetadata metadata;
    std::vector<float> embedding;
};

struct DocumentRef {
    DocumentId id = 0;
    FolderId folderId = 0;
    std::string path;
    DocumentFormat format = DocumentFormat::Unknown;
    std::string mimeType;
    std::string contentHash;
};

struct SimilarChunk {
    ChunkId chunkId = 0;
    int ordinal = 0;
    ExtractionCoordinates coordinates;
    SemanticMetadata metadata;
    double score = 0.0;
    DocumentRef document;
};

struct SimilarityFilters {
    std::optional<FolderId> folderId;
    std::vector<DocumentId> documentIds;
    std::optional<DocumentFormat> format;
    double minScore = -1.0;
};

struct KnownClient {
    std::string clientId;
    TransportMode mode = TransportMode::Http;
    std::string fallbackAddress;
};

struct ConnectionConflict {
    std::string requestingClientId;
    std::string primaryClientId;
    std::chrono::system_clock::time_point timestamp;
};

struct ClientConnectionState {
    std::optional<std::string> primaryClientId;
    std::map<std::string, KnownClient> knownClients;
    std::optional<ConnectionConflict> lastConflict;
    std::vector<ConnectionConflict> conflictHistory;
};

struct Notification {
    FolderId folderId = 0;
    std::string folderPath;
    std::string severity;
    std::string message;
    std::string remediation;
    bool dataIntact = true;
    std::chrono::system_clock::time_point raisedAt;
};

} // namespace foldermind

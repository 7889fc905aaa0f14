#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "embedding/embedding_backend.hpp"
#include "extraction/text_reconstructor.hpp"
#include "store/coordinate_store.hpp"

namespace foldermind {

struct SearchRequest {
    std::string query;
    int limit = 10;
    std::optional<FolderId> folderId;
    std::optional<DocumentFormat> format;
    double minScore = -1.0;
    bool includeText = true;
};

struct SearchHit {
    SimilarChunk chunk;
    // Reconstructed from the coordinates; empty only when includeText is off.
    std::string text;
};

struct ChunkText {
    ChunkRecord chunk;
    DocumentRef document;
    std::string text;
};

/**
 * SearchService answers queries from committed store data. The query is
 * embedded once per distinct folder model, hits are merged by score, and
 * every snippet is rebuilt through the TextReconstructor.
 */
class SearchService {
public:
    using FolderDirectory = std::function<std::vector<MonitoredFolder>()>;
    using MismatchHandler = std::function<void(DocumentId)>;

    SearchService(CoordinateStore &store,
                  const TextReconstructor &reconstructor,
                  EmbeddingBackendProvider &embeddings,
                  FolderDirectory folders,
                  MismatchHandler onMismatch,
                  std::string defaultModelId);

    // Throws CoordinateMismatchError when a hit no longer reconstructs. The
    // owning document is flagged for re-indexing before the error propagates.
    std::vector<SearchHit> search(const SearchRequest &request) const;

    // Throws std::out_of_range for an unknown chunk id.
    ChunkText chunkText(ChunkId chunkId) const;

private:
    std::string reconstruct(const SimilarChunk &chunk) const;
    std::string reconstruct(const ExtractionCoordinates &coordinates,
                            const DocumentRef &document) const;

    CoordinateStore &m_store;
    const TextReconstructor &m_reconstructor;
    EmbeddingBackendProvider &m_embeddings;
    FolderDirectory m_folders;
    MismatchHandler m_onMismatch;
    std::string m_defaultModelId;
};

void to_json(nlohmann::json &j, const SearchHit &hit);

} // namespace foldermind

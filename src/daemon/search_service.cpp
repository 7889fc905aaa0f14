#include "daemon/search_service.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace foldermind {

SearchService::SearchService(CoordinateStore &store,
                             const TextReconstructor &reconstructor,
                             EmbeddingBackendProvider &embeddings,
                             FolderDirectory folders,
                             MismatchHandler onMismatch,
                             std::string defaultModelId)
    : m_store(store)
    , m_reconstructor(reconstructor)
    , m_embeddings(embeddings)
    , m_folders(std::move(folders))
    , m_onMismatch(std::move(onMismatch))
    , m_defaultModelId(std::move(defaultModelId))
{
}

std::vector<SearchHit> SearchService::search(const SearchRequest &request) const
{
    if (request.query.empty()) {
        throw std::invalid_argument("query must not be empty");
    }
    const int limit = std::max(1, request.limit);

    // Folders sharing a model share one query embedding.
    std::map<std::string, std::vector<FolderId>> foldersByModel;
    for (const MonitoredFolder &folder : m_folders()) {
        if (folder.state == FolderState::Removed) {
            continue;
        }
        if (request.folderId.has_value() && *request.folderId != folder.id) {
            continue;
        }
        const std::string modelId = folder.config.embeddingModelId.empty()
            ? m_defaultModelId
            : folder.config.embeddingModelId;
        foldersByModel[modelId].push_back(folder.id);
    }

    std::vector<SimilarChunk> merged;
    for (const auto &entry : foldersByModel) {
        const std::vector<float> queryEmbedding =
            m_embeddings.backendFor(entry.first)->embed(request.query);
        for (const FolderId folderId : entry.second) {
            SimilarityFilters filters;
            filters.folderId = folderId;
            filters.format = request.format;
            filters.minScore = request.minScore;
            std::vector<SimilarChunk> hits = m_store.querySimilar(queryEmbedding, limit, filters);
            merged.insert(merged.end(), hits.begin(), hits.end());
        }
    }

    std::sort(merged.begin(), merged.end(), [](const SimilarChunk &a, const SimilarChunk &b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.chunkId < b.chunkId;
    });
    if (merged.size() > static_cast<std::size_t>(limit)) {
        merged.resize(static_cast<std::size_t>(limit));
    }

    std::vector<SearchHit> hits;
    hits.reserve(merged.size());
    for (SimilarChunk &chunk : merged) {
        SearchHit hit;
        if (request.includeText) {
            hit.text = reconstruct(chunk);
        }
        hit.chunk = std::move(chunk);
        hits.push_back(std::move(hit));
    }

    FMLOG_INFO(QStringLiteral("SearchService"),
               QStringLiteral("SearchService::search"),
               QStringLiteral("search_completed"),
               QStringLiteral("client_query"),
               QStringLiteral("cosine_similarity"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"models", foldersByModel.size()},
                               {"hits", hits.size()},
                               {"limit", limit}}));
    return hits;
}

ChunkText SearchService::chunkText(ChunkId chunkId) const
{
    const std::optional<ChunkRecord> chunk = m_store.chunk(chunkId);
    if (!chunk.has_value()) {
        throw std::out_of_range("unknown chunk id " + std::to_string(chunkId));
    }
    const std::optional<Document> document = m_store.document(chunk->documentId);
    if (!document.has_value()) {
        throw std::out_of_range("chunk " + std::to_string(chunkId) + " has no document");
    }

    ChunkText result;
    result.chunk = *chunk;
    result.document.id = document->id;
    result.document.folderId = document->folderId;
    result.document.path = document->path;
    result.document.format = document->format;
    result.document.mimeType = document->mimeType;
    result.document.contentHash = document->contentHash;
    result.text = reconstruct(chunk->coordinates, result.document);
    return result;
}

std::string SearchService::reconstruct(const SimilarChunk &chunk) const
{
    return reconstruct(chunk.coordinates, chunk.document);
}

std::string SearchService::reconstruct(const ExtractionCoordinates &coordinates,
                                       const DocumentRef &document) const
{
    const DocumentHandle handle{document.path, document.format, document.mimeType,
                                document.contentHash};
    try {
        return m_reconstructor.extract(coordinates, handle);
    } catch (const CoordinateMismatchError &error) {
        FMLOG_WARN(QStringLiteral("SearchService"),
                   QStringLiteral("SearchService::reconstruct"),
                   QStringLiteral("coordinate_mismatch"),
                   QStringLiteral("source_changed"),
                   QStringLiteral("flag_for_reindex"),
                   QString(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"documentId", document.id},
                                   {"path", document.path},
                                   {"error", error.what()}}));
        if (m_onMismatch) {
            m_onMismatch(document.id);
        }
        throw;
    }
}

void to_json(nlohmann::json &j, const SearchHit &hit)
{
    j = hit.chunk;
    j["text"] = hit.text;
}

} // namespace foldermind

#include "daemon/indexing_pipeline.hpp"

#include "common/logging.hpp"
#include "embedding/semantic_metadata.hpp"

namespace foldermind {

IndexingPipeline::IndexingPipeline(CoordinateStore &store,
                                   const TextReconstructor &reconstructor,
                                   EmbeddingBackendProvider &embeddings,
                                   ChunkingOptions chunking)
    : m_store(store)
    , m_reconstructor(reconstructor)
    , m_embeddings(embeddings)
    , m_chunking(chunking)
{
}

DocumentId IndexingPipeline::indexDocument(const Document &document,
                                           const std::string &modelId,
                                           const CancelToken &cancel)
{
    // Verified before and after the chunk loop rather than on every extract.
    const DocumentHandle handle{document.path, document.format, document.mimeType};
    const DocumentHandle hashed{document.path, document.format, document.mimeType,
                                document.contentHash};
    TextReconstructor::verifyContent(hashed);
    const std::shared_ptr<EmbeddingBackend> backend = m_embeddings.backendFor(modelId);

    const std::vector<ExtractionCoordinates> planned = m_reconstructor.plan(handle, m_chunking);

    std::vector<ChunkRecord> chunks;
    chunks.reserve(planned.size());
    int ordinal = 0;
    for (const ExtractionCoordinates &coordinates : planned) {
        throwIfCancelled(cancel);
        const std::string text = m_reconstructor.extract(coordinates, handle);

        ChunkRecord chunk;
        chunk.ordinal = ordinal++;
        chunk.coordinates = coordinates;
        chunk.metadata = computeSemanticMetadata(text);
        chunk.embedding = backend->embed(text);
        chunks.push_back(std::move(chunk));
    }
    throwIfCancelled(cancel);
    TextReconstructor::verifyContent(hashed);

    Document committed = document;
    committed.lastIndexed = std::chrono::system_clock::now();
    committed.needsReindex = false;
    const DocumentId documentId = m_store.commitDocument(committed, chunks);

    FMLOG_DEBUG(QStringLiteral("IndexingPipeline"),
                QStringLiteral("IndexingPipeline::indexDocument"),
                QStringLiteral("document_indexed"),
                QStringLiteral("content_changed"),
                QStringLiteral("plan_extract_embed"),
                QString(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"path", document.path},
                                {"model", modelId},
                                {"chunks", chunks.size()}}));
    return documentId;
}

} // namespace foldermind

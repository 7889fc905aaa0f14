#pragma once

#include "common/daemon_config.hpp"
#include "common/models.hpp"
#include "daemon/cancel_token.hpp"
#include "embedding/embedding_backend.hpp"
#include "extraction/text_reconstructor.hpp"
#include "store/coordinate_store.hpp"

namespace foldermind {

// Chunks, describes and embeds one document, then commits it atomically.
// The text that gets embedded is produced by TextReconstructor::extract on the
// planned coordinates, so stored vectors always match what the coordinates
// reconstruct.
class IndexingPipeline {
public:
    IndexingPipeline(CoordinateStore &store,
                     const TextReconstructor &reconstructor,
                     EmbeddingBackendProvider &embeddings,
                     ChunkingOptions chunking);

    // Throws whatever the extractor or backend throws (FolderError,
    // EnvironmentError, CoordinateMismatchError) and JobCancelledError.
    DocumentId indexDocument(const Document &document,
                             const std::string &modelId,
                             const CancelToken &cancel);

private:
    CoordinateStore &m_store;
    const TextReconstructor &m_reconstructor;
    EmbeddingBackendProvider &m_embeddings;
    ChunkingOptions m_chunking;
};

} // namespace foldermind

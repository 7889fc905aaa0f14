#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "embedding/embedding_backend.hpp"
#include "extraction/text_reconstructor.hpp"
#include "store/coordinate_store.hpp"

namespace foldermind {

struct AuditReport {
    FolderId folderId = 0;
    int chunksChecked = 0;
    std::vector<DocumentId> flaggedDocuments;
};

// Re-extracts and re-embeds a sample of a folder's chunks and compares the
// result with the stored vector. Documents that no longer reconstruct, or
// whose vectors drifted, are handed to the flag callback.
class ConsistencyAuditor {
public:
    using FlagHandler = std::function<void(DocumentId)>;

    ConsistencyAuditor(CoordinateStore &store,
                       const TextReconstructor &reconstructor,
                       EmbeddingBackendProvider &embeddings,
                       FlagHandler onFlag);

    // sampleSize <= 0 audits every chunk.
    AuditReport auditFolder(const MonitoredFolder &folder,
                            const std::string &modelId,
                            int sampleSize) const;

    static bool embeddingsMatch(const std::vector<float> &a,
                                const std::vector<float> &b,
                                float tolerance = 1e-4f);

private:
    CoordinateStore &m_store;
    const TextReconstructor &m_reconstructor;
    EmbeddingBackendProvider &m_embeddings;
    FlagHandler m_onFlag;
};

} // namespace foldermind

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace foldermind {

// CoordinateStore persists documents, chunk coordinates, derived metadata and
// embedding vectors. Chunk text is never stored; callers reconstruct it from
// the coordinates through the TextReconstructor.
//
// One writer connection serialized by a mutex, plus a small pool of read
// connections that see the last committed WAL snapshot.
class CoordinateStore {
public:
    explicit CoordinateStore(const std::string &databasePath, int readConnections = 4);
    ~CoordinateStore();

    CoordinateStore(const CoordinateStore &) = delete;
    CoordinateStore &operator=(const CoordinateStore &) = delete;

    const std::string &databasePath() const;

    // Upserts one chunk of an existing document.
    ChunkId putChunk(DocumentId documentId,
                     int ordinal,
                     const ExtractionCoordinates &coordinates,
                     const SemanticMetadata &metadata,
                     const std::vector<float> &embedding);

    // Upserts the document row (keyed by folder and path) and replaces all of
    // its chunks in a single transaction. Returns the document id.
    DocumentId commitDocument(const Document &document,
                              const std::vector<ChunkRecord> &chunks);

    // Cosine similarity over stored embeddings, best first. Chunks whose
    // dimension differs from the query are ignored.
    std::vector<SimilarChunk> querySimilar(const std::vector<float> &queryEmbedding,
                                           int k,
                                           const SimilarityFilters &filters = {}) const;

    void deleteDocument(DocumentId documentId);
    void dropFolderPartition(FolderId folderId);

    std::vector<Document> listDocuments(FolderId folderId) const;
    std::optional<Document> document(DocumentId documentId) const;
    int documentCount(FolderId folderId) const;
    int chunkCount(FolderId folderId) const;

    std::vector<ChunkRecord> chunksForDocument(DocumentId documentId) const;
    std::optional<ChunkRecord> chunk(ChunkId chunkId) const;

    void setNeedsReindex(DocumentId documentId, bool needsReindex);

    // PRAGMA integrity_check on a read connection.
    bool integrityCheck() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace foldermind

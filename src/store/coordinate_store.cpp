#include "store/coordinate_store.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <cstring>
#include <mutex>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "store/sqlite_utils.hpp"

namespace foldermind {

namespace {

constexpr const char *kCreateDocumentsTable =
    "CREATE TABLE IF NOT EXISTS documents ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    folder_id INTEGER NOT NULL,"
    "    path TEXT NOT NULL,"
    "    content_hash TEXT NOT NULL,"
    "    format TEXT NOT NULL,"
    "    mime_type TEXT,"
    "    modified_at INTEGER,"
    "    size INTEGER NOT NULL DEFAULT 0,"
    "    last_indexed INTEGER,"
    "    needs_reindex INTEGER NOT NULL DEFAULT 0,"
    "    UNIQUE(folder_id, path)"
    ");";

constexpr const char *kCreateChunksTable =
    "CREATE TABLE IF NOT EXISTS chunks ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    document_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,"
    "    ordinal INTEGER NOT NULL,"
    "    coordinates TEXT NOT NULL,"
    "    token_count INTEGER NOT NULL DEFAULT 0,"
    "    key_phrases TEXT,"
    "    topics TEXT,"
    "    readability REAL NOT NULL DEFAULT 0,"
    "    embedding BLOB NOT NULL,"
    "    UNIQUE(document_id, ordinal)"
    ");";

constexpr const char *kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_documents_folder ON documents(folder_id);"
    "CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id);";

constexpr const char *kDocumentColumns =
    "id, folder_id, path, content_hash, format, mime_type, modified_at, size,"
    " last_indexed, needs_reindex";

constexpr const char *kChunkColumns =
    "id, document_id, ordinal, coordinates, token_count, key_phrases, topics,"
    " readability, embedding";

void bindEmbedding(sqlite3_stmt *stmt, int index, const std::vector<float> &embedding)
{
    sqlite3_bind_blob(stmt, index, embedding.data(),
                      static_cast<int>(embedding.size() * sizeof(float)),
                      SQLITE_TRANSIENT);
}

std::vector<float> columnEmbedding(sqlite3_stmt *stmt, int index)
{
    const void *blob = sqlite3_column_blob(stmt, index);
    const int bytes = sqlite3_column_bytes(stmt, index);
    std::vector<float> embedding;
    if (!blob || bytes <= 0) {
        return embedding;
    }
    embedding.resize(static_cast<std::size_t>(bytes) / sizeof(float));
    std::memcpy(embedding.data(), blob, embedding.size() * sizeof(float));
    return embedding;
}

std::vector<std::string> columnStringList(sqlite3_stmt *stmt, int index)
{
    const nlohmann::json value = sqlite::columnJson(stmt, index);
    if (!value.is_array()) {
        return {};
    }
    std::vector<std::string> out;
    for (const auto &item : value) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

Document readDocument(sqlite3_stmt *stmt)
{
    Document document;
    document.id = sqlite3_column_int64(stmt, 0);
    document.folderId = sqlite3_column_int64(stmt, 1);
    document.path = sqlite::columnText(stmt, 2);
    document.contentHash = sqlite::columnText(stmt, 3);
    document.format = parseFormatString(sqlite::columnText(stmt, 4));
    document.mimeType = sqlite::columnText(stmt, 5);
    document.modifiedAt = sqlite::columnTimestamp(stmt, 6);
    document.size = sqlite3_column_int64(stmt, 7);
    document.lastIndexed = sqlite::columnTimestamp(stmt, 8);
    document.needsReindex = sqlite3_column_int(stmt, 9) != 0;
    return document;
}

ChunkRecord readChunk(sqlite3_stmt *stmt)
{
    ChunkRecord chunk;
    chunk.id = sqlite3_column_int64(stmt, 0);
    chunk.documentId = sqlite3_column_int64(stmt, 1);
    chunk.ordinal = sqlite3_column_int(stmt, 2);
    chunk.coordinates = sqlite::columnJson(stmt, 3).get<ExtractionCoordinates>();
    chunk.metadata.tokenCount = sqlite3_column_int(stmt, 4);
    chunk.metadata.keyPhrases = columnStringList(stmt, 5);
    chunk.metadata.topics = columnStringList(stmt, 6);
    chunk.metadata.readabilityScore = sqlite3_column_double(stmt, 7);
    chunk.embedding = columnEmbedding(stmt, 8);
    return chunk;
}

double cosineSimilarity(const std::vector<float> &a, const std::vector<float> &b)
{
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA == 0.0 || normB == 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

void insertChunk(sqlite3 *db, DocumentId documentId, int ordinal,
                 const ExtractionCoordinates &coordinates,
                 const SemanticMetadata &metadata,
                 const std::vector<float> &embedding)
{
    sqlite::Statement stmt(db,
        "INSERT INTO chunks (document_id, ordinal, coordinates, token_count,"
        " key_phrases, topics, readability, embedding)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
        " ON CONFLICT(document_id, ordinal) DO UPDATE SET"
        " coordinates = excluded.coordinates,"
        " token_count = excluded.token_count,"
        " key_phrases = excluded.key_phrases,"
        " topics = excluded.topics,"
        " readability = excluded.readability,"
        " embedding = excluded.embedding;");
    sqlite3_bind_int64(stmt.get(), 1, documentId);
    sqlite3_bind_int(stmt.get(), 2, ordinal);
    sqlite::bindJson(stmt.get(), 3, nlohmann::json(coordinates));
    sqlite3_bind_int(stmt.get(), 4, metadata.tokenCount);
    sqlite::bindJson(stmt.get(), 5, nlohmann::json(metadata.keyPhrases));
    sqlite::bindJson(stmt.get(), 6, nlohmann::json(metadata.topics));
    sqlite3_bind_double(stmt.get(), 7, metadata.readabilityScore);
    bindEmbedding(stmt.get(), 8, embedding);
    sqlite::stepDone(db, stmt.get(), "write chunk");
}

} // namespace

struct CoordinateStore::Impl {
    std::string path;
    sqlite3 *writer = nullptr;
    std::mutex writeMutex;

    std::vector<sqlite3 *> readers;
    std::vector<sqlite3 *> idleReaders;
    std::mutex readMutex;
    std::condition_variable readerAvailable;

    // Borrowed read connection, returned to the pool on destruction.
    class ReadLease {
    public:
        explicit ReadLease(Impl &owner)
            : m_owner(owner)
        {
            std::unique_lock<std::mutex> lock(m_owner.readMutex);
            m_owner.readerAvailable.wait(lock, [this] {
                return !m_owner.idleReaders.empty();
            });
            m_db = m_owner.idleReaders.back();
            m_owner.idleReaders.pop_back();
        }

        ~ReadLease()
        {
            {
                std::lock_guard<std::mutex> lock(m_owner.readMutex);
                m_owner.idleReaders.push_back(m_db);
            }
            m_owner.readerAvailable.notify_one();
        }

        ReadLease(const ReadLease &) = delete;
        ReadLease &operator=(const ReadLease &) = delete;

        sqlite3 *db() const
        {
            return m_db;
        }

    private:
        Impl &m_owner;
        sqlite3 *m_db = nullptr;
    };

    void ensureSchema()
    {
        sqlite::execOrThrow(writer, kCreateDocumentsTable);
        sqlite::execOrThrow(writer, kCreateChunksTable);
        sqlite::execOrThrow(writer, kCreateIndexes);
        sqlite::execOrThrow(writer, "PRAGMA user_version = 1;");
    }

    DocumentId upsertDocument(const Document &document)
    {
        sqlite::Statement stmt(writer,
            "INSERT INTO documents (folder_id, path, content_hash, format, mime_type,"
            " modified_at, size, last_indexed, needs_reindex)"
            " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"
            " ON CONFLICT(folder_id, path) DO UPDATE SET"
            " content_hash = excluded.content_hash,"
            " format = excluded.format,"
            " mime_type = excluded.mime_type,"
            " modified_at = excluded.modified_at,"
            " size = excluded.size,"
            " last_indexed = excluded.last_indexed,"
            " needs_reindex = excluded.needs_reindex;");
        sqlite3_bind_int64(stmt.get(), 1, document.folderId);
        sqlite::bindText(stmt.get(), 2, document.path);
        sqlite::bindText(stmt.get(), 3, document.contentHash);
        sqlite::bindText(stmt.get(), 4, toFormatString(document.format));
        sqlite::bindOptionalText(stmt.get(), 5, document.mimeType);
        sqlite::bindTimestamp(stmt.get(), 6, document.modifiedAt);
        sqlite3_bind_int64(stmt.get(), 7, document.size);
        sqlite::bindTimestamp(stmt.get(), 8, document.lastIndexed);
        sqlite3_bind_int(stmt.get(), 9, document.needsReindex ? 1 : 0);
        sqlite::stepDone(writer, stmt.get(), "write document");

        sqlite::Statement lookup(writer,
            "SELECT id FROM documents WHERE folder_id = ? AND path = ?;");
        sqlite3_bind_int64(lookup.get(), 1, document.folderId);
        sqlite::bindText(lookup.get(), 2, document.path);
        if (sqlite3_step(lookup.get()) != SQLITE_ROW) {
            throw StoreError("document vanished after upsert: " + document.path);
        }
        return sqlite3_column_int64(lookup.get(), 0);
    }
};

CoordinateStore::CoordinateStore(const std::string &databasePath, int readConnections)
    : impl(std::make_unique<Impl>())
{
    impl->path = databasePath;
    impl->writer = sqlite::openDatabase(databasePath);
    try {
        impl->ensureSchema();
        const int readerCount = std::max(1, readConnections);
        for (int i = 0; i < readerCount; ++i) {
            sqlite3 *reader = sqlite::openDatabase(databasePath);
            impl->readers.push_back(reader);
            impl->idleReaders.push_back(reader);
        }
    } catch (const StoreError &) {
        for (sqlite3 *reader : impl->readers) {
            sqlite::closeDatabase(reader);
        }
        sqlite::closeDatabase(impl->writer);
        throw;
    }

    FMLOG_INFO(QStringLiteral("CoordinateStore"),
               QStringLiteral("CoordinateStore::CoordinateStore"),
               QStringLiteral("store_opened"),
               QStringLiteral("daemon_start"),
               QStringLiteral("sqlite_wal"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"path", databasePath},
                               {"readers", impl->readers.size()}}));
}

CoordinateStore::~CoordinateStore()
{
    for (sqlite3 *reader : impl->readers) {
        sqlite::closeDatabase(reader);
    }
    sqlite::closeDatabase(impl->writer);
}

const std::string &CoordinateStore::databasePath() const
{
    return impl->path;
}

ChunkId CoordinateStore::putChunk(DocumentId documentId,
                                  int ordinal,
                                  const ExtractionCoordinates &coordinates,
                                  const SemanticMetadata &metadata,
                                  const std::vector<float> &embedding)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);
    insertChunk(impl->writer, documentId, ordinal, coordinates, metadata, embedding);

    sqlite::Statement lookup(impl->writer,
        "SELECT id FROM chunks WHERE document_id = ? AND ordinal = ?;");
    sqlite3_bind_int64(lookup.get(), 1, documentId);
    sqlite3_bind_int(lookup.get(), 2, ordinal);
    if (sqlite3_step(lookup.get()) != SQLITE_ROW) {
        throw StoreError("chunk vanished after upsert");
    }
    return sqlite3_column_int64(lookup.get(), 0);
}

DocumentId CoordinateStore::commitDocument(const Document &document,
                                           const std::vector<ChunkRecord> &chunks)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);
    sqlite::Transaction transaction(impl->writer);

    const DocumentId documentId = impl->upsertDocument(document);

    sqlite::Statement clear(impl->writer, "DELETE FROM chunks WHERE document_id = ?;");
    sqlite3_bind_int64(clear.get(), 1, documentId);
    sqlite::stepDone(impl->writer, clear.get(), "clear chunks");

    for (const ChunkRecord &chunk : chunks) {
        insertChunk(impl->writer, documentId, chunk.ordinal, chunk.coordinates,
                    chunk.metadata, chunk.embedding);
    }

    transaction.commit();

    FMLOG_DEBUG(QStringLiteral("CoordinateStore"),
                QStringLiteral("CoordinateStore::commitDocument"),
                QStringLiteral("document_committed"),
                QStringLiteral("indexing"),
                QStringLiteral("replace_chunks"),
                QString(),
                logging::currentCorrelationId(),
                (nlohmann::json{{"documentId", documentId},
                                {"path", document.path},
                                {"chunks", chunks.size()}}));
    return documentId;
}

std::vector<SimilarChunk> CoordinateStore::querySimilar(
    const std::vector<float> &queryEmbedding,
    int k,
    const SimilarityFilters &filters) const
{
    std::vector<SimilarChunk> results;
    if (k <= 0 || queryEmbedding.empty()) {
        return results;
    }

    Impl::ReadLease lease(*impl);
    sqlite::Statement stmt(lease.db(),
        "SELECT c.id, c.ordinal, c.coordinates, c.token_count, c.key_phrases,"
        " c.topics, c.readability, c.embedding,"
        " d.id, d.folder_id, d.path, d.format, d.mime_type, d.content_hash"
        " FROM chunks c JOIN documents d ON d.id = c.document_id"
        " WHERE (?1 IS NULL OR d.folder_id = ?1)"
        " AND (?2 IS NULL OR d.format = ?2);");
    if (filters.folderId.has_value()) {
        sqlite3_bind_int64(stmt.get(), 1, *filters.folderId);
    } else {
        sqlite3_bind_null(stmt.get(), 1);
    }
    if (filters.format.has_value()) {
        sqlite::bindText(stmt.get(), 2, toFormatString(*filters.format));
    } else {
        sqlite3_bind_null(stmt.get(), 2);
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const DocumentId documentId = sqlite3_column_int64(stmt.get(), 8);
        if (!filters.documentIds.empty()
            && std::find(filters.documentIds.begin(), filters.documentIds.end(),
                         documentId) == filters.documentIds.end()) {
            continue;
        }

        const std::vector<float> embedding = columnEmbedding(stmt.get(), 7);
        if (embedding.size() != queryEmbedding.size()) {
            continue;
        }
        const double score = cosineSimilarity(queryEmbedding, embedding);
        if (score < filters.minScore) {
            continue;
        }

        SimilarChunk match;
        match.chunkId = sqlite3_column_int64(stmt.get(), 0);
        match.ordinal = sqlite3_column_int(stmt.get(), 1);
        match.coordinates = sqlite::columnJson(stmt.get(), 2).get<ExtractionCoordinates>();
        match.metadata.tokenCount = sqlite3_column_int(stmt.get(), 3);
        match.metadata.keyPhrases = columnStringList(stmt.get(), 4);
        match.metadata.topics = columnStringList(stmt.get(), 5);
        match.metadata.readabilityScore = sqlite3_column_double(stmt.get(), 6);
        match.score = score;
        match.document.id = documentId;
        match.document.folderId = sqlite3_column_int64(stmt.get(), 9);
        match.document.path = sqlite::columnText(stmt.get(), 10);
        match.document.format = parseFormatString(sqlite::columnText(stmt.get(), 11));
        match.document.mimeType = sqlite::columnText(stmt.get(), 12);
        match.document.contentHash = sqlite::columnText(stmt.get(), 13);
        results.push_back(std::move(match));
    }

    std::sort(results.begin(), results.end(),
              [](const SimilarChunk &a, const SimilarChunk &b) {
                  if (a.score != b.score) {
                      return a.score > b.score;
                  }
                  return a.chunkId < b.chunkId;
              });
    if (results.size() > static_cast<std::size_t>(k)) {
        results.resize(static_cast<std::size_t>(k));
    }
    return results;
}

void CoordinateStore::deleteDocument(DocumentId documentId)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);
    sqlite::Statement stmt(impl->writer, "DELETE FROM documents WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, documentId);
    sqlite::stepDone(impl->writer, stmt.get(), "delete document");
}

void CoordinateStore::dropFolderPartition(FolderId folderId)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);
    sqlite::Transaction transaction(impl->writer);
    sqlite::Statement stmt(impl->writer, "DELETE FROM documents WHERE folder_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, folderId);
    sqlite::stepDone(impl->writer, stmt.get(), "drop folder partition");
    transaction.commit();

    FMLOG_INFO(QStringLiteral("CoordinateStore"),
               QStringLiteral("CoordinateStore::dropFolderPartition"),
               QStringLiteral("partition_dropped"),
               QStringLiteral("folder_cleanup"),
               QStringLiteral("cascade_delete"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"folderId", folderId}}));
}

std::vector<Document> CoordinateStore::listDocuments(FolderId folderId) const
{
    Impl::ReadLease lease(*impl);
    const std::string sql = std::string("SELECT ") + kDocumentColumns
        + " FROM documents WHERE folder_id = ? ORDER BY path ASC;";
    sqlite::Statement stmt(lease.db(), sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, folderId);

    std::vector<Document> documents;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        documents.push_back(readDocument(stmt.get()));
    }
    return documents;
}

std::optional<Document> CoordinateStore::document(DocumentId documentId) const
{
    Impl::ReadLease lease(*impl);
    const std::string sql = std::string("SELECT ") + kDocumentColumns
        + " FROM documents WHERE id = ?;";
    sqlite::Statement stmt(lease.db(), sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, documentId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readDocument(stmt.get());
}

int CoordinateStore::documentCount(FolderId folderId) const
{
    Impl::ReadLease lease(*impl);
    sqlite::Statement stmt(lease.db(), "SELECT COUNT(*) FROM documents WHERE folder_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, folderId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

int CoordinateStore::chunkCount(FolderId folderId) const
{
    Impl::ReadLease lease(*impl);
    sqlite::Statement stmt(lease.db(),
        "SELECT COUNT(*) FROM chunks c JOIN documents d ON d.id = c.document_id"
        " WHERE d.folder_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, folderId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

std::vector<ChunkRecord> CoordinateStore::chunksForDocument(DocumentId documentId) const
{
    Impl::ReadLease lease(*impl);
    const std::string sql = std::string("SELECT ") + kChunkColumns
        + " FROM chunks WHERE document_id = ? ORDER BY ordinal ASC;";
    sqlite::Statement stmt(lease.db(), sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, documentId);

    std::vector<ChunkRecord> chunks;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        chunks.push_back(readChunk(stmt.get()));
    }
    return chunks;
}

std::optional<ChunkRecord> CoordinateStore::chunk(ChunkId chunkId) const
{
    Impl::ReadLease lease(*impl);
    const std::string sql = std::string("SELECT ") + kChunkColumns
        + " FROM chunks WHERE id = ?;";
    sqlite::Statement stmt(lease.db(), sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, chunkId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readChunk(stmt.get());
}

void CoordinateStore::setNeedsReindex(DocumentId documentId, bool needsReindex)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);
    sqlite::Statement stmt(impl->writer,
        "UPDATE documents SET needs_reindex = ? WHERE id = ?;");
    sqlite3_bind_int(stmt.get(), 1, needsReindex ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 2, documentId);
    sqlite::stepDone(impl->writer, stmt.get(), "flag document");
}

bool CoordinateStore::integrityCheck() const
{
    Impl::ReadLease lease(*impl);
    sqlite::Statement stmt(lease.db(), "PRAGMA integrity_check;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return false;
    }
    return sqlite::columnText(stmt.get(), 0) == "ok";
}

} // namespace foldermind

#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include "common/models.hpp"
#include "store/coordinate_store.hpp"

using foldermind::ChunkRecord;
using foldermind::CoordinateStore;
using foldermind::Document;

class CoordinateStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();
    void testSchemaStoresNoText();
    void testCommitReplacesChunks();
    void testPutChunkUpserts();
    void testDeleteDocumentCascades();
    void testQuerySimilarOrderAndFilters();
    void testDimensionMismatchIgnored();
    void testDropFolderPartition();
    void testNeedsReindexFlag();
    void testReadersNeverSeeHalfReplacedDocument();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::string dbPath() const;
};

namespace {

Document makeDocument(foldermind::FolderId folderId, const std::string &path,
                      const std::string &hash = "h1")
{
    Document document;
    document.folderId = folderId;
    document.path = path;
    document.contentHash = hash;
    document.format = foldermind::DocumentFormat::Text;
    document.mimeType = "text/plain";
    document.size = 42;
    return document;
}

std::vector<ChunkRecord> makeChunks(int count, float seed)
{
    std::vector<ChunkRecord> chunks;
    for (int i = 0; i < count; ++i) {
        ChunkRecord chunk;
        chunk.ordinal = i;
        chunk.coordinates = foldermind::textCoordinates(i * 10 + 1, i * 10 + 10);
        chunk.metadata.tokenCount = 10 + i;
        chunk.metadata.keyPhrases = {"alpha beta"};
        chunk.metadata.topics = {"general"};
        chunk.metadata.readabilityScore = 55.0;
        chunk.embedding = {seed, static_cast<float>(i), 1.0f};
        chunks.push_back(chunk);
    }
    return chunks;
}

std::set<std::string> columnNames(const std::string &dbPath, const char *table)
{
    std::set<std::string> names;
    sqlite3 *db = nullptr;
    if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        sqlite3_close(db);
        return names;
    }
    const std::string sql = std::string("PRAGMA table_info(") + table + ");";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            names.insert(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1)));
        }
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return names;
}

} // namespace

void CoordinateStoreTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
}

void CoordinateStoreTests::cleanup()
{
    m_tempDir.reset();
}

std::string CoordinateStoreTests::dbPath() const
{
    return (m_tempDir->path() + QStringLiteral("/index.db")).toStdString();
}

void CoordinateStoreTests::testSchemaStoresNoText()
{
    {
        CoordinateStore store(dbPath());
        store.commitDocument(makeDocument(1, "/a/one.txt"), makeChunks(2, 0.5f));
    }

    const std::set<std::string> chunkColumns = columnNames(dbPath(), "chunks");
    QVERIFY(chunkColumns.count("coordinates") == 1);
    QVERIFY(chunkColumns.count("embedding") == 1);
    for (const char *forbidden : {"text", "content", "chunk_text", "snippet", "body"}) {
        QVERIFY2(chunkColumns.count(forbidden) == 0, forbidden);
    }
    const std::set<std::string> documentColumns = columnNames(dbPath(), "documents");
    QVERIFY(documentColumns.count("content") == 0);
    QVERIFY(documentColumns.count("text") == 0);
}

void CoordinateStoreTests::testCommitReplacesChunks()
{
    CoordinateStore store(dbPath());
    const auto id = store.commitDocument(makeDocument(1, "/a/one.txt"), makeChunks(3, 0.1f));
    QCOMPARE(store.chunksForDocument(id).size(), std::size_t(3));

    const auto again = store.commitDocument(makeDocument(1, "/a/one.txt", "h2"), makeChunks(2, 0.2f));
    QCOMPARE(again, id);
    const auto chunks = store.chunksForDocument(id);
    QCOMPARE(chunks.size(), std::size_t(2));
    QCOMPARE(chunks[0].ordinal, 0);
    QCOMPARE(chunks[1].ordinal, 1);
    QCOMPARE(chunks[0].embedding.front(), 0.2f);
    QVERIFY(chunks[1].coordinates == foldermind::textCoordinates(11, 20));
    QCOMPARE(QString::fromStdString(store.document(id)->contentHash), QStringLiteral("h2"));
    QCOMPARE(store.documentCount(1), 1);
}

void CoordinateStoreTests::testPutChunkUpserts()
{
    CoordinateStore store(dbPath());
    const auto documentId = store.commitDocument(makeDocument(1, "/a/one.txt"), {});

    foldermind::SemanticMetadata metadata;
    metadata.tokenCount = 5;
    const auto first = store.putChunk(documentId, 0, foldermind::textCoordinates(1, 2), metadata,
                                      {1.0f, 0.0f});
    const auto second = store.putChunk(documentId, 0, foldermind::textCoordinates(1, 3), metadata,
                                       {0.0f, 1.0f});
    QCOMPARE(first, second);

    const auto chunk = store.chunk(first);
    QVERIFY(chunk.has_value());
    QCOMPARE(chunk->coordinates.endLine, 3);
    QVERIFY(chunk->embedding == std::vector<float>({0.0f, 1.0f}));
}

void CoordinateStoreTests::testDeleteDocumentCascades()
{
    CoordinateStore store(dbPath());
    const auto id = store.commitDocument(makeDocument(1, "/a/one.txt"), makeChunks(4, 0.1f));
    const auto chunkId = store.chunksForDocument(id).front().id;

    store.deleteDocument(id);
    QVERIFY(!store.document(id).has_value());
    QVERIFY(!store.chunk(chunkId).has_value());
    QCOMPARE(store.chunkCount(1), 0);
}

void CoordinateStoreTests::testQuerySimilarOrderAndFilters()
{
    CoordinateStore store(dbPath());
    Document markdown = makeDocument(2, "/b/readme.md");
    markdown.format = foldermind::DocumentFormat::Markdown;

    std::vector<ChunkRecord> near = makeChunks(1, 0.0f);
    near[0].embedding = {1.0f, 0.0f, 0.0f};
    std::vector<ChunkRecord> far = makeChunks(1, 0.0f);
    far[0].embedding = {0.0f, 1.0f, 0.0f};
    std::vector<ChunkRecord> middle = makeChunks(1, 0.0f);
    middle[0].embedding = {1.0f, 1.0f, 0.0f};

    const auto nearId = store.commitDocument(makeDocument(1, "/a/near.txt"), near);
    store.commitDocument(makeDocument(1, "/a/far.txt"), far);
    const auto middleId = store.commitDocument(markdown, middle);

    const std::vector<float> query = {1.0f, 0.0f, 0.0f};
    auto results = store.querySimilar(query, 10);
    QCOMPARE(results.size(), std::size_t(3));
    QCOMPARE(results[0].document.id, nearId);
    QVERIFY(qFuzzyCompare(results[0].score, 1.0));
    QCOMPARE(results[1].document.id, middleId);
    QVERIFY(results[1].score > results[2].score);

    QCOMPARE(store.querySimilar(query, 1).size(), std::size_t(1));

    foldermind::SimilarityFilters byFolder;
    byFolder.folderId = 2;
    results = store.querySimilar(query, 10, byFolder);
    QCOMPARE(results.size(), std::size_t(1));
    QCOMPARE(QString::fromStdString(results[0].document.path), QStringLiteral("/b/readme.md"));

    foldermind::SimilarityFilters byFormat;
    byFormat.format = foldermind::DocumentFormat::Text;
    QCOMPARE(store.querySimilar(query, 10, byFormat).size(), std::size_t(2));

    foldermind::SimilarityFilters byScore;
    byScore.minScore = 0.5;
    QCOMPARE(store.querySimilar(query, 10, byScore).size(), std::size_t(2));

    foldermind::SimilarityFilters byDocument;
    byDocument.documentIds = {middleId};
    results = store.querySimilar(query, 10, byDocument);
    QCOMPARE(results.size(), std::size_t(1));
    QCOMPARE(results[0].document.id, middleId);
}

void CoordinateStoreTests::testDimensionMismatchIgnored()
{
    CoordinateStore store(dbPath());
    store.commitDocument(makeDocument(1, "/a/one.txt"), makeChunks(2, 0.3f));
    QVERIFY(store.querySimilar({1.0f, 0.0f}, 5).empty());
    QCOMPARE(store.querySimilar({1.0f, 0.0f, 0.0f}, 5).size(), std::size_t(2));
}

void CoordinateStoreTests::testDropFolderPartition()
{
    CoordinateStore store(dbPath());
    store.commitDocument(makeDocument(1, "/a/one.txt"), makeChunks(2, 0.1f));
    store.commitDocument(makeDocument(1, "/a/two.txt"), makeChunks(2, 0.1f));
    store.commitDocument(makeDocument(2, "/b/one.txt"), makeChunks(2, 0.1f));

    store.dropFolderPartition(1);
    QCOMPARE(store.documentCount(1), 0);
    QCOMPARE(store.chunkCount(1), 0);
    QCOMPARE(store.documentCount(2), 1);
    QCOMPARE(store.chunkCount(2), 2);
    QVERIFY(store.integrityCheck());
}

void CoordinateStoreTests::testNeedsReindexFlag()
{
    CoordinateStore store(dbPath());
    const auto id = store.commitDocument(makeDocument(1, "/a/one.txt"), makeChunks(1, 0.1f));
    QVERIFY(!store.document(id)->needsReindex);
    store.setNeedsReindex(id, true);
    QVERIFY(store.document(id)->needsReindex);
    QVERIFY(store.listDocuments(1).front().needsReindex);
}

void CoordinateStoreTests::testReadersNeverSeeHalfReplacedDocument()
{
    CoordinateStore store(dbPath(), 3);
    const auto id = store.commitDocument(makeDocument(1, "/a/one.txt"), makeChunks(4, 0.0f));

    std::atomic<bool> done{false};
    std::atomic<int> badReads{0};
    std::atomic<int> reads{0};

    std::thread writer([&]() {
        for (int round = 1; round <= 40; ++round) {
            const int count = (round % 2 == 0) ? 4 : 9;
            store.commitDocument(makeDocument(1, "/a/one.txt", std::to_string(round)),
                                 makeChunks(count, static_cast<float>(round)));
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            while (!done) {
                const auto chunks = store.chunksForDocument(id);
                ++reads;
                if (chunks.size() != 4 && chunks.size() != 9) {
                    ++badReads;
                    continue;
                }
                for (const auto &chunk : chunks) {
                    if (chunk.embedding.front() != chunks.front().embedding.front()) {
                        ++badReads;
                        break;
                    }
                }
            }
        });
    }

    writer.join();
    for (auto &reader : readers) {
        reader.join();
    }
    QCOMPARE(badReads.load(), 0);
    QVERIFY(reads.load() > 0);
}

QTEST_GUILESS_MAIN(CoordinateStoreTests)
#include "test_coordinate_store.moc"

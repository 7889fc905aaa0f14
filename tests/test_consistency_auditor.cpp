#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <memory>
#include <vector>

#include "daemon/indexing_pipeline.hpp"
#include "embedding/embedding_provider.hpp"
#include "extraction/consistency_auditor.hpp"
#include "extraction/text_reconstructor.hpp"
#include "store/coordinate_store.hpp"

using namespace foldermind;

class ConsistencyAuditorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testCleanFolderPasses();
    void testEditedDocumentIsFlagged();
    void testTruncatedDocumentIsFlagged();
    void testSampleSizeBoundsWork();
    void testSkipsDocumentsAwaitingReindex();
    void testEmbeddingsMatchTolerance();

private:
    QTemporaryDir m_homeDir;
    QByteArray m_prevHome;

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<CoordinateStore> m_store;
    std::unique_ptr<TextReconstructor> m_reconstructor;
    std::unique_ptr<DefaultEmbeddingProvider> m_provider;
    std::unique_ptr<ConsistencyAuditor> m_auditor;
    std::vector<DocumentId> m_flagged;
    MonitoredFolder m_folder;

    QString writeFile(const QString &name, const QByteArray &content) const;
    DocumentId index(const QString &path);
};

void ConsistencyAuditorTests::initTestCase()
{
    QVERIFY(m_homeDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_homeDir.path().toUtf8());
}

void ConsistencyAuditorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConsistencyAuditorTests::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = std::make_unique<CoordinateStore>(
        (m_dir->path() + QStringLiteral("/index.db")).toStdString());
    m_reconstructor = std::make_unique<TextReconstructor>();
    m_provider = std::make_unique<DefaultEmbeddingProvider>("http://127.0.0.1:1");
    m_flagged.clear();
    m_auditor = std::make_unique<ConsistencyAuditor>(
        *m_store, *m_reconstructor, *m_provider,
        [this](DocumentId documentId) { m_flagged.push_back(documentId); });

    m_folder = MonitoredFolder();
    m_folder.id = 7;
    m_folder.path = m_dir->path().toStdString();
}

void ConsistencyAuditorTests::cleanup()
{
    m_auditor.reset();
    m_provider.reset();
    m_reconstructor.reset();
    m_store.reset();
    m_dir.reset();
}

QString ConsistencyAuditorTests::writeFile(const QString &name, const QByteArray &content) const
{
    const QString path = m_dir->path() + QLatin1Char('/') + name;
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

DocumentId ConsistencyAuditorTests::index(const QString &path)
{
    IndexingPipeline pipeline(*m_store, *m_reconstructor, *m_provider, ChunkingOptions{16, 32});
    Document document;
    document.folderId = m_folder.id;
    document.path = path.toStdString();
    document.format = DocumentFormat::Text;
    document.mimeType = "text/plain";
    document.contentHash = TextReconstructor::contentHash(path.toStdString());
    return pipeline.indexDocument(document, "hash-32", makeCancelToken());
}

void ConsistencyAuditorTests::testCleanFolderPasses()
{
    index(writeFile(QStringLiteral("a.txt"), "alpha notes\nmore alpha notes\n"));
    index(writeFile(QStringLiteral("b.txt"), "beta notes\n"));

    const AuditReport report = m_auditor->auditFolder(m_folder, "hash-32", 0);
    QCOMPARE(report.folderId, m_folder.id);
    QVERIFY(report.chunksChecked >= 2);
    QVERIFY(report.flaggedDocuments.empty());
    QVERIFY(m_flagged.empty());
}

void ConsistencyAuditorTests::testEditedDocumentIsFlagged()
{
    const QString edited = writeFile(QStringLiteral("edited.txt"), "original sentence\n");
    const DocumentId editedId = index(edited);
    index(writeFile(QStringLiteral("stable.txt"), "untouched sentence\n"));

    writeFile(QStringLiteral("edited.txt"), "rewritten sentence\n");
    const AuditReport report = m_auditor->auditFolder(m_folder, "hash-32", 0);
    QVERIFY(report.flaggedDocuments == std::vector<DocumentId>{editedId});
    QVERIFY(m_flagged == std::vector<DocumentId>{editedId});
}

void ConsistencyAuditorTests::testTruncatedDocumentIsFlagged()
{
    QByteArray content;
    for (int i = 0; i < 40; ++i) {
        content += "row " + QByteArray::number(i) + " of the inventory list\n";
    }
    const QString path = writeFile(QStringLiteral("long.txt"), content);
    const DocumentId documentId = index(path);
    QVERIFY(m_store->chunksForDocument(documentId).size() > 2);

    writeFile(QStringLiteral("long.txt"), "row 0 of the inventory list\n");
    const AuditReport report = m_auditor->auditFolder(m_folder, "hash-32", 0);
    QCOMPARE(report.flaggedDocuments.size(), std::size_t(1));
    QCOMPARE(report.flaggedDocuments.front(), documentId);
    QCOMPARE(m_flagged.size(), std::size_t(1));
}

void ConsistencyAuditorTests::testSampleSizeBoundsWork()
{
    for (int i = 0; i < 6; ++i) {
        index(writeFile(QStringLiteral("doc-%1.txt").arg(i),
                        "document number " + QByteArray::number(i) + "\n"));
    }
    const AuditReport report = m_auditor->auditFolder(m_folder, "hash-32", 3);
    QCOMPARE(report.chunksChecked, 3);
}

void ConsistencyAuditorTests::testSkipsDocumentsAwaitingReindex()
{
    const QString path = writeFile(QStringLiteral("pending.txt"), "queued content\n");
    const DocumentId documentId = index(path);
    m_store->setNeedsReindex(documentId, true);
    QFile::remove(path);

    const AuditReport report = m_auditor->auditFolder(m_folder, "hash-32", 0);
    QCOMPARE(report.chunksChecked, 0);
    QVERIFY(m_flagged.empty());
}

void ConsistencyAuditorTests::testEmbeddingsMatchTolerance()
{
    const std::vector<float> a{0.5f, 0.25f};
    QVERIFY(ConsistencyAuditor::embeddingsMatch(a, {0.50001f, 0.25f}));
    QVERIFY(!ConsistencyAuditor::embeddingsMatch(a, {0.6f, 0.25f}));
    QVERIFY(!ConsistencyAuditor::embeddingsMatch(a, {0.5f}));
}

QTEST_GUILESS_MAIN(ConsistencyAuditorTests)
#include "test_consistency_auditor.moc"

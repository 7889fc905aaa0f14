#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <QElapsedTimer>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include "common/errors.hpp"
#include "daemon/folder_lifecycle.hpp"
#include "daemon/folder_scanner.hpp"
#include "embedding/hashing_embedding_backend.hpp"
#include "extraction/text_reconstructor.hpp"
#include "store/coordinate_store.hpp"
#include "store/daemon_state_store.hpp"

using namespace foldermind;

namespace {

// Hashing backend whose embed() can be held until the test opens the gate.
class GatedBackend : public EmbeddingBackend
{
public:
    std::string modelId() const override { return m_inner.modelId(); }
    int dimension() const override { return m_inner.dimension(); }

    std::vector<float> embed(const std::string &text) override
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            ++m_entered;
            m_changed.notify_all();
            m_changed.wait(lock, [this]() { return m_open; });
        }
        return m_inner.embed(text);
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = false;
    }

    void open()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_changed.notify_all();
    }

    int entered() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entered;
    }

private:
    HashingEmbeddingBackend m_inner{32};
    mutable std::mutex m_mutex;
    std::condition_variable m_changed;
    bool m_open = true;
    int m_entered = 0;
};

// Serves a hashing backend until switched into a broken native runtime.
class SwitchableProvider : public EmbeddingBackendProvider
{
public:
    std::shared_ptr<EmbeddingBackend> backendFor(const std::string &) override
    {
        if (failing) {
            throw EnvironmentError(EnvironmentCause::NativeVersionMismatch,
                                   "module was compiled against a different NODE_MODULE_VERSION");
        }
        return m_backend;
    }

    GatedBackend &gate() { return *m_backend; }

    std::atomic<bool> failing{false};

private:
    std::shared_ptr<GatedBackend> m_backend = std::make_shared<GatedBackend>();
};

} // namespace

class FolderLifecycleTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testLegalTransitions_data();
    void testLegalTransitions();
    void testAddFolderIndexesToActive();
    void testAddFolderIsIdempotent();
    void testAddFolderRejectsInvalidPath();
    void testEnvironmentFailurePreservesData();
    void testRetryAfterRemediation();
    void testDeletedFolderIsCleanedUpAfterRetries();
    void testRemoveFolderDropsEverything();
    void testRemoveFolderDuringIndexingDrainsJobs();
    void testEmptyFolderWaitsForContent();
    void testChangedAndVanishedDocuments();
    void testUnreadableDocumentIsNotTreatedAsVanished();
    void testRestoreFolders();

private:
    QTemporaryDir m_homeDir;
    QByteArray m_prevHome;

    std::unique_ptr<QTemporaryDir> m_dataDir;
    std::unique_ptr<DaemonStateStore> m_stateStore;
    std::unique_ptr<CoordinateStore> m_store;
    std::unique_ptr<TextReconstructor> m_reconstructor;
    std::unique_ptr<SwitchableProvider> m_provider;
    std::unique_ptr<FolderLifecycleOrchestrator> m_orchestrator;

    DaemonConfig testConfig() const;
    void createOrchestrator();
    QString makeFolder(const QString &name, int documents) const;
    static void writeDocument(const QString &path, const QByteArray &content);
    FolderState stateOf(FolderId folderId) const;
};

void FolderLifecycleTests::initTestCase()
{
    QVERIFY(m_homeDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_homeDir.path().toUtf8());
}

void FolderLifecycleTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void FolderLifecycleTests::init()
{
    m_dataDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dataDir->isValid());
    const DaemonConfig config = testConfig();
    m_stateStore = std::make_unique<DaemonStateStore>(config.stateDatabasePath());
    m_store = std::make_unique<CoordinateStore>(config.indexDatabasePath());
    m_reconstructor = std::make_unique<TextReconstructor>();
    m_provider = std::make_unique<SwitchableProvider>();
    createOrchestrator();
}

void FolderLifecycleTests::cleanup()
{
    if (m_provider) {
        m_provider->gate().open();
    }
    m_orchestrator.reset();
    m_provider.reset();
    m_reconstructor.reset();
    m_store.reset();
    m_stateStore.reset();
    m_dataDir.reset();
}

DaemonConfig FolderLifecycleTests::testConfig() const
{
    DaemonConfig config;
    config.dataDir = m_dataDir->path().toStdString();
    config.workerThreads = 2;
    config.defaultModelId = "hash-32";
    config.retryPolicy.maxAttempts = 2;
    config.retryPolicy.initialDelay = std::chrono::milliseconds(5);
    config.retryPolicy.maxDelay = std::chrono::milliseconds(20);
    config.watchDebounce = std::chrono::milliseconds(10);
    return config;
}

void FolderLifecycleTests::createOrchestrator()
{
    m_orchestrator.reset();
    m_orchestrator = std::make_unique<FolderLifecycleOrchestrator>(
        *m_stateStore, *m_store, *m_reconstructor, *m_provider, testConfig());
}

QString FolderLifecycleTests::makeFolder(const QString &name, int documents) const
{
    const QString root = m_dataDir->path() + QLatin1Char('/') + name;
    QDir().mkpath(root);
    for (int i = 0; i < documents; ++i) {
        writeDocument(root + QStringLiteral("/note-%1.txt").arg(i),
                      "Meeting note " + QByteArray::number(i)
                          + " about the storage migration and index rebuild.\n");
    }
    return root;
}

void FolderLifecycleTests::writeDocument(const QString &path, const QByteArray &content)
{
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
}

FolderState FolderLifecycleTests::stateOf(FolderId folderId) const
{
    const auto folder = m_orchestrator->folderStatus(folderId);
    return folder.has_value() ? folder->state : FolderState::Removed;
}

void FolderLifecycleTests::testLegalTransitions_data()
{
    QTest::addColumn<int>("from");
    QTest::addColumn<int>("to");
    QTest::addColumn<bool>("legal");

    auto row = [](const char *name, FolderState from, FolderState to, bool legal) {
        QTest::newRow(name) << static_cast<int>(from) << static_cast<int>(to) << legal;
    };
    row("pending->scanning", FolderState::Pending, FolderState::Scanning, true);
    row("scanning->indexing", FolderState::Scanning, FolderState::Indexing, true);
    row("indexing->active", FolderState::Indexing, FolderState::Active, true);
    row("active->scanning", FolderState::Active, FolderState::Scanning, true);
    row("scanning->active", FolderState::Scanning, FolderState::Active, true);
    row("indexing->error", FolderState::Indexing, FolderState::Error, true);
    row("error->scanning", FolderState::Error, FolderState::Scanning, true);
    row("error->removed", FolderState::Error, FolderState::Removed, true);
    row("active->removed", FolderState::Active, FolderState::Removed, true);
    row("pending->active", FolderState::Pending, FolderState::Active, false);
    row("active->indexing", FolderState::Active, FolderState::Indexing, false);
    row("indexing->removed", FolderState::Indexing, FolderState::Removed, false);
    row("active->pending", FolderState::Active, FolderState::Pending, false);
    row("removed->scanning", FolderState::Removed, FolderState::Scanning, false);
    row("removed->error", FolderState::Removed, FolderState::Error, false);
}

void FolderLifecycleTests::testLegalTransitions()
{
    QFETCH(int, from);
    QFETCH(int, to);
    QFETCH(bool, legal);
    QCOMPARE(FolderLifecycleOrchestrator::isLegalTransition(static_cast<FolderState>(from),
                                                            static_cast<FolderState>(to)),
             legal);
}

void FolderLifecycleTests::testAddFolderIndexesToActive()
{
    const QString root = makeFolder(QStringLiteral("notes"), 3);
    QSignalSpy spy(m_orchestrator.get(), &FolderLifecycleOrchestrator::folderStateChanged);

    const MonitoredFolder folder = m_orchestrator->addFolder(root.toStdString());
    QCOMPARE(folder.state, FolderState::Pending);
    QCOMPARE(QString::fromStdString(folder.config.embeddingModelId), QStringLiteral("hash-32"));

    QTRY_COMPARE(stateOf(folder.id), FolderState::Active);
    QCOMPARE(m_store->documentCount(folder.id), 3);
    QVERIFY(m_store->chunkCount(folder.id) >= 3);

    QStringList states;
    for (const QList<QVariant> &arguments : spy) {
        states << arguments.at(1).toString();
    }
    QCOMPARE(states.first(), QStringLiteral("pending"));
    QVERIFY(states.contains(QStringLiteral("indexing")));
    QCOMPARE(states.last(), QStringLiteral("active"));

    const auto persisted = m_stateStore->folder(folder.id);
    QVERIFY(persisted.has_value());
    QCOMPARE(persisted->state, FolderState::Active);
}

void FolderLifecycleTests::testAddFolderIsIdempotent()
{
    const QString root = makeFolder(QStringLiteral("twice"), 1);
    const MonitoredFolder first = m_orchestrator->addFolder(root.toStdString());
    const MonitoredFolder second =
        m_orchestrator->addFolder((root + QStringLiteral("/../twice")).toStdString());
    QCOMPARE(second.id, first.id);
    QCOMPARE(m_orchestrator->listFolders().size(), std::size_t(1));
    QTRY_COMPARE(stateOf(first.id), FolderState::Active);
}

void FolderLifecycleTests::testAddFolderRejectsInvalidPath()
{
    const QString missing = m_dataDir->path() + QStringLiteral("/does-not-exist");
    QVERIFY_THROWS_EXCEPTION(InvalidPathError, m_orchestrator->addFolder(missing.toStdString()));
    QVERIFY_THROWS_EXCEPTION(InvalidPathError, m_orchestrator->addFolder(std::string()));

    const QString root = makeFolder(QStringLiteral("plain"), 1);
    const QString file = root + QStringLiteral("/note-0.txt");
    QVERIFY_THROWS_EXCEPTION(InvalidPathError, m_orchestrator->addFolder(file.toStdString()));

    QVERIFY(m_orchestrator->listFolders().empty());
    QVERIFY(m_stateStore->loadFolders().empty());
}

void FolderLifecycleTests::testEnvironmentFailurePreservesData()
{
    const QString root = makeFolder(QStringLiteral("ten"), 10);
    const MonitoredFolder folder = m_orchestrator->addFolder(root.toStdString());
    QTRY_COMPARE(stateOf(folder.id), FolderState::Active);
    const int chunksBefore = m_store->chunkCount(folder.id);
    QCOMPARE(m_store->documentCount(folder.id), 10);

    m_provider->failing = true;
    writeDocument(root + QStringLiteral("/note-3.txt"), "Rewritten meeting note.\n");
    m_orchestrator->onFileSystemChange(folder.id);

    QTRY_COMPARE(stateOf(folder.id), FolderState::Error);
    QVERIFY(m_orchestrator->waitForIdle(5000));

    QCOMPARE(m_store->documentCount(folder.id), 10);
    QCOMPARE(m_store->chunkCount(folder.id), chunksBefore);

    const auto status = m_orchestrator->folderStatus(folder.id);
    QVERIFY(status->lastError.has_value());
    QVERIFY(status->lastError->environment);
    QCOMPARE(QString::fromStdString(status->lastError->kind),
             QStringLiteral("native_version_mismatch"));

    const auto persisted = m_stateStore->folder(folder.id);
    QVERIFY(persisted.has_value());
    QCOMPARE(persisted->state, FolderState::Error);
    QCOMPARE(QString::fromStdString(persisted->path), QString::fromStdString(folder.path));

    const std::vector<Notification> notifications = m_orchestrator->notifications();
    QCOMPARE(notifications.size(), std::size_t(1));
    QCOMPARE(notifications.front().folderId, folder.id);
    QVERIFY(notifications.front().dataIntact);
    QVERIFY(QString::fromStdString(notifications.front().message)
                .contains(QStringLiteral("Existing indexed data is intact")));
    QVERIFY(!notifications.front().remediation.empty());

    // No automatic retry for environment failures.
    QTest::qWait(100);
    QCOMPARE(stateOf(folder.id), FolderState::Error);
}

void FolderLifecycleTests::testRetryAfterRemediation()
{
    const QString root = makeFolder(QStringLiteral("retry"), 2);
    m_provider->failing = true;
    const MonitoredFolder folder = m_orchestrator->addFolder(root.toStdString());
    QTRY_COMPARE(stateOf(folder.id), FolderState::Error);
    QCOMPARE(m_orchestrator->notifications().size(), std::size_t(1));

    QVERIFY(!m_orchestrator->retryFolder(folder.id + 100));

    m_provider->failing = false;
    QVERIFY(m_orchestrator->retryFolder(folder.id));
    QTRY_COMPARE(stateOf(folder.id), FolderState::Active);
    QVERIFY(m_orchestrator->notifications().empty());
    QVERIFY(!m_orchestrator->folderStatus(folder.id)->lastError.has_value());
    QCOMPARE(m_store->documentCount(folder.id), 2);

    QVERIFY(!m_orchestrator->retryFolder(folder.id));
}

void FolderLifecycleTests::testDeletedFolderIsCleanedUpAfterRetries()
{
    const QString root = makeFolder(QStringLiteral("doomed"), 4);
    const MonitoredFolder folder = m_orchestrator->addFolder(root.toStdString());
    QTRY_COMPARE(stateOf(folder.id), FolderState::Active);
    QSignalSpy spy(m_orchestrator.get(), &FolderLifecycleOrchestrator::folderStateChanged);

    QVERIFY(QDir(root).removeRecursively());
    m_orchestrator->onFileSystemChange(folder.id);

    QTRY_VERIFY(!m_orchestrator->folderStatus(folder.id).has_value());
    QCOMPARE(m_store->documentCount(folder.id), 0);
    QCOMPARE(m_store->chunkCount(folder.id), 0);
    QVERIFY(!m_stateStore->folder(folder.id).has_value());
    QVERIFY(m_orchestrator->notifications().empty());

    QTRY_VERIFY(!spy.isEmpty());
    QCOMPARE(spy.last().at(1).toString(), QStringLiteral("removed"));
}

void FolderLifecycleTests::testRemoveFolderDropsEverything()
{
    const QString keep = makeFolder(QStringLiteral("keep"), 2);
    const QString drop = makeFolder(QStringLiteral("drop"), 3);
    const MonitoredFolder kept = m_orchestrator->addFolder(keep.toStdString());
    const MonitoredFolder dropped = m_orchestrator->addFolder(drop.toStdString());
    QTRY_COMPARE(stateOf(kept.id), FolderState::Active);
    QTRY_COMPARE(stateOf(dropped.id), FolderState::Active);

    QVERIFY(m_orchestrator->removeFolder(dropped.id));
    QVERIFY(!m_orchestrator->folderStatus(dropped.id).has_value());
    QCOMPARE(m_store->documentCount(dropped.id), 0);
    QVERIFY(!m_stateStore->folder(dropped.id).has_value());
    QVERIFY(QDir(drop).exists());

    QCOMPARE(m_store->documentCount(kept.id), 2);
    QCOMPARE(m_orchestrator->listFolders().size(), std::size_t(1));
    QVERIFY(!m_orchestrator->removeFolder(dropped.id));
}

void FolderLifecycleTests::testRemoveFolderDuringIndexingDrainsJobs()
{
    const QString root = makeFolder(QStringLiteral("busy"), 6);
    m_provider->gate().close();
    const MonitoredFolder folder = m_orchestrator->addFolder(root.toStdString());
    QTRY_VERIFY(m_provider->gate().entered() > 0);
    QCOMPARE(stateOf(folder.id), FolderState::Indexing);

    std::thread releaser([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        m_provider->gate().open();
    });
    QElapsedTimer elapsed;
    elapsed.start();
    const bool removed = m_orchestrator->removeFolder(folder.id);
    const qint64 waited = elapsed.elapsed();
    releaser.join();

    // removeFolder returns only once the blocked index job has drained.
    QVERIFY(removed);
    QVERIFY2(waited >= 100, qPrintable(QStringLiteral("returned after %1 ms").arg(waited)));
    QVERIFY(!m_orchestrator->folderStatus(folder.id).has_value());
    QVERIFY(!m_stateStore->folder(folder.id).has_value());
    QCOMPARE(m_store->documentCount(folder.id), 0);
    QCOMPARE(m_store->chunkCount(folder.id), 0);

    // Nothing from the cancelled job is committed afterwards.
    QVERIFY(m_orchestrator->waitForIdle(5000));
    QTest::qWait(100);
    QCOMPARE(m_store->documentCount(folder.id), 0);
    QCOMPARE(m_store->chunkCount(folder.id), 0);
    QVERIFY(m_orchestrator->listFolders().empty());
    QVERIFY(m_orchestrator->notifications().empty());
}

void FolderLifecycleTests::testEmptyFolderWaitsForContent()
{
    const QString root = makeFolder(QStringLiteral("empty"), 0);
    const MonitoredFolder folder = m_orchestrator->addFolder(root.toStdString());
    QTRY_COMPARE(stateOf(folder.id), FolderState::Error);
    const auto status = m_orchestrator->folderStatus(folder.id);
    QCOMPARE(QString::fromStdString(status->lastError->kind), QStringLiteral("empty_folder"));
    QVERIFY(!status->lastError->terminal);

    writeDocument(root + QStringLiteral("/first.txt"), "The first document arrives.\n");
    m_orchestrator->onFileSystemChange(folder.id);
    QTRY_COMPARE(stateOf(folder.id), FolderState::Active);
    QCOMPARE(m_store->documentCount(folder.id), 1);
}

void FolderLifecycleTests::testChangedAndVanishedDocuments()
{
    const QString root = makeFolder(QStringLiteral("churn"), 3);
    const MonitoredFolder folder = m_orchestrator->addFolder(root.toStdString());
    QTRY_COMPARE(stateOf(folder.id), FolderState::Active);

    QVERIFY(QFile::remove(root + QStringLiteral("/note-0.txt")));
    writeDocument(root + QStringLiteral("/note-9.txt"), "A brand new note.\n");
    m_orchestrator->onFileSystemChange(folder.id);

    QTRY_VERIFY(stateOf(folder.id) == FolderState::Active
                && m_store->documentCount(folder.id) == 3
                && m_orchestrator->waitForIdle(0));
    std::set<QString> names;
    for (const Document &document : m_store->listDocuments(folder.id)) {
        names.insert(QFileInfo(QString::fromStdString(document.path)).fileName());
    }
    QVERIFY(names.count(QStringLiteral("note-0.txt")) == 0);
    QVERIFY(names.count(QStringLiteral("note-9.txt")) == 1);
}

void FolderLifecycleTests::testUnreadableDocumentIsNotTreatedAsVanished()
{
    const QString root = makeFolder(QStringLiteral("locked"), 3);
    const MonitoredFolder folder = m_orchestrator->addFolder(root.toStdString());
    QTRY_COMPARE(stateOf(folder.id), FolderState::Active);
    QVERIFY(m_orchestrator->waitForIdle(5000));
    const int chunksBefore = m_store->chunkCount(folder.id);

    // note-0 is gone from the scan, note-1 is listed but could not be hashed.
    std::vector<Document> scanned;
    for (Document document : m_store->listDocuments(folder.id)) {
        const QString name = QFileInfo(QString::fromStdString(document.path)).fileName();
        if (name == QLatin1String("note-0.txt")) {
            continue;
        }
        if (name == QLatin1String("note-1.txt")) {
            document.contentHash.clear();
        }
        scanned.push_back(document);
    }
    QCOMPARE(scanned.size(), std::size_t(2));
    m_orchestrator->onScanComplete(folder.id, scanned);

    std::set<QString> names;
    for (const Document &document : m_store->listDocuments(folder.id)) {
        names.insert(QFileInfo(QString::fromStdString(document.path)).fileName());
    }
    QVERIFY(names.count(QStringLiteral("note-0.txt")) == 0);
    QVERIFY(names.count(QStringLiteral("note-1.txt")) == 1);
    QVERIFY(names.count(QStringLiteral("note-2.txt")) == 1);
    QVERIFY(m_store->chunkCount(folder.id) < chunksBefore);
    QCOMPARE(stateOf(folder.id), FolderState::Active);

    // The scanner lists a file it cannot read instead of dropping it.
    const QString locked = root + QStringLiteral("/note-2.txt");
    const QFileDevice::Permissions permissions = QFile::permissions(locked);
    QVERIFY(QFile::setPermissions(locked, QFileDevice::Permissions()));
    const bool enforced = TextReconstructor::contentHash(locked.toStdString()).empty();
    FolderScanner scanner(nullptr);
    const std::vector<Document> listed =
        scanner.scan(folder.id, folder.path, {}, makeCancelToken());
    QVERIFY(QFile::setPermissions(locked, permissions));
    if (!enforced) {
        QSKIP("file permissions are not enforced for this user");
    }
    bool found = false;
    for (const Document &document : listed) {
        if (QFileInfo(QString::fromStdString(document.path)).fileName()
            == QLatin1String("note-2.txt")) {
            found = true;
            QVERIFY(document.contentHash.empty());
        }
    }
    QVERIFY(found);
}

void FolderLifecycleTests::testRestoreFolders()
{
    const QString interrupted = makeFolder(QStringLiteral("interrupted"), 2);
    const QString broken = makeFolder(QStringLiteral("broken"), 1);

    MonitoredFolder indexing;
    indexing.path = QDir(interrupted).canonicalPath().toStdString();
    indexing.config.embeddingModelId = "hash-32";
    indexing.state = FolderState::Indexing;
    indexing.id = m_stateStore->insertFolder(indexing);

    MonitoredFolder environment;
    environment.path = QDir(broken).canonicalPath().toStdString();
    environment.config.embeddingModelId = "hash-32";
    environment.state = FolderState::Error;
    FolderErrorInfo error;
    error.kind = "library_load_failure";
    error.message = "cannot open shared object file";
    error.remediation = "Reinstall the backend.";
    error.environment = true;
    error.timestamp = std::chrono::system_clock::now();
    environment.lastError = error;
    environment.id = m_stateStore->insertFolder(environment);

    createOrchestrator();
    m_orchestrator->restoreFolders();

    QTRY_COMPARE(stateOf(indexing.id), FolderState::Active);
    QCOMPARE(m_store->documentCount(indexing.id), 2);

    QCOMPARE(stateOf(environment.id), FolderState::Error);
    const std::vector<Notification> notifications = m_orchestrator->notifications();
    QCOMPARE(notifications.size(), std::size_t(1));
    QCOMPARE(notifications.front().folderId, environment.id);
    QCOMPARE(m_store->documentCount(environment.id), 0);
}

QTEST_GUILESS_MAIN(FolderLifecycleTests)
#include "test_folder_lifecycle.moc"

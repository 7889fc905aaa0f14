#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <memory>

#include "store/daemon_state_store.hpp"

using namespace foldermind;

class StateStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();
    void testFolderRoundTrip();
    void testSaveFolderUpdatesInPlace();
    void testDeleteFolder();
    void testConnectionStateRoundTrip();
    void testMeta();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::string dbPath() const;
};

void StateStoreTests::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void StateStoreTests::cleanup()
{
    m_dir.reset();
}

std::string StateStoreTests::dbPath() const
{
    return (m_dir->path() + QStringLiteral("/state.db")).toStdString();
}

void StateStoreTests::testFolderRoundTrip()
{
    const auto indexedAt = std::chrono::system_clock::now() - std::chrono::hours(3);
    const auto failedAt = std::chrono::system_clock::now() - std::chrono::minutes(5);

    MonitoredFolder folder;
    folder.path = "/home/user/Research";
    folder.config.embeddingModelId = "ollama:nomic-embed-text";
    folder.config.exclusionPatterns = {"*.log", "node_modules"};
    folder.state = FolderState::Error;
    folder.lastIndexed = indexedAt;
    folder.retryAttempts = 3;
    FolderErrorInfo error;
    error.kind = "library_load_failure";
    error.message = "cannot open shared object file";
    error.remediation = "Reinstall the backend.";
    error.timestamp = failedAt;
    error.environment = true;
    error.terminal = false;
    folder.lastError = error;

    FolderId id = 0;
    {
        DaemonStateStore store(dbPath());
        id = store.insertFolder(folder);
        QVERIFY(id > 0);
    }

    DaemonStateStore reopened(dbPath());
    const auto loaded = reopened.folder(id);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->id, id);
    QCOMPARE(QString::fromStdString(loaded->path), QStringLiteral("/home/user/Research"));
    QCOMPARE(QString::fromStdString(loaded->config.embeddingModelId),
             QStringLiteral("ollama:nomic-embed-text"));
    QVERIFY(loaded->config.exclusionPatterns == folder.config.exclusionPatterns);
    QCOMPARE(loaded->state, FolderState::Error);
    QCOMPARE(loaded->retryAttempts, 3);
    QVERIFY(loaded->lastIndexed == indexedAt);
    QVERIFY(loaded->lastError.has_value());
    QCOMPARE(QString::fromStdString(loaded->lastError->kind), QStringLiteral("library_load_failure"));
    QCOMPARE(QString::fromStdString(loaded->lastError->remediation),
             QStringLiteral("Reinstall the backend."));
    QVERIFY(loaded->lastError->timestamp == failedAt);
    QVERIFY(loaded->lastError->environment);
    QVERIFY(!loaded->lastError->terminal);
    QCOMPARE(reopened.loadFolders().size(), std::size_t(1));
}

void StateStoreTests::testSaveFolderUpdatesInPlace()
{
    DaemonStateStore store(dbPath());
    MonitoredFolder folder;
    folder.path = "/data/a";
    folder.state = FolderState::Pending;
    folder.id = store.insertFolder(folder);

    folder.state = FolderState::Active;
    folder.lastError.reset();
    store.saveFolder(folder);

    const auto folders = store.loadFolders();
    QCOMPARE(folders.size(), std::size_t(1));
    QCOMPARE(folders.front().state, FolderState::Active);
    QVERIFY(!folders.front().lastError.has_value());
}

void StateStoreTests::testDeleteFolder()
{
    DaemonStateStore store(dbPath());
    MonitoredFolder first;
    first.path = "/data/a";
    MonitoredFolder second;
    second.path = "/data/b";
    const FolderId firstId = store.insertFolder(first);
    const FolderId secondId = store.insertFolder(second);
    QVERIFY(firstId != secondId);

    store.deleteFolder(firstId);
    QVERIFY(!store.folder(firstId).has_value());
    QVERIFY(store.folder(secondId).has_value());
}

void StateStoreTests::testConnectionStateRoundTrip()
{
    const auto when = std::chrono::system_clock::now();
    ClientConnectionState state;
    state.primaryClientId = "claude-desktop";
    state.knownClients["claude-desktop"] =
        KnownClient{"claude-desktop", TransportMode::Stdio, "http://127.0.0.1:3002/mcp"};
    state.knownClients["cursor"] =
        KnownClient{"cursor", TransportMode::Http, "http://127.0.0.1:3002/mcp"};
    const ConnectionConflict conflict{"cursor", "claude-desktop", when};
    state.lastConflict = conflict;
    state.conflictHistory = {conflict, conflict};

    {
        DaemonStateStore store(dbPath());
        store.saveConnectionState(state);
    }

    DaemonStateStore reopened(dbPath());
    const ClientConnectionState loaded = reopened.loadConnectionState();
    QCOMPARE(QString::fromStdString(loaded.primaryClientId.value_or("")),
             QStringLiteral("claude-desktop"));
    QCOMPARE(loaded.knownClients.size(), std::size_t(2));
    QCOMPARE(loaded.knownClients.at("cursor").mode, TransportMode::Http);
    QCOMPARE(loaded.knownClients.at("claude-desktop").mode, TransportMode::Stdio);
    QVERIFY(loaded.lastConflict.has_value());
    QCOMPARE(QString::fromStdString(loaded.lastConflict->requestingClientId),
             QStringLiteral("cursor"));
    QVERIFY(loaded.lastConflict->timestamp == when);
    QCOMPARE(loaded.conflictHistory.size(), std::size_t(2));

    state.primaryClientId.reset();
    reopened.saveConnectionState(state);
    QVERIFY(!reopened.loadConnectionState().primaryClientId.has_value());
}

void StateStoreTests::testMeta()
{
    DaemonStateStore store(dbPath());
    QVERIFY(!store.getMeta("schema_note").has_value());
    store.setMeta("schema_note", "first");
    store.setMeta("schema_note", "second");
    QCOMPARE(QString::fromStdString(store.getMeta("schema_note").value_or("")),
             QStringLiteral("second"));
}

QTEST_GUILESS_MAIN(StateStoreTests)
#include "test_state_store.moc"

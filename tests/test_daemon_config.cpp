#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "common/daemon_config.hpp"
#include "common/daemon_registry.hpp"

using namespace foldermind;

class DaemonConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();
    void testDefaults();
    void testMissingFileUsesDefaults();
    void testFileOverridesDefaults();
    void testEnvironmentOverridesFile();
    void testInvalidFileThrows();
    void testRetryDelays();
    void testLoggingSection();
    void testRegistryRoundTrip();
    void testRegistryMissingOrCorrupt();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeConfig(const QByteArray &content) const;
};

void DaemonConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void DaemonConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void DaemonConfigTests::cleanup()
{
    qunsetenv("FOLDERMIND_HTTP_PORT");
    qunsetenv("FOLDERMIND_DATA_DIR");
    qunsetenv("FOLDERMIND_DEFAULT_MODEL");
    qunsetenv("FOLDERMIND_LOG_LEVEL");
}

QString DaemonConfigTests::writeConfig(const QByteArray &content) const
{
    const QString path = m_tempDir.path() + QStringLiteral("/daemon.json");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

void DaemonConfigTests::testDefaults()
{
    const QString home = m_tempDir.path();
    QCOMPARE(QString::fromStdString(defaultDataDir()), home + QStringLiteral("/.local/share/foldermind"));
    QCOMPARE(QString::fromStdString(defaultConfigPath()),
             home + QStringLiteral("/.config/foldermind/daemon.json"));

    DaemonConfig config;
    config.dataDir = "/var/lib/foldermind";
    QCOMPARE(QString::fromStdString(config.fallbackAddress()),
             QStringLiteral("http://127.0.0.1:3002/mcp"));
    QCOMPARE(QString::fromStdString(config.indexDatabasePath()),
             QStringLiteral("/var/lib/foldermind/index.db"));
    QCOMPARE(QString::fromStdString(config.stateDatabasePath()),
             QStringLiteral("/var/lib/foldermind/state.db"));
    QCOMPARE(QString::fromStdString(config.registryPath()),
             QStringLiteral("/var/lib/foldermind/daemon.json"));
}

void DaemonConfigTests::testMissingFileUsesDefaults()
{
    const DaemonConfig config =
        loadDaemonConfig((m_tempDir.path() + QStringLiteral("/absent.json")).toStdString());
    QCOMPARE(config.httpPort, 3002);
    QCOMPARE(QString::fromStdString(config.defaultModelId), QStringLiteral("hash-384"));
    QCOMPARE(QString::fromStdString(config.dataDir), QString::fromStdString(defaultDataDir()));
    QCOMPARE(config.retryPolicy.maxAttempts, 5);
}

void DaemonConfigTests::testFileOverridesDefaults()
{
    const QString path = writeConfig(R"({
        "httpPort": 4100,
        "bindHost": "0.0.0.0",
        "workerThreads": 0,
        "defaultModel": "ollama:nomic-embed-text",
        "auditIntervalMs": 60000,
        "retry": {"maxAttempts": 2, "initialDelayMs": 50, "multiplier": 3},
        "chunking": {"targetTokens": 200, "maxTokens": 100}
    })");
    const DaemonConfig config = loadDaemonConfig(path.toStdString());
    QCOMPARE(config.httpPort, 4100);
    QCOMPARE(QString::fromStdString(config.bindHost), QStringLiteral("0.0.0.0"));
    QCOMPARE(config.workerThreads, 1);
    QCOMPARE(QString::fromStdString(config.defaultModelId), QStringLiteral("ollama:nomic-embed-text"));
    QCOMPARE(static_cast<int>(config.auditInterval.count()), 60000);
    QCOMPARE(config.retryPolicy.maxAttempts, 2);
    QCOMPARE(static_cast<int>(config.retryPolicy.initialDelay.count()), 50);
    QCOMPARE(config.retryPolicy.multiplier, 3.0);
    QCOMPARE(config.chunking.targetTokens, 200);
    QCOMPARE(config.chunking.maxTokens, 200);
    QCOMPARE(QString::fromStdString(config.fallbackAddress()),
             QStringLiteral("http://0.0.0.0:4100/mcp"));
}

void DaemonConfigTests::testEnvironmentOverridesFile()
{
    const QString path = writeConfig(R"({"httpPort": 4100, "defaultModel": "hash-128"})");
    qputenv("FOLDERMIND_HTTP_PORT", "4200");
    qputenv("FOLDERMIND_DATA_DIR", "/tmp/foldermind-env");
    qputenv("FOLDERMIND_DEFAULT_MODEL", "hash-64");

    const DaemonConfig config = loadDaemonConfig(path.toStdString());
    QCOMPARE(config.httpPort, 4200);
    QCOMPARE(QString::fromStdString(config.dataDir), QStringLiteral("/tmp/foldermind-env"));
    QCOMPARE(QString::fromStdString(config.defaultModelId), QStringLiteral("hash-64"));
}

void DaemonConfigTests::testInvalidFileThrows()
{
    const QString path = writeConfig("{ \"httpPort\": ");
    QVERIFY_THROWS_EXCEPTION(std::runtime_error, loadDaemonConfig(path.toStdString()));
}

void DaemonConfigTests::testLoggingSection()
{
    QString path = writeConfig(
        R"({"logging": {"level": "warn", "directory": "/tmp/fm-logs", "stderr": true}})");
    DaemonConfig config = loadDaemonConfig(path.toStdString());
    const logging::LogOptions options = logOptionsFor(config);
    QVERIFY(options.minimumLevel == logging::LogLevel::Warn);
    QCOMPARE(options.directory, QStringLiteral("/tmp/fm-logs"));
    QVERIFY(options.mirrorToStderr);

    qputenv("FOLDERMIND_LOG_LEVEL", "debug");
    config = loadDaemonConfig(path.toStdString());
    QVERIFY(logOptionsFor(config).minimumLevel == logging::LogLevel::Debug);

    qputenv("FOLDERMIND_LOG_LEVEL", "loud");
    QVERIFY_THROWS_EXCEPTION(std::runtime_error, loadDaemonConfig(path.toStdString()));
    qunsetenv("FOLDERMIND_LOG_LEVEL");

    path = writeConfig(R"({"logging": {"level": "chatty"}})");
    QVERIFY_THROWS_EXCEPTION(std::runtime_error, loadDaemonConfig(path.toStdString()));
}

void DaemonConfigTests::testRetryDelays()
{
    RetryPolicy policy;
    policy.initialDelay = std::chrono::milliseconds(250);
    policy.maxDelay = std::chrono::milliseconds(1500);
    QCOMPARE(static_cast<int>(policy.delayForAttempt(0).count()), 250);
    QCOMPARE(static_cast<int>(policy.delayForAttempt(1).count()), 250);
    QCOMPARE(static_cast<int>(policy.delayForAttempt(3).count()), 1000);
    QCOMPARE(static_cast<int>(policy.delayForAttempt(4).count()), 1500);
    QCOMPARE(static_cast<int>(policy.delayForAttempt(12).count()), 1500);
}

void DaemonConfigTests::testRegistryRoundTrip()
{
    const std::string path =
        (m_tempDir.path() + QStringLiteral("/run/daemon.json")).toStdString();
    DaemonRegistration registration;
    registration.pid = 4242;
    registration.host = "127.0.0.1";
    registration.port = 3999;
    registration.startedAt = std::chrono::system_clock::now();
    registration.version = "1.2.3";

    writeDaemonRegistration(path, registration);
    const auto loaded = readDaemonRegistration(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->pid, std::int64_t(4242));
    QCOMPARE(loaded->port, 3999);
    QCOMPARE(QString::fromStdString(loaded->version), QStringLiteral("1.2.3"));
    QCOMPARE(QString::fromStdString(loaded->baseUrl()), QStringLiteral("http://127.0.0.1:3999"));

    removeDaemonRegistration(path);
    QVERIFY(!readDaemonRegistration(path).has_value());
}

void DaemonConfigTests::testRegistryMissingOrCorrupt()
{
    const QString path = m_tempDir.path() + QStringLiteral("/corrupt-registry.json");
    QVERIFY(!readDaemonRegistration(path.toStdString()).has_value());

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("not json at all");
    file.close();
    QVERIFY(!readDaemonRegistration(path.toStdString()).has_value());
}

QTEST_GUILESS_MAIN(DaemonConfigTests)
#include "test_daemon_config.moc"

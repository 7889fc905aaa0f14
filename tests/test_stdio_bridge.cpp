#include <QtTest/QtTest>

#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QTcpServer>
#include <QTemporaryDir>
#include <QTextStream>
#include <QUrlQuery>

#include <memory>

#include <nlohmann/json.hpp>

#include "client/resilient_transport.hpp"
#include "daemon/mcp_handler.hpp"
#include "mcp/stdio_bridge.hpp"

using namespace foldermind;

namespace {

// Answers the channel request and echoes MCP calls back with the client id.
class FakeMcpDaemon
{
public:
    FakeMcpDaemon()
    {
        m_server.route(QStringLiteral("/api/v1/connection/request"),
                       [this](const QHttpServerRequest &) {
                           nlohmann::json body = {{"granted", grant}};
                           if (!grant) {
                               body["reason"] = "primary_held_by_other";
                               body["fallbackAddress"] = "http://127.0.0.1:3002/mcp";
                               body["primaryClientId"] = "claude-desktop";
                           }
                           return json(body, QHttpServerResponder::StatusCode::Ok);
                       });
        m_server.route(QStringLiteral("/mcp"), [this](const QHttpServerRequest &request) {
            ++mcpHits;
            lastClient = request.query().queryItemValue(QStringLiteral("client"));
            const nlohmann::json message =
                nlohmann::json::parse(request.body().toStdString(), nullptr, false);
            if (!message.contains("id")) {
                return QHttpServerResponse(QHttpServerResponder::StatusCode::Accepted);
            }
            if (message.value("method", "") == "explode") {
                return json({{"error", "internal_error"}, {"message", "boom"}},
                            QHttpServerResponder::StatusCode::InternalServerError);
            }
            return json(McpHandler::makeResult(message.at("id"),
                                               {{"echo", message.value("method", "")}}),
                        QHttpServerResponder::StatusCode::Ok);
        });
    }

    quint16 listen()
    {
        auto tcpServer = std::make_unique<QTcpServer>();
        if (!tcpServer->listen(QHostAddress::LocalHost, 0)) {
            return 0;
        }
        const quint16 port = tcpServer->serverPort();
        m_server.bind(tcpServer.release());
        return port;
    }

    bool grant = true;
    int mcpHits = 0;
    QString lastClient;

private:
    static QHttpServerResponse json(const nlohmann::json &body,
                                    QHttpServerResponder::StatusCode status)
    {
        return QHttpServerResponse(QByteArrayLiteral("application/json"),
                                   QByteArray::fromStdString(body.dump()), status);
    }

    QHttpServer m_server;
};

} // namespace

class StdioBridgeTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    void testGrantedBridgeForwards();
    void testNotificationsAndBlankLinesProduceNoOutput();
    void testParseErrorIsAnsweredLocally();
    void testDeniedBridgeRedirects();
    void testDaemonErrorBecomesJsonRpcError();
    void testRunProcessesStream();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::unique_ptr<FakeMcpDaemon> m_daemon;
    std::unique_ptr<ResilientTransport> m_transport;
};

void StdioBridgeTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void StdioBridgeTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void StdioBridgeTests::init()
{
    m_daemon = std::make_unique<FakeMcpDaemon>();
    const quint16 port = m_daemon->listen();
    QVERIFY(port != 0);

    ClientTransportOptions options;
    options.baseUrl = "http://127.0.0.1:" + std::to_string(port);
    options.autoStart = false;
    options.maxAttempts = 1;
    m_transport = std::make_unique<ResilientTransport>(options);
}

void StdioBridgeTests::cleanup()
{
    m_transport.reset();
    m_daemon.reset();
}

void StdioBridgeTests::testGrantedBridgeForwards()
{
    StdioBridge bridge(*m_transport, "claude desktop");
    QVERIFY(bridge.claimChannel());
    QVERIFY(bridge.granted());

    const std::optional<std::string> reply =
        bridge.handleLine(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    QVERIFY(reply.has_value());
    const nlohmann::json parsed = nlohmann::json::parse(*reply);
    QCOMPARE(parsed["id"].get<int>(), 1);
    QCOMPARE(QString::fromStdString(parsed["result"]["echo"].get<std::string>()),
             QStringLiteral("tools/list"));
    QCOMPARE(m_daemon->lastClient, QStringLiteral("claude desktop"));
}

void StdioBridgeTests::testNotificationsAndBlankLinesProduceNoOutput()
{
    StdioBridge bridge(*m_transport, "cursor");
    QVERIFY(bridge.claimChannel());

    QVERIFY(!bridge.handleLine("   ").has_value());
    QCOMPARE(m_daemon->mcpHits, 0);
    QVERIFY(!bridge.handleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")
                 .has_value());
    QCOMPARE(m_daemon->mcpHits, 1);
}

void StdioBridgeTests::testParseErrorIsAnsweredLocally()
{
    StdioBridge bridge(*m_transport, "cursor");
    QVERIFY(bridge.claimChannel());

    const std::optional<std::string> reply = bridge.handleLine("{\"jsonrpc\":");
    QVERIFY(reply.has_value());
    QCOMPARE(nlohmann::json::parse(*reply)["error"]["code"].get<int>(),
             McpHandler::kParseError);
    QCOMPARE(m_daemon->mcpHits, 0);
}

void StdioBridgeTests::testDeniedBridgeRedirects()
{
    m_daemon->grant = false;
    StdioBridge bridge(*m_transport, "cursor");
    QVERIFY(!bridge.claimChannel());
    QVERIFY(!bridge.granted());

    const std::optional<std::string> reply =
        bridge.handleLine(R"({"jsonrpc":"2.0","id":"a","method":"tools/list"})");
    QVERIFY(reply.has_value());
    const nlohmann::json parsed = nlohmann::json::parse(*reply);
    QCOMPARE(parsed["error"]["code"].get<int>(), McpHandler::kChannelDenied);
    QCOMPARE(QString::fromStdString(parsed["error"]["data"]["fallbackAddress"].get<std::string>()),
             QStringLiteral("http://127.0.0.1:3002/mcp"));
    QCOMPARE(QString::fromStdString(parsed["error"]["data"]["primaryClientId"].get<std::string>()),
             QStringLiteral("claude-desktop"));

    QVERIFY(!bridge.handleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")
                 .has_value());
    QCOMPARE(m_daemon->mcpHits, 0);
}

void StdioBridgeTests::testDaemonErrorBecomesJsonRpcError()
{
    StdioBridge bridge(*m_transport, "cursor");
    QVERIFY(bridge.claimChannel());

    const std::optional<std::string> reply =
        bridge.handleLine(R"({"jsonrpc":"2.0","id":9,"method":"explode"})");
    QVERIFY(reply.has_value());
    const nlohmann::json parsed = nlohmann::json::parse(*reply);
    QCOMPARE(parsed["id"].get<int>(), 9);
    QCOMPARE(parsed["error"]["code"].get<int>(), McpHandler::kInternalError);
    QCOMPARE(QString::fromStdString(parsed["error"]["message"].get<std::string>()),
             QStringLiteral("boom"));
}

void StdioBridgeTests::testRunProcessesStream()
{
    StdioBridge bridge(*m_transport, "cursor");
    QVERIFY(bridge.claimChannel());

    QByteArray input = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
                       "\n"
                       "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
                       "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n";
    QTextStream in(&input, QIODevice::ReadOnly);
    QString output;
    QTextStream out(&output, QIODevice::WriteOnly);

    QCOMPARE(bridge.run(in, out), 0);
    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    QCOMPARE(lines.size(), 2);
    QCOMPARE(nlohmann::json::parse(lines.at(0).toStdString())["id"].get<int>(), 1);
    QCOMPARE(nlohmann::json::parse(lines.at(1).toStdString())["id"].get<int>(), 2);
}

QTEST_GUILESS_MAIN(StdioBridgeTests)
#include "test_stdio_bridge.moc"

#include <cstdio>

#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>

#include <nlohmann/json.hpp>

#include "client/resilient_transport.hpp"
#include "common/logging.hpp"
#include "mcp/stdio_bridge.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("foldermind-mcp"));

    bool trace = qEnvironmentVariableIntValue("FOLDERMIND_TRACE") == 1;
    std::string clientId = "stdio";
    foldermind::ClientTransportOptions options;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
        } else if (arg == QStringLiteral("--client") && i + 1 < argc) {
            clientId = argv[++i];
        } else if (arg == QStringLiteral("--url") && i + 1 < argc) {
            options.baseUrl = argv[++i];
        } else if (arg == QStringLiteral("--no-autostart")) {
            options.autoStart = false;
        }
    }
    foldermind::logging::LogOptions logOptions;
    if (const auto level = foldermind::logging::parseLogLevel(
            qEnvironmentVariable("FOLDERMIND_LOG_LEVEL"))) {
        logOptions.minimumLevel = *level;
    }
    foldermind::logging::initLogging(QStringLiteral("foldermind-mcp"), trace, logOptions);

    QTextStream in(stdin);
    QTextStream out(stdout);

    foldermind::ResilientTransport transport(options);
    foldermind::StdioBridge bridge(transport, clientId);
    try {
        bridge.claimChannel();
    } catch (const std::exception &error) {
        FMLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("bridge_start_failed"),
                    QString::fromStdString(error.what()),
                    QStringLiteral("claim_channel"),
                    QString::fromStdString(clientId),
                    QString(),
                    nlohmann::json::object());
        qCritical() << "Foldermind bridge: cannot reach daemon:" << error.what();
        return 1;
    }

    return bridge.run(in, out);
}

#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/daemon_config.hpp"
#include "common/logging.hpp"
#include "daemon/foldermind_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("foldermind-daemon"));
    qInfo() << "Foldermind daemon starting...";

    bool trace = qEnvironmentVariableIntValue("FOLDERMIND_TRACE") == 1;
    std::string configPath = foldermind::defaultConfigPath();
    int portOverride = -1;
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
        } else if (arg == QStringLiteral("--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == QStringLiteral("--port") && i + 1 < argc) {
            portOverride = QString::fromLocal8Bit(argv[++i]).toInt();
        }
    }
    foldermind::logging::initLogging(QStringLiteral("foldermind-daemon"), trace);

    foldermind::DaemonConfig config;
    try {
        config = foldermind::loadDaemonConfig(configPath);
    } catch (const std::exception &error) {
        qCritical() << "Foldermind: invalid configuration:" << error.what();
        return 2;
    }
    if (portOverride >= 0) {
        config.httpPort = portOverride;
    }
    foldermind::logging::initLogging(QStringLiteral("foldermind-daemon"), trace,
                                     foldermind::logOptionsFor(config));

    FMLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("load_config"),
               foldermind::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"config", configPath}, {"port", config.httpPort}}));

    try {
        // The daemon lives for the lifetime of the process.
        foldermind::FoldermindDaemon daemon(config);
        if (!daemon.start()) {
            qCritical() << "Foldermind: could not bind" << QString::fromStdString(config.bindHost)
                        << config.httpPort;
            return 1;
        }
        QObject::connect(&app, &QCoreApplication::aboutToQuit, &daemon,
                         [&daemon]() { daemon.stop(); });
        return app.exec();
    } catch (const std::exception &error) {
        qCritical() << "Foldermind: daemon failed to start:" << error.what();
        return 1;
    }
}

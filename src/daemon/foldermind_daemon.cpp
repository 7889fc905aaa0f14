#include "daemon/foldermind_daemon.hpp"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QHostAddress>

#include "common/daemon_registry.hpp"
#include "common/foldermind_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "daemon/api_router.hpp"
#include "daemon/client_config_writer.hpp"
#include "daemon/connection_arbiter.hpp"
#include "daemon/folder_lifecycle.hpp"
#include "daemon/http_api_server.hpp"
#include "daemon/mcp_handler.hpp"
#include "daemon/search_service.hpp"
#include "embedding/embedding_provider.hpp"
#include "extraction/consistency_auditor.hpp"
#include "extraction/text_reconstructor.hpp"
#include "store/coordinate_store.hpp"
#include "store/daemon_state_store.hpp"

namespace foldermind {

FoldermindDaemon::FoldermindDaemon(DaemonConfig config, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
{
    if (m_config.dataDir.empty()) {
        m_config.dataDir = defaultDataDir();
    }
    if (m_config.bridgeExecutable.empty()) {
        m_config.bridgeExecutable = locateBridgeExecutable().toStdString();
    }

    m_store = std::make_unique<CoordinateStore>(m_config.indexDatabasePath());
    m_stateStore = std::make_unique<DaemonStateStore>(m_config.stateDatabasePath());
    m_reconstructor = std::make_unique<TextReconstructor>();
    m_embeddings = std::make_unique<DefaultEmbeddingProvider>(m_config.ollamaUrl);

    if (!m_store->integrityCheck()) {
        qWarning() << "Foldermind: SQLite integrity check failed for"
                   << QString::fromStdString(m_config.indexDatabasePath());
        m_auditEnabled = false;
    }

    m_orchestrator = std::make_unique<FolderLifecycleOrchestrator>(
        *m_stateStore, *m_store, *m_reconstructor, *m_embeddings, m_config);

    FolderLifecycleOrchestrator *orchestrator = m_orchestrator.get();
    m_search = std::make_unique<SearchService>(
        *m_store, *m_reconstructor, *m_embeddings,
        [orchestrator]() { return orchestrator->listFolders(); },
        [orchestrator](DocumentId documentId) { orchestrator->flagDocumentForReindex(documentId); },
        m_config.defaultModelId);
    m_auditor = std::make_unique<ConsistencyAuditor>(
        *m_store, *m_reconstructor, *m_embeddings,
        [orchestrator](DocumentId documentId) { orchestrator->flagDocumentForReindex(documentId); });

    m_configWriter = std::make_unique<JsonClientConfigWriter>(QDir::homePath().toStdString(),
                                                              m_config.bridgeExecutable);
    m_arbiter = std::make_unique<ConnectionArbiter>(*m_stateStore, *m_configWriter,
                                                    m_config.fallbackAddress());
    m_mcp = std::make_unique<McpHandler>(*m_orchestrator, *m_search);
    m_router = std::make_unique<ApiRouter>(*m_orchestrator, *m_search, *m_arbiter, *m_mcp,
                                           *m_store, [this]() { return serverInfo(); });
    m_httpServer = std::make_unique<HttpApiServer>(*m_router);
    m_auditPool.setMaxThreadCount(1);

    connect(m_orchestrator.get(), &FolderLifecycleOrchestrator::notificationRaised,
            this, [](qint64 folderId, const QString &message) {
                qWarning().noquote() << "Foldermind: folder" << folderId << message;
            });
}

FoldermindDaemon::~FoldermindDaemon()
{
    stop();
}

bool FoldermindDaemon::start()
{
    m_startedAt = std::chrono::system_clock::now();
    qInfo() << "Foldermind: daemon starting (version" << FOLDERMIND_VERSION << ")";

    const QHostAddress address(QString::fromStdString(m_config.bindHost));
    if (!m_httpServer->start(address, static_cast<quint16>(m_config.httpPort))) {
        return false;
    }

    DaemonRegistration registration;
    registration.pid = QCoreApplication::applicationPid();
    registration.host = m_config.bindHost;
    registration.port = m_httpServer->serverPort();
    registration.startedAt = m_startedAt;
    registration.version = FOLDERMIND_VERSION;
    try {
        writeDaemonRegistration(m_config.registryPath(), registration);
        m_registered = true;
    } catch (const std::exception &error) {
        FMLOG_WARN(QStringLiteral("FoldermindDaemon"),
                   QStringLiteral("FoldermindDaemon::start"),
                   QStringLiteral("registry_write_failed"),
                   QString::fromStdString(error.what()),
                   QStringLiteral("continue_without_registry"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_config.registryPath()}}));
    }

    m_orchestrator->restoreFolders();

    if (m_auditEnabled && m_config.auditInterval.count() > 0) {
        m_auditTimer.setInterval(m_config.auditInterval);
        connect(&m_auditTimer, &QTimer::timeout, this, &FoldermindDaemon::runAuditCycle);
        m_auditTimer.start();
    }

    FMLOG_INFO(QStringLiteral("FoldermindDaemon"),
               QStringLiteral("FoldermindDaemon::start"),
               QStringLiteral("daemon_started"),
               QStringLiteral("process_start"),
               QStringLiteral("restore_and_listen"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"host", m_config.bindHost},
                               {"port", m_httpServer->serverPort()},
                               {"dataDir", m_config.dataDir},
                               {"folders", m_orchestrator->listFolders().size()}}));
    return true;
}

void FoldermindDaemon::stop()
{
    m_auditTimer.stop();
    m_auditPool.waitForDone();
    if (m_orchestrator) {
        m_orchestrator->shutdown();
    }
    if (m_registered) {
        removeDaemonRegistration(m_config.registryPath());
        m_registered = false;
    }
}

FolderLifecycleOrchestrator &FoldermindDaemon::orchestrator()
{
    return *m_orchestrator;
}

quint16 FoldermindDaemon::serverPort() const
{
    return m_httpServer->serverPort();
}

void FoldermindDaemon::runAuditCycle()
{
    if (m_auditRunning.exchange(true)) {
        return;
    }

    std::vector<MonitoredFolder> folders;
    for (const MonitoredFolder &folder : m_orchestrator->listFolders()) {
        if (folder.state == FolderState::Active) {
            folders.push_back(folder);
        }
    }

    const std::string defaultModel = m_config.defaultModelId;
    const int sampleSize = m_config.auditSampleSize;
    ConsistencyAuditor *auditor = m_auditor.get();
    m_auditPool.start([this, auditor, folders, defaultModel, sampleSize]() {
        logging::CorrelationScope corrScope(QStringLiteral("audit"));
        for (const MonitoredFolder &folder : folders) {
            const std::string modelId = folder.config.embeddingModelId.empty()
                ? defaultModel
                : folder.config.embeddingModelId;
            try {
                auditor->auditFolder(folder, modelId, sampleSize);
            } catch (const std::exception &error) {
                FMLOG_WARN(QStringLiteral("FoldermindDaemon"),
                           QStringLiteral("FoldermindDaemon::runAuditCycle"),
                           QStringLiteral("audit_failed"),
                           QString::fromStdString(error.what()),
                           QStringLiteral("skip_folder"),
                           QString(),
                           logging::currentCorrelationId(),
                           (nlohmann::json{{"folderId", folder.id}}));
            }
        }
        m_auditRunning = false;
    });
}

nlohmann::json FoldermindDaemon::serverInfo() const
{
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - m_startedAt);
    return nlohmann::json{
        {"name", "foldermind"},
        {"version", FOLDERMIND_VERSION},
        {"pid", QCoreApplication::applicationPid()},
        {"host", m_config.bindHost},
        {"port", m_httpServer->serverPort()},
        {"fallbackAddress", m_config.fallbackAddress()},
        {"dataDir", m_config.dataDir},
        {"startedAt", toIso8601Utc(m_startedAt)},
        {"uptimeSeconds", uptime.count()},
        {"defaultModel", m_config.defaultModelId},
        {"folders", m_orchestrator->listFolders().size()}
    };
}

} // namespace foldermind

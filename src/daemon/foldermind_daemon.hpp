#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include <QObject>
#include <QThreadPool>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/daemon_config.hpp"

namespace foldermind {

class ApiRouter;
class ConnectionArbiter;
class ConsistencyAuditor;
class CoordinateStore;
class DaemonStateStore;
class DefaultEmbeddingProvider;
class FolderLifecycleOrchestrator;
class HttpApiServer;
class JsonClientConfigWriter;
class McpHandler;
class SearchService;
class TextReconstructor;

/**
 * FoldermindDaemon wires the stores, the folder orchestrator, the search and
 * audit services, the connection arbiter and the HTTP fallback channel.
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class FoldermindDaemon : public QObject
{
    Q_OBJECT
public:
    explicit FoldermindDaemon(DaemonConfig config, QObject *parent = nullptr);
    ~FoldermindDaemon() override;

    // Opens the stores, restores folders, starts the HTTP server and writes
    // the registry file. Returns false when the port cannot be bound.
    bool start();
    void stop();

    FolderLifecycleOrchestrator &orchestrator();
    quint16 serverPort() const;

private slots:
    void runAuditCycle();

private:
    nlohmann::json serverInfo() const;

    DaemonConfig m_config;
    std::chrono::system_clock::time_point m_startedAt;

    std::unique_ptr<CoordinateStore> m_store;
    std::unique_ptr<DaemonStateStore> m_stateStore;
    std::unique_ptr<TextReconstructor> m_reconstructor;
    std::unique_ptr<DefaultEmbeddingProvider> m_embeddings;
    std::unique_ptr<FolderLifecycleOrchestrator> m_orchestrator;
    std::unique_ptr<SearchService> m_search;
    std::unique_ptr<ConsistencyAuditor> m_auditor;
    std::unique_ptr<JsonClientConfigWriter> m_configWriter;
    std::unique_ptr<ConnectionArbiter> m_arbiter;
    std::unique_ptr<McpHandler> m_mcp;
    std::unique_ptr<ApiRouter> m_router;
    std::unique_ptr<HttpApiServer> m_httpServer;

    QTimer m_auditTimer;
    QThreadPool m_auditPool;
    std::atomic<bool> m_auditRunning{false};
    bool m_auditEnabled = true;
    bool m_registered = false;
};

} // namespace foldermind

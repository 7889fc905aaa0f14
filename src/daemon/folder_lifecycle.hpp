#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <QFileSystemWatcher>
#include <QObject>
#include <QThreadPool>

#include "common/daemon_config.hpp"
#include "common/models.hpp"
#include "daemon/cancel_token.hpp"
#include "daemon/failure_classifier.hpp"
#include "daemon/folder_scanner.hpp"
#include "daemon/indexing_pipeline.hpp"
#include "store/coordinate_store.hpp"
#include "store/daemon_state_store.hpp"

namespace foldermind {

/**
 * FolderLifecycleOrchestrator owns every monitored folder and its state
 * machine:
 *
 *   pending -> scanning -> indexing -> active
 *   active <-> scanning            (file-system change)
 *   any -> error                   (classified failure)
 *   error -> scanning              (retry / remediation)
 *   active|error -> removed        (explicit removal, terminal path loss)
 *
 * Scan and index jobs run on a bounded QThreadPool, one job chain per folder.
 * Transitions for one folder are serialized by that folder's mutex. Failures
 * are classified once at the job boundary and the resulting RecoveryPlan
 * decides whether indexed data is preserved, retried or cleaned up.
 *
 * The object must live on a thread with a running event loop: file watchers
 * and retry timers are posted to it.
 */
class FolderLifecycleOrchestrator : public QObject
{
    Q_OBJECT
public:
    FolderLifecycleOrchestrator(DaemonStateStore &stateStore,
                                CoordinateStore &store,
                                const TextReconstructor &reconstructor,
                                EmbeddingBackendProvider &embeddings,
                                const DaemonConfig &config,
                                QObject *parent = nullptr);
    ~FolderLifecycleOrchestrator() override;

    // Throws InvalidPathError when the path is missing, not a directory or
    // not readable. Returns the existing folder for an already-known path.
    MonitoredFolder addFolder(const std::string &path, FolderConfig config = {});

    void onScanComplete(FolderId folderId, const std::vector<Document> &documents);
    void onIndexingFailure(FolderId folderId, const RawFailure &failure);

    // Cancels in-flight work, waits for it, then drops the store partition and
    // the configuration entry. Returns false for an unknown id.
    bool removeFolder(FolderId folderId);

    // error -> scanning with a fresh retry budget.
    bool retryFolder(FolderId folderId);
    void onFileSystemChange(FolderId folderId);

    // Reloads persisted folders on daemon start.
    void restoreFolders();

    std::vector<MonitoredFolder> listFolders() const;
    std::optional<MonitoredFolder> folderStatus(FolderId folderId) const;
    std::vector<Notification> notifications() const;

    // Marks a document stale and schedules a rescan of its folder.
    void flagDocumentForReindex(DocumentId documentId);

    // Waits for queued and running jobs. Returns false on timeout.
    bool waitForIdle(int msecs = -1);
    void shutdown();

    static bool isLegalTransition(FolderState from, FolderState to);

signals:
    void folderStateChanged(qint64 folderId, const QString &state);
    void notificationRaised(qint64 folderId, const QString &message);

private:
    struct FolderSlot {
        std::mutex mutex;
        MonitoredFolder folder;
        CancelToken cancel = makeCancelToken();
        std::uint64_t generation = 0;
        std::uint64_t retryTicket = 0;
        bool rescanPending = false;
        // Guarded by m_jobsMutex.
        int inFlight = 0;
    };
    using SlotPtr = std::shared_ptr<FolderSlot>;

    SlotPtr findSlot(FolderId folderId) const;
    SlotPtr findSlotForPath(const QString &path) const;

    // Caller holds slot.mutex. Returns false and logs when illegal.
    bool transitionLocked(FolderSlot &slot, FolderState to);
    void persistLocked(const FolderSlot &slot);
    bool isCurrentLocked(const FolderSlot &slot, std::uint64_t generation) const;
    void releaseTransientLocked(FolderSlot &slot);

    void scheduleScan(const SlotPtr &slot);
    void submitJob(const SlotPtr &slot, std::function<void()> job);
    void runScanJob(const SlotPtr &slot, std::uint64_t generation, const CancelToken &cancel);
    void runIndexJob(const SlotPtr &slot, std::uint64_t generation, const CancelToken &cancel,
                     const std::vector<Document> &work);
    void finishIndexing(const SlotPtr &slot, std::uint64_t generation);
    void markActive(const SlotPtr &slot, std::uint64_t generation);
    void waitForJobs(const SlotPtr &slot);

    void scheduleRetry(FolderId folderId, std::uint64_t ticket, std::chrono::milliseconds delay);
    void fireRetry(FolderId folderId, std::uint64_t ticket);
    bool performCleanup(FolderId folderId, const QString &reason);

    // Classified exactly once by the caller; this only branches on the plan.
    void handleFailure(FolderId folderId, const FailureClassification &classification,
                       const std::string &message);

    void raiseNotification(const MonitoredFolder &folder, const std::string &message,
                           const std::string &remediation);
    void clearNotification(FolderId folderId);

    void postToOwner(std::function<void()> fn);
    void watchFolder(FolderId folderId);
    void unwatchFolder(FolderId folderId);
    void onWatchedPathChanged(const QString &path);

    void emitState(FolderId folderId, FolderState state);

    DaemonStateStore &m_stateStore;
    CoordinateStore &m_store;
    const TextReconstructor &m_reconstructor;
    DaemonConfig m_config;
    FolderScanner m_scanner;
    IndexingPipeline m_pipeline;

    mutable std::mutex m_mutex;
    std::map<FolderId, SlotPtr> m_slots;

    std::mutex m_jobsMutex;
    std::condition_variable m_jobsDone;

    mutable std::mutex m_notificationsMutex;
    std::map<FolderId, Notification> m_notifications;

    QThreadPool m_pool;
    QFileSystemWatcher m_watcher;
    std::map<FolderId, QStringList> m_watchedPaths;
    std::set<FolderId> m_debouncePending;
    std::atomic<bool> m_shuttingDown{false};
};

} // namespace foldermind

#include "daemon/folder_lifecycle.hpp"

#include <algorithm>

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QThread>
#include <QTimer>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace foldermind {

namespace {

QString stateString(FolderState state)
{
    return QString::fromStdString(toFolderStateString(state));
}

QString folderCorrelation(const char *prefix, FolderId folderId)
{
    return QStringLiteral("%1-%2").arg(QLatin1String(prefix)).arg(folderId);
}

} // namespace

FolderLifecycleOrchestrator::FolderLifecycleOrchestrator(DaemonStateStore &stateStore,
                                                         CoordinateStore &store,
                                                         const TextReconstructor &reconstructor,
                                                         EmbeddingBackendProvider &embeddings,
                                                         const DaemonConfig &config,
                                                         QObject *parent)
    : QObject(parent)
    , m_stateStore(stateStore)
    , m_store(store)
    , m_reconstructor(reconstructor)
    , m_config(config)
    , m_scanner([&reconstructor](DocumentFormat format) {
        return reconstructor.supports(format);
    })
    , m_pipeline(store, reconstructor, embeddings, config.chunking)
{
    m_pool.setMaxThreadCount(std::max(1, m_config.workerThreads));
    connect(&m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &FolderLifecycleOrchestrator::onWatchedPathChanged);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged,
            this, &FolderLifecycleOrchestrator::onWatchedPathChanged);
}

FolderLifecycleOrchestrator::~FolderLifecycleOrchestrator()
{
    shutdown();
}

bool FolderLifecycleOrchestrator::isLegalTransition(FolderState from, FolderState to)
{
    if (from == FolderState::Removed) {
        return false;
    }
    if (from == to) {
        return true;
    }
    switch (to) {
    case FolderState::Error:
        return true;
    case FolderState::Scanning:
        return from == FolderState::Pending || from == FolderState::Active
            || from == FolderState::Error;
    case FolderState::Indexing:
        return from == FolderState::Scanning;
    case FolderState::Active:
        return from == FolderState::Scanning || from == FolderState::Indexing;
    case FolderState::Removed:
        return from == FolderState::Active || from == FolderState::Error;
    case FolderState::Pending:
        return false;
    }
    return false;
}

MonitoredFolder FolderLifecycleOrchestrator::addFolder(const std::string &path, FolderConfig config)
{
    const QFileInfo info(QString::fromStdString(path));
    if (path.empty() || !info.exists()) {
        throw InvalidPathError("folder does not exist: " + path);
    }
    if (!info.isDir()) {
        throw InvalidPathError("not a directory: " + path);
    }
    if (!info.isReadable() || !QDir(info.absoluteFilePath()).isReadable()) {
        throw InvalidPathError("folder is not readable: " + path);
    }
    const std::string canonical = info.canonicalFilePath().toStdString();
    if (config.embeddingModelId.empty()) {
        config.embeddingModelId = m_config.defaultModelId;
    }

    SlotPtr slot;
    MonitoredFolder created;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_slots) {
            if (entry.second->folder.path == canonical) {
                std::lock_guard<std::mutex> slotLock(entry.second->mutex);
                return entry.second->folder;
            }
        }

        created.path = canonical;
        created.config = config;
        created.state = FolderState::Pending;
        created.id = m_stateStore.insertFolder(created);

        slot = std::make_shared<FolderSlot>();
        slot->folder = created;
        m_slots[created.id] = slot;
    }

    FMLOG_INFO(QStringLiteral("FolderLifecycle"),
               QStringLiteral("FolderLifecycleOrchestrator::addFolder"),
               QStringLiteral("folder_added"),
               QStringLiteral("user_request"),
               QStringLiteral("schedule_scan"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"folderId", created.id},
                               {"path", canonical},
                               {"model", config.embeddingModelId}}));

    emitState(created.id, FolderState::Pending);
    scheduleScan(slot);
    return created;
}

void FolderLifecycleOrchestrator::onScanComplete(FolderId folderId,
                                                 const std::vector<Document> &documents)
{
    const SlotPtr slot = findSlot(folderId);
    if (!slot) {
        return;
    }

    std::uint64_t generation = 0;
    CancelToken cancel;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->folder.state == FolderState::Removed) {
            return;
        }
        generation = slot->generation;
        cancel = slot->cancel;
        path = slot->folder.path;
    }

    std::map<std::string, Document> storedByPath;
    for (const Document &stored : m_store.listDocuments(folderId)) {
        storedByPath.emplace(stored.path, stored);
    }

    std::set<std::string> discoveredPaths;
    std::vector<Document> work;
    int unreadable = 0;
    for (const Document &document : documents) {
        discoveredPaths.insert(document.path);
        // Present but unreadable: keep whatever is stored until a later scan
        // can hash it again.
        if (document.contentHash.empty()) {
            ++unreadable;
            continue;
        }
        const auto it = storedByPath.find(document.path);
        if (it == storedByPath.end() || it->second.contentHash != document.contentHash
            || it->second.needsReindex) {
            work.push_back(document);
        }
    }

    int vanished = 0;
    for (const auto &entry : storedByPath) {
        if (isCancelled(cancel)) {
            return;
        }
        if (discoveredPaths.count(entry.first) == 0) {
            m_store.deleteDocument(entry.second.id);
            ++vanished;
        }
    }

    FMLOG_INFO(QStringLiteral("FolderLifecycle"),
               QStringLiteral("FolderLifecycleOrchestrator::onScanComplete"),
               QStringLiteral("scan_diffed"),
               QStringLiteral("scan_complete"),
               QStringLiteral("content_hash_diff"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"folderId", folderId},
                               {"discovered", documents.size()},
                               {"changed", work.size()},
                               {"unreadable", unreadable},
                               {"vanished", vanished}}));

    if (work.empty()) {
        if (m_store.documentCount(folderId) == 0) {
            const std::string message = "no indexable documents in " + path;
            RawFailure failure;
            failure.message = message;
            failure.folderCause = FolderCause::EmptyFolder;
            handleFailure(folderId, classifyFailure(failure), message);
            return;
        }
        markActive(slot, generation);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!isCurrentLocked(*slot, generation)) {
            return;
        }
        if (slot->folder.state != FolderState::Scanning
            && slot->folder.state != FolderState::Indexing) {
            if (!transitionLocked(*slot, FolderState::Scanning)) {
                return;
            }
        }
        if (!transitionLocked(*slot, FolderState::Indexing)) {
            return;
        }
        persistLocked(*slot);
        submitJob(slot, [this, slot, generation, cancel, work]() {
            runIndexJob(slot, generation, cancel, work);
        });
    }
    emitState(folderId, FolderState::Indexing);
}

void FolderLifecycleOrchestrator::onIndexingFailure(FolderId folderId, const RawFailure &failure)
{
    handleFailure(folderId, classifyFailure(failure), failure.message);
}

void FolderLifecycleOrchestrator::handleFailure(FolderId folderId,
                                                const FailureClassification &classification,
                                                const std::string &message)
{
    const SlotPtr slot = findSlot(folderId);
    if (!slot) {
        return;
    }

    RecoveryPlan plan;
    std::uint64_t ticket = 0;
    MonitoredFolder snapshot;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->folder.state == FolderState::Removed) {
            return;
        }

        const bool pathExists = QFileInfo(QString::fromStdString(slot->folder.path)).isDir();
        const int attempt = slot->folder.retryAttempts + 1;
        plan = planRecovery(classification, attempt, pathExists, m_config.retryPolicy);

        FolderErrorInfo info;
        info.kind = classification.kind;
        info.message = message;
        info.remediation = classification.remediation;
        info.timestamp = std::chrono::system_clock::now();
        info.environment = classification.failureClass == FailureClass::Environment;
        info.terminal = plan.terminal;

        switch (plan.action) {
        case RecoveryAction::PreserveAndNotify:
            transitionLocked(*slot, FolderState::Error);
            slot->folder.lastError = info;
            persistLocked(*slot);
            releaseTransientLocked(*slot);
            break;
        case RecoveryAction::RetryWithBackoff:
            transitionLocked(*slot, FolderState::Error);
            slot->folder.lastError = info;
            slot->folder.retryAttempts = attempt;
            persistLocked(*slot);
            ticket = ++slot->retryTicket;
            break;
        case RecoveryAction::CleanupTerminal:
            slot->folder.lastError = info;
            slot->cancel->store(true);
            ++slot->generation;
            ++slot->retryTicket;
            break;
        case RecoveryAction::MarkTerminalError:
            transitionLocked(*slot, FolderState::Error);
            slot->folder.lastError = info;
            slot->folder.retryAttempts = attempt;
            persistLocked(*slot);
            releaseTransientLocked(*slot);
            break;
        case RecoveryAction::SkipDocument:
            break;
        case RecoveryAction::AwaitChange:
            transitionLocked(*slot, FolderState::Error);
            slot->folder.lastError = info;
            persistLocked(*slot);
            break;
        }
        snapshot = slot->folder;
    }

    const nlohmann::json context = {
        {"folderId", folderId},
        {"path", snapshot.path},
        {"class", toFailureClassString(classification.failureClass)},
        {"kind", classification.kind},
        {"action", toRecoveryActionString(plan.action)},
        {"attempt", snapshot.retryAttempts},
        {"delayMs", plan.delay.count()},
        {"message", message}
    };
    if (classification.failureClass == FailureClass::Environment || plan.terminal) {
        FMLOG_ERROR(QStringLiteral("FolderLifecycle"),
                    QStringLiteral("FolderLifecycleOrchestrator::handleFailure"),
                    QStringLiteral("folder_failure"),
                    QString::fromStdString(classification.kind),
                    QString::fromStdString(toRecoveryActionString(plan.action)),
                    QString(),
                    logging::currentCorrelationId(),
                    context);
    } else {
        FMLOG_WARN(QStringLiteral("FolderLifecycle"),
                   QStringLiteral("FolderLifecycleOrchestrator::handleFailure"),
                   QStringLiteral("folder_failure"),
                   QString::fromStdString(classification.kind),
                   QString::fromStdString(toRecoveryActionString(plan.action)),
                   QString(),
                   logging::currentCorrelationId(),
                   context);
    }

    switch (plan.action) {
    case RecoveryAction::PreserveAndNotify:
        raiseNotification(snapshot, message, classification.remediation);
        postToOwner([this, folderId]() { unwatchFolder(folderId); });
        emitState(folderId, FolderState::Error);
        break;
    case RecoveryAction::RetryWithBackoff:
        scheduleRetry(folderId, ticket, plan.delay);
        emitState(folderId, FolderState::Error);
        break;
    case RecoveryAction::CleanupTerminal:
        postToOwner([this, folderId]() {
            performCleanup(folderId, QStringLiteral("terminal_path_missing"));
        });
        break;
    case RecoveryAction::MarkTerminalError:
        postToOwner([this, folderId]() { unwatchFolder(folderId); });
        emitState(folderId, FolderState::Error);
        break;
    case RecoveryAction::SkipDocument:
        break;
    case RecoveryAction::AwaitChange:
        postToOwner([this, folderId]() { watchFolder(folderId); });
        emitState(folderId, FolderState::Error);
        break;
    }
}

bool FolderLifecycleOrchestrator::removeFolder(FolderId folderId)
{
    return performCleanup(folderId, QStringLiteral("user_removed"));
}

bool FolderLifecycleOrchestrator::retryFolder(FolderId folderId)
{
    const SlotPtr slot = findSlot(folderId);
    if (!slot) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->folder.state != FolderState::Error) {
            return false;
        }
        slot->folder.retryAttempts = 0;
        ++slot->retryTicket;
        persistLocked(*slot);
    }

    FMLOG_INFO(QStringLiteral("FolderLifecycle"),
               QStringLiteral("FolderLifecycleOrchestrator::retryFolder"),
               QStringLiteral("folder_retry"),
               QStringLiteral("user_remediation"),
               QStringLiteral("schedule_scan"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"folderId", folderId}}));
    scheduleScan(slot);
    return true;
}

void FolderLifecycleOrchestrator::onFileSystemChange(FolderId folderId)
{
    const SlotPtr slot = findSlot(folderId);
    if (!slot) {
        return;
    }

    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        switch (slot->folder.state) {
        case FolderState::Active:
            schedule = true;
            break;
        case FolderState::Scanning:
        case FolderState::Indexing:
            slot->rescanPending = true;
            break;
        case FolderState::Error:
            schedule = slot->folder.lastError.has_value()
                && slot->folder.lastError->kind == "empty_folder";
            break;
        case FolderState::Pending:
        case FolderState::Removed:
            break;
        }
    }
    if (schedule) {
        scheduleScan(slot);
    }
}

void FolderLifecycleOrchestrator::restoreFolders()
{
    enum class Next { Nothing, Scan, Retry, Watch, Notify };

    for (MonitoredFolder folder : m_stateStore.loadFolders()) {
        Next next = Next::Nothing;
        switch (folder.state) {
        case FolderState::Pending:
        case FolderState::Scanning:
        case FolderState::Indexing:
            folder.state = FolderState::Pending;
            next = Next::Scan;
            break;
        case FolderState::Active:
            next = Next::Scan;
            break;
        case FolderState::Error:
            if (!folder.lastError.has_value()) {
                next = Next::Retry;
            } else if (folder.lastError->environment) {
                next = Next::Notify;
            } else if (folder.lastError->terminal) {
                next = Next::Nothing;
            } else if (folder.lastError->kind == "empty_folder") {
                next = Next::Watch;
            } else {
                next = Next::Retry;
            }
            break;
        case FolderState::Removed:
            m_stateStore.deleteFolder(folder.id);
            continue;
        }

        auto slot = std::make_shared<FolderSlot>();
        slot->folder = folder;
        std::uint64_t ticket = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_slots.count(folder.id) > 0) {
                continue;
            }
            m_slots[folder.id] = slot;
        }
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            persistLocked(*slot);
            ticket = ++slot->retryTicket;
        }

        FMLOG_INFO(QStringLiteral("FolderLifecycle"),
                   QStringLiteral("FolderLifecycleOrchestrator::restoreFolders"),
                   QStringLiteral("folder_restored"),
                   QStringLiteral("daemon_start"),
                   QStringLiteral("persisted_state"),
                   QString(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"folderId", folder.id},
                                   {"path", folder.path},
                                   {"state", folder.state}}));

        switch (next) {
        case Next::Scan:
            scheduleScan(slot);
            break;
        case Next::Retry:
            scheduleRetry(folder.id, ticket,
                          m_config.retryPolicy.delayForAttempt(std::max(1, folder.retryAttempts)));
            break;
        case Next::Watch:
            postToOwner([this, id = folder.id]() { watchFolder(id); });
            break;
        case Next::Notify:
            raiseNotification(folder, folder.lastError->message, folder.lastError->remediation);
            break;
        case Next::Nothing:
            break;
        }
    }
}

std::vector<MonitoredFolder> FolderLifecycleOrchestrator::listFolders() const
{
    std::vector<SlotPtr> slots;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_slots) {
            slots.push_back(entry.second);
        }
    }
    std::vector<MonitoredFolder> folders;
    folders.reserve(slots.size());
    for (const SlotPtr &slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        folders.push_back(slot->folder);
    }
    return folders;
}

std::optional<MonitoredFolder> FolderLifecycleOrchestrator::folderStatus(FolderId folderId) const
{
    const SlotPtr slot = findSlot(folderId);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->folder;
}

std::vector<Notification> FolderLifecycleOrchestrator::notifications() const
{
    std::lock_guard<std::mutex> lock(m_notificationsMutex);
    std::vector<Notification> out;
    for (const auto &entry : m_notifications) {
        out.push_back(entry.second);
    }
    return out;
}

void FolderLifecycleOrchestrator::flagDocumentForReindex(DocumentId documentId)
{
    const std::optional<Document> document = m_store.document(documentId);
    if (!document.has_value()) {
        return;
    }
    m_store.setNeedsReindex(documentId, true);

    FMLOG_WARN(QStringLiteral("FolderLifecycle"),
               QStringLiteral("FolderLifecycleOrchestrator::flagDocumentForReindex"),
               QStringLiteral("document_flagged"),
               QStringLiteral("coordinate_mismatch"),
               QStringLiteral("schedule_rescan"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"documentId", documentId},
                               {"folderId", document->folderId},
                               {"path", document->path}}));
    onFileSystemChange(document->folderId);
}

bool FolderLifecycleOrchestrator::waitForIdle(int msecs)
{
    return m_pool.waitForDone(msecs);
}

void FolderLifecycleOrchestrator::shutdown()
{
    m_shuttingDown = true;
    std::vector<SlotPtr> slots;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &entry : m_slots) {
            slots.push_back(entry.second);
        }
    }
    for (const SlotPtr &slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->cancel->store(true);
        ++slot->generation;
        ++slot->retryTicket;
    }
    m_pool.waitForDone();
}

FolderLifecycleOrchestrator::SlotPtr FolderLifecycleOrchestrator::findSlot(FolderId folderId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_slots.find(folderId);
    if (it == m_slots.end()) {
        return nullptr;
    }
    return it->second;
}

FolderLifecycleOrchestrator::SlotPtr
FolderLifecycleOrchestrator::findSlotForPath(const QString &path) const
{
    for (const auto &entry : m_watchedPaths) {
        if (entry.second.contains(path)) {
            return findSlot(entry.first);
        }
    }
    return nullptr;
}

bool FolderLifecycleOrchestrator::transitionLocked(FolderSlot &slot, FolderState to)
{
    const FolderState from = slot.folder.state;
    if (!isLegalTransition(from, to)) {
        FMLOG_WARN(QStringLiteral("FolderLifecycle"),
                   QStringLiteral("FolderLifecycleOrchestrator::transition"),
                   QStringLiteral("illegal_transition"),
                   QStringLiteral("state_machine"),
                   QStringLiteral("reject"),
                   QString(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"folderId", slot.folder.id},
                                   {"from", from},
                                   {"to", to}}));
        return false;
    }
    if (from != to) {
        FMLOG_DEBUG(QStringLiteral("FolderLifecycle"),
                    QStringLiteral("FolderLifecycleOrchestrator::transition"),
                    QStringLiteral("state_changed"),
                    QStringLiteral("state_machine"),
                    QStringLiteral("transition"),
                    QString(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"folderId", slot.folder.id},
                                    {"from", from},
                                    {"to", to}}));
    }
    slot.folder.state = to;
    return true;
}

void FolderLifecycleOrchestrator::persistLocked(const FolderSlot &slot)
{
    m_stateStore.saveFolder(slot.folder);
}

bool FolderLifecycleOrchestrator::isCurrentLocked(const FolderSlot &slot,
                                                  std::uint64_t generation) const
{
    return slot.generation == generation && slot.folder.state != FolderState::Removed;
}

void FolderLifecycleOrchestrator::releaseTransientLocked(FolderSlot &slot)
{
    slot.cancel->store(true);
    ++slot.generation;
    ++slot.retryTicket;
    slot.rescanPending = false;
}

void FolderLifecycleOrchestrator::scheduleScan(const SlotPtr &slot)
{
    if (m_shuttingDown) {
        return;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->folder.state == FolderState::Removed) {
        return;
    }
    {
        std::lock_guard<std::mutex> jobsLock(m_jobsMutex);
        if (slot->inFlight > 0) {
            slot->rescanPending = true;
            return;
        }
    }
    if (isCancelled(slot->cancel)) {
        slot->cancel = makeCancelToken();
    }
    slot->rescanPending = false;
    const std::uint64_t generation = slot->generation;
    const CancelToken cancel = slot->cancel;
    submitJob(slot, [this, slot, generation, cancel]() {
        runScanJob(slot, generation, cancel);
    });
}

void FolderLifecycleOrchestrator::submitJob(const SlotPtr &slot, std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(m_jobsMutex);
        ++slot->inFlight;
    }
    m_pool.start([this, slot, job = std::move(job)]() {
        try {
            job();
        } catch (const std::exception &error) {
            FMLOG_ERROR(QStringLiteral("FolderLifecycle"),
                        QStringLiteral("FolderLifecycleOrchestrator::submitJob"),
                        QStringLiteral("job_failed"),
                        QStringLiteral("unexpected_exception"),
                        QStringLiteral("abort_job"),
                        QString(),
                        logging::currentCorrelationId(),
                        (nlohmann::json{{"folderId", slot->folder.id},
                                        {"error", error.what()}}));
        }

        int remaining = 0;
        {
            std::lock_guard<std::mutex> lock(m_jobsMutex);
            remaining = --slot->inFlight;
        }
        m_jobsDone.notify_all();

        if (remaining == 0) {
            bool rescan = false;
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                rescan = slot->rescanPending && slot->folder.state != FolderState::Removed;
            }
            if (rescan) {
                scheduleScan(slot);
            }
        }
    });
}

void FolderLifecycleOrchestrator::runScanJob(const SlotPtr &slot,
                                             std::uint64_t generation,
                                             const CancelToken &cancel)
{
    FolderId folderId = 0;
    std::string path;
    std::vector<std::string> exclusions;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!isCurrentLocked(*slot, generation) || isCancelled(cancel)) {
            return;
        }
        if (slot->folder.state != FolderState::Scanning) {
            if (!transitionLocked(*slot, FolderState::Scanning)) {
                return;
            }
            persistLocked(*slot);
            changed = true;
        }
        folderId = slot->folder.id;
        path = slot->folder.path;
        exclusions = slot->folder.config.exclusionPatterns;
    }
    if (changed) {
        emitState(folderId, FolderState::Scanning);
    }

    logging::CorrelationScope correlation(folderCorrelation("scan", folderId));
    std::vector<Document> documents;
    try {
        documents = m_scanner.scan(folderId, path, exclusions, cancel);
    } catch (const JobCancelledError &) {
        return;
    } catch (const std::exception &error) {
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (!isCurrentLocked(*slot, generation)) {
                return;
            }
        }
        onIndexingFailure(folderId, rawFailureFromException(error));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!isCurrentLocked(*slot, generation)) {
            return;
        }
    }
    onScanComplete(folderId, documents);
}

void FolderLifecycleOrchestrator::runIndexJob(const SlotPtr &slot,
                                              std::uint64_t generation,
                                              const CancelToken &cancel,
                                              const std::vector<Document> &work)
{
    FolderId folderId = 0;
    std::string modelId;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!isCurrentLocked(*slot, generation)) {
            return;
        }
        folderId = slot->folder.id;
        modelId = slot->folder.config.embeddingModelId.empty()
            ? m_config.defaultModelId
            : slot->folder.config.embeddingModelId;
    }

    logging::CorrelationScope correlation(folderCorrelation("index", folderId));
    for (const Document &document : work) {
        if (isCancelled(cancel)) {
            return;
        }
        try {
            m_pipeline.indexDocument(document, modelId, cancel);
        } catch (const JobCancelledError &) {
            return;
        } catch (const std::exception &error) {
            const RawFailure raw = rawFailureFromException(error);
            const FailureClassification classification = classifyFailure(raw);
            if (classification.failureClass == FailureClass::Folder
                && classification.folderCause == FolderCause::MalformedContent) {
                FMLOG_WARN(QStringLiteral("FolderLifecycle"),
                           QStringLiteral("FolderLifecycleOrchestrator::runIndexJob"),
                           QStringLiteral("document_skipped"),
                           QString::fromStdString(classification.kind),
                           QStringLiteral("skip_document"),
                           QString(),
                           logging::currentCorrelationId(),
                           (nlohmann::json{{"folderId", folderId},
                                           {"path", document.path},
                                           {"error", raw.message}}));
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                if (!isCurrentLocked(*slot, generation)) {
                    return;
                }
            }
            handleFailure(folderId, classification, raw.message);
            return;
        }
    }

    finishIndexing(slot, generation);
}

void FolderLifecycleOrchestrator::finishIndexing(const SlotPtr &slot, std::uint64_t generation)
{
    FolderId folderId = 0;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!isCurrentLocked(*slot, generation)) {
            return;
        }
        folderId = slot->folder.id;
        path = slot->folder.path;
    }

    if (m_store.documentCount(folderId) == 0) {
        const std::string message = "no indexable documents in " + path;
        RawFailure failure;
        failure.message = message;
        failure.folderCause = FolderCause::EmptyFolder;
        handleFailure(folderId, classifyFailure(failure), message);
        return;
    }
    markActive(slot, generation);
}

void FolderLifecycleOrchestrator::markActive(const SlotPtr &slot, std::uint64_t generation)
{
    FolderId folderId = 0;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!isCurrentLocked(*slot, generation)) {
            return;
        }
        changed = slot->folder.state != FolderState::Active;
        if (!transitionLocked(*slot, FolderState::Active)) {
            return;
        }
        slot->folder.lastIndexed = std::chrono::system_clock::now();
        slot->folder.lastError.reset();
        slot->folder.retryAttempts = 0;
        persistLocked(*slot);
        folderId = slot->folder.id;
    }

    clearNotification(folderId);
    postToOwner([this, folderId]() { watchFolder(folderId); });

    FMLOG_INFO(QStringLiteral("FolderLifecycle"),
               QStringLiteral("FolderLifecycleOrchestrator::markActive"),
               QStringLiteral("folder_active"),
               QStringLiteral("indexing_complete"),
               QStringLiteral("commit"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"folderId", folderId},
                               {"documents", m_store.documentCount(folderId)},
                               {"chunks", m_store.chunkCount(folderId)}}));
    if (changed) {
        emitState(folderId, FolderState::Active);
    }
}

void FolderLifecycleOrchestrator::waitForJobs(const SlotPtr &slot)
{
    std::unique_lock<std::mutex> lock(m_jobsMutex);
    m_jobsDone.wait(lock, [&slot]() { return slot->inFlight == 0; });
}

void FolderLifecycleOrchestrator::scheduleRetry(FolderId folderId,
                                                std::uint64_t ticket,
                                                std::chrono::milliseconds delay)
{
    postToOwner([this, folderId, ticket, delay]() {
        QTimer::singleShot(delay, this, [this, folderId, ticket]() {
            fireRetry(folderId, ticket);
        });
    });
}

void FolderLifecycleOrchestrator::fireRetry(FolderId folderId, std::uint64_t ticket)
{
    const SlotPtr slot = findSlot(folderId);
    if (!slot) {
        return;
    }
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (ticket != slot->retryTicket || slot->folder.state != FolderState::Error) {
            return;
        }
        attempt = slot->folder.retryAttempts;
    }

    FMLOG_INFO(QStringLiteral("FolderLifecycle"),
               QStringLiteral("FolderLifecycleOrchestrator::fireRetry"),
               QStringLiteral("folder_retry"),
               QStringLiteral("transient_failure"),
               QStringLiteral("backoff_elapsed"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"folderId", folderId}, {"attempt", attempt}}));
    scheduleScan(slot);
}

bool FolderLifecycleOrchestrator::performCleanup(FolderId folderId, const QString &reason)
{
    const SlotPtr slot = findSlot(folderId);
    if (!slot) {
        return false;
    }
    std::string path;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->cancel->store(true);
        ++slot->generation;
        ++slot->retryTicket;
        slot->rescanPending = false;
        path = slot->folder.path;
    }

    waitForJobs(slot);

    if (QThread::currentThread() == thread()) {
        unwatchFolder(folderId);
    } else {
        postToOwner([this, folderId]() { unwatchFolder(folderId); });
    }

    m_store.dropFolderPartition(folderId);
    m_stateStore.deleteFolder(folderId);
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->folder.state = FolderState::Removed;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_slots.erase(folderId);
    }
    clearNotification(folderId);

    FMLOG_INFO(QStringLiteral("FolderLifecycle"),
               QStringLiteral("FolderLifecycleOrchestrator::performCleanup"),
               QStringLiteral("folder_removed"),
               reason,
               QStringLiteral("drop_partition_and_config"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"folderId", folderId}, {"path", path}}));
    emitState(folderId, FolderState::Removed);
    return true;
}

void FolderLifecycleOrchestrator::raiseNotification(const MonitoredFolder &folder,
                                                    const std::string &message,
                                                    const std::string &remediation)
{
    Notification notification;
    notification.folderId = folder.id;
    notification.folderPath = folder.path;
    notification.severity = "critical";
    notification.message = "Indexing of " + folder.path + " is paused: " + message
        + ". Existing indexed data is intact.";
    notification.remediation = remediation;
    notification.dataIntact = true;
    notification.raisedAt = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(m_notificationsMutex);
        m_notifications[folder.id] = notification;
    }
    emit notificationRaised(folder.id, QString::fromStdString(notification.message));
}

void FolderLifecycleOrchestrator::clearNotification(FolderId folderId)
{
    std::lock_guard<std::mutex> lock(m_notificationsMutex);
    m_notifications.erase(folderId);
}

void FolderLifecycleOrchestrator::postToOwner(std::function<void()> fn)
{
    if (m_shuttingDown) {
        return;
    }
    QMetaObject::invokeMethod(this, std::move(fn), Qt::QueuedConnection);
}

void FolderLifecycleOrchestrator::watchFolder(FolderId folderId)
{
    const SlotPtr slot = findSlot(folderId);
    if (!slot) {
        return;
    }
    QString root;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        root = QString::fromStdString(slot->folder.path);
    }

    unwatchFolder(folderId);

    QStringList paths;
    paths << root;
    QDirIterator dirs(root, QDir::Dirs | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (dirs.hasNext()) {
        paths << dirs.next();
    }
    for (const Document &document : m_store.listDocuments(folderId)) {
        paths << QString::fromStdString(document.path);
    }

    const QStringList failed = m_watcher.addPaths(paths);
    QStringList watched;
    for (const QString &path : paths) {
        if (!failed.contains(path)) {
            watched << path;
        }
    }
    m_watchedPaths[folderId] = watched;
}

void FolderLifecycleOrchestrator::unwatchFolder(FolderId folderId)
{
    const auto it = m_watchedPaths.find(folderId);
    if (it == m_watchedPaths.end()) {
        return;
    }
    if (!it->second.isEmpty()) {
        m_watcher.removePaths(it->second);
    }
    m_watchedPaths.erase(it);
}

void FolderLifecycleOrchestrator::onWatchedPathChanged(const QString &path)
{
    const SlotPtr slot = findSlotForPath(path);
    if (!slot) {
        return;
    }
    FolderId folderId = 0;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        folderId = slot->folder.id;
    }
    if (!m_debouncePending.insert(folderId).second) {
        return;
    }
    QTimer::singleShot(m_config.watchDebounce, this, [this, folderId]() {
        m_debouncePending.erase(folderId);
        onFileSystemChange(folderId);
    });
}

void FolderLifecycleOrchestrator::emitState(FolderId folderId, FolderState state)
{
    emit folderStateChanged(folderId, stateString(state));
}

} // namespace foldermind

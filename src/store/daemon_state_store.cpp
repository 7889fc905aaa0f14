#include "store/daemon_state_store.hpp"

#include <mutex>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "store/sqlite_utils.hpp"

namespace foldermind {

namespace {

constexpr const char *kCreateFoldersTable =
    "CREATE TABLE IF NOT EXISTS folders ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    path TEXT NOT NULL UNIQUE,"
    "    config TEXT NOT NULL,"
    "    state TEXT NOT NULL,"
    "    last_indexed INTEGER,"
    "    retry_attempts INTEGER NOT NULL DEFAULT 0,"
    "    error_present INTEGER NOT NULL DEFAULT 0,"
    "    error_kind TEXT,"
    "    error_message TEXT,"
    "    error_remediation TEXT,"
    "    error_timestamp INTEGER,"
    "    error_environment INTEGER NOT NULL DEFAULT 0,"
    "    error_terminal INTEGER NOT NULL DEFAULT 0"
    ");";

constexpr const char *kCreateKnownClientsTable =
    "CREATE TABLE IF NOT EXISTS known_clients ("
    "    client_id TEXT PRIMARY KEY,"
    "    mode TEXT NOT NULL,"
    "    fallback_address TEXT"
    ");";

constexpr const char *kCreateConflictsTable =
    "CREATE TABLE IF NOT EXISTS conflicts ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    requesting_client_id TEXT NOT NULL,"
    "    primary_client_id TEXT NOT NULL,"
    "    timestamp INTEGER NOT NULL"
    ");";

constexpr const char *kCreateLastConflictTable =
    "CREATE TABLE IF NOT EXISTS last_conflict ("
    "    slot INTEGER PRIMARY KEY CHECK (slot = 0),"
    "    requesting_client_id TEXT NOT NULL,"
    "    primary_client_id TEXT NOT NULL,"
    "    timestamp INTEGER NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kPrimaryClientKey = "primary_client_id";

constexpr const char *kFolderColumns =
    "id, path, config, state, last_indexed, retry_attempts, error_present,"
    " error_kind, error_message, error_remediation, error_timestamp,"
    " error_environment, error_terminal";

MonitoredFolder readFolder(sqlite3_stmt *stmt)
{
    MonitoredFolder folder;
    folder.id = sqlite3_column_int64(stmt, 0);
    folder.path = sqlite::columnText(stmt, 1);
    folder.config = sqlite::columnJson(stmt, 2).get<FolderConfig>();
    folder.state = parseFolderStateString(sqlite::columnText(stmt, 3));
    folder.lastIndexed = sqlite::columnTimestamp(stmt, 4);
    folder.retryAttempts = sqlite3_column_int(stmt, 5);
    if (sqlite3_column_int(stmt, 6) != 0) {
        FolderErrorInfo error;
        error.kind = sqlite::columnText(stmt, 7);
        error.message = sqlite::columnText(stmt, 8);
        error.remediation = sqlite::columnText(stmt, 9);
        error.timestamp = sqlite::columnTimestamp(stmt, 10);
        error.environment = sqlite3_column_int(stmt, 11) != 0;
        error.terminal = sqlite3_column_int(stmt, 12) != 0;
        folder.lastError = error;
    }
    return folder;
}

// Binds everything after the id; parameters start at `first`.
void bindFolderFields(sqlite3_stmt *stmt, int first, const MonitoredFolder &folder)
{
    sqlite::bindText(stmt, first, folder.path);
    sqlite::bindJson(stmt, first + 1, nlohmann::json(folder.config));
    sqlite::bindText(stmt, first + 2, toFolderStateString(folder.state));
    sqlite::bindTimestamp(stmt, first + 3, folder.lastIndexed);
    sqlite3_bind_int(stmt, first + 4, folder.retryAttempts);
    if (folder.lastError.has_value()) {
        const FolderErrorInfo &error = *folder.lastError;
        sqlite3_bind_int(stmt, first + 5, 1);
        sqlite::bindText(stmt, first + 6, error.kind);
        sqlite::bindText(stmt, first + 7, error.message);
        sqlite::bindText(stmt, first + 8, error.remediation);
        sqlite::bindTimestamp(stmt, first + 9, error.timestamp);
        sqlite3_bind_int(stmt, first + 10, error.environment ? 1 : 0);
        sqlite3_bind_int(stmt, first + 11, error.terminal ? 1 : 0);
    } else {
        sqlite3_bind_int(stmt, first + 5, 0);
        for (int i = 6; i <= 9; ++i) {
            sqlite3_bind_null(stmt, first + i);
        }
        sqlite3_bind_int(stmt, first + 10, 0);
        sqlite3_bind_int(stmt, first + 11, 0);
    }
}

} // namespace

struct DaemonStateStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;

    void ensureSchema()
    {
        sqlite::execOrThrow(db, kCreateFoldersTable);
        sqlite::execOrThrow(db, kCreateKnownClientsTable);
        sqlite::execOrThrow(db, kCreateConflictsTable);
        sqlite::execOrThrow(db, kCreateLastConflictTable);
        sqlite::execOrThrow(db, kCreateMetaTable);
    }

    std::optional<std::string> getMeta(const std::string &key) const
    {
        sqlite::Statement stmt(db, "SELECT value FROM meta WHERE key = ?;");
        sqlite::bindText(stmt.get(), 1, key);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            return std::nullopt;
        }
        return sqlite::columnText(stmt.get(), 0);
    }

    void setMeta(const std::string &key, const std::string &value)
    {
        sqlite::Statement stmt(db,
            "INSERT INTO meta (key, value) VALUES (?, ?)"
            " ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
        sqlite::bindText(stmt.get(), 1, key);
        sqlite::bindText(stmt.get(), 2, value);
        sqlite::stepDone(db, stmt.get(), "write meta");
    }

    void deleteMeta(const std::string &key)
    {
        sqlite::Statement stmt(db, "DELETE FROM meta WHERE key = ?;");
        sqlite::bindText(stmt.get(), 1, key);
        sqlite::stepDone(db, stmt.get(), "delete meta");
    }
};

DaemonStateStore::DaemonStateStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    impl->db = sqlite::openDatabase(databasePath);
    try {
        impl->ensureSchema();
    } catch (const StoreError &) {
        sqlite::closeDatabase(impl->db);
        throw;
    }
}

DaemonStateStore::~DaemonStateStore()
{
    sqlite::closeDatabase(impl->db);
}

FolderId DaemonStateStore::insertFolder(const MonitoredFolder &folder)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    sqlite::Statement stmt(impl->db,
        "INSERT INTO folders (path, config, state, last_indexed, retry_attempts,"
        " error_present, error_kind, error_message, error_remediation,"
        " error_timestamp, error_environment, error_terminal)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    bindFolderFields(stmt.get(), 1, folder);
    sqlite::stepDone(impl->db, stmt.get(), "insert folder");
    return sqlite3_last_insert_rowid(impl->db);
}

void DaemonStateStore::saveFolder(const MonitoredFolder &folder)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    sqlite::Statement stmt(impl->db,
        "INSERT INTO folders (id, path, config, state, last_indexed, retry_attempts,"
        " error_present, error_kind, error_message, error_remediation,"
        " error_timestamp, error_environment, error_terminal)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
        " ON CONFLICT(id) DO UPDATE SET"
        " path = excluded.path, config = excluded.config, state = excluded.state,"
        " last_indexed = excluded.last_indexed,"
        " retry_attempts = excluded.retry_attempts,"
        " error_present = excluded.error_present, error_kind = excluded.error_kind,"
        " error_message = excluded.error_message,"
        " error_remediation = excluded.error_remediation,"
        " error_timestamp = excluded.error_timestamp,"
        " error_environment = excluded.error_environment,"
        " error_terminal = excluded.error_terminal;");
    sqlite3_bind_int64(stmt.get(), 1, folder.id);
    bindFolderFields(stmt.get(), 2, folder);
    sqlite::stepDone(impl->db, stmt.get(), "save folder");
}

void DaemonStateStore::deleteFolder(FolderId folderId)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    sqlite::Statement stmt(impl->db, "DELETE FROM folders WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, folderId);
    sqlite::stepDone(impl->db, stmt.get(), "delete folder");
}

std::vector<MonitoredFolder> DaemonStateStore::loadFolders() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string("SELECT ") + kFolderColumns
        + " FROM folders ORDER BY id ASC;";
    sqlite::Statement stmt(impl->db, sql.c_str());
    std::vector<MonitoredFolder> folders;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        folders.push_back(readFolder(stmt.get()));
    }
    return folders;
}

std::optional<MonitoredFolder> DaemonStateStore::folder(FolderId folderId) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    const std::string sql = std::string("SELECT ") + kFolderColumns
        + " FROM folders WHERE id = ?;";
    sqlite::Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, folderId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readFolder(stmt.get());
}

void DaemonStateStore::saveConnectionState(const ClientConnectionState &state)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    sqlite::Transaction transaction(impl->db);

    if (state.primaryClientId.has_value()) {
        impl->setMeta(kPrimaryClientKey, *state.primaryClientId);
    } else {
        impl->deleteMeta(kPrimaryClientKey);
    }

    sqlite::execOrThrow(impl->db, "DELETE FROM known_clients;");
    for (const auto &entry : state.knownClients) {
        sqlite::Statement stmt(impl->db,
            "INSERT INTO known_clients (client_id, mode, fallback_address)"
            " VALUES (?, ?, ?);");
        sqlite::bindText(stmt.get(), 1, entry.second.clientId);
        sqlite::bindText(stmt.get(), 2, toTransportModeString(entry.second.mode));
        sqlite::bindText(stmt.get(), 3, entry.second.fallbackAddress);
        sqlite::stepDone(impl->db, stmt.get(), "write known client");
    }

    sqlite::execOrThrow(impl->db, "DELETE FROM conflicts;");
    for (const ConnectionConflict &conflict : state.conflictHistory) {
        sqlite::Statement stmt(impl->db,
            "INSERT INTO conflicts (requesting_client_id, primary_client_id, timestamp)"
            " VALUES (?, ?, ?);");
        sqlite::bindText(stmt.get(), 1, conflict.requestingClientId);
        sqlite::bindText(stmt.get(), 2, conflict.primaryClientId);
        sqlite3_bind_int64(stmt.get(), 3, sqlite::toClockTicks(conflict.timestamp));
        sqlite::stepDone(impl->db, stmt.get(), "write conflict");
    }

    sqlite::execOrThrow(impl->db, "DELETE FROM last_conflict;");
    if (state.lastConflict.has_value()) {
        sqlite::Statement stmt(impl->db,
            "INSERT INTO last_conflict (slot, requesting_client_id, primary_client_id,"
            " timestamp) VALUES (0, ?, ?, ?);");
        sqlite::bindText(stmt.get(), 1, state.lastConflict->requestingClientId);
        sqlite::bindText(stmt.get(), 2, state.lastConflict->primaryClientId);
        sqlite3_bind_int64(stmt.get(), 3, sqlite::toClockTicks(state.lastConflict->timestamp));
        sqlite::stepDone(impl->db, stmt.get(), "write last conflict");
    }

    transaction.commit();
}

ClientConnectionState DaemonStateStore::loadConnectionState() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    ClientConnectionState state;
    state.primaryClientId = impl->getMeta(kPrimaryClientKey);

    {
        sqlite::Statement stmt(impl->db,
            "SELECT client_id, mode, fallback_address FROM known_clients;");
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            KnownClient client;
            client.clientId = sqlite::columnText(stmt.get(), 0);
            client.mode = parseTransportModeString(sqlite::columnText(stmt.get(), 1));
            client.fallbackAddress = sqlite::columnText(stmt.get(), 2);
            state.knownClients[client.clientId] = client;
        }
    }

    {
        sqlite::Statement stmt(impl->db,
            "SELECT requesting_client_id, primary_client_id, timestamp"
            " FROM conflicts ORDER BY id ASC;");
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            ConnectionConflict conflict;
            conflict.requestingClientId = sqlite::columnText(stmt.get(), 0);
            conflict.primaryClientId = sqlite::columnText(stmt.get(), 1);
            conflict.timestamp = sqlite::fromClockTicks(sqlite3_column_int64(stmt.get(), 2));
            state.conflictHistory.push_back(conflict);
        }
    }

    {
        sqlite::Statement stmt(impl->db,
            "SELECT requesting_client_id, primary_client_id, timestamp"
            " FROM last_conflict WHERE slot = 0;");
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            ConnectionConflict conflict;
            conflict.requestingClientId = sqlite::columnText(stmt.get(), 0);
            conflict.primaryClientId = sqlite::columnText(stmt.get(), 1);
            conflict.timestamp = sqlite::fromClockTicks(sqlite3_column_int64(stmt.get(), 2));
            state.lastConflict = conflict;
        }
    }
    return state;
}

std::optional<std::string> DaemonStateStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return impl->getMeta(key);
}

void DaemonStateStore::setMeta(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->setMeta(key, value);
}

} // namespace foldermind

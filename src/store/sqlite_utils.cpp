#include "store/sqlite_utils.hpp"

#include <filesystem>

#include "common/errors.hpp"

namespace foldermind::sqlite {

Statement::Statement(sqlite3 *db, const char *sql)
{
    if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
        const std::string message = std::string("sqlite prepare failed: ")
            + sqlite3_errmsg(db);
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
        }
        throw StoreError(message);
    }
}

Statement::~Statement()
{
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

Transaction::Transaction(sqlite3 *db)
    : m_db(db)
{
    execOrThrow(m_db, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction()
{
    if (!m_done) {
        sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit()
{
    execOrThrow(m_db, "COMMIT;");
    m_done = true;
}

sqlite3 *openDatabase(const std::string &path)
{
    const std::filesystem::path dbPath(path);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
    }

    sqlite3 *db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw StoreError("failed to open database " + path + ": " + message);
    }

    sqlite3_busy_timeout(db, 5000);
    try {
        execOrThrow(db, "PRAGMA journal_mode=WAL;");
        execOrThrow(db, "PRAGMA foreign_keys=ON;");
        execOrThrow(db, "PRAGMA synchronous=NORMAL;");
    } catch (const StoreError &) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

void closeDatabase(sqlite3 *db)
{
    if (db) {
        sqlite3_close(db);
    }
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *message = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &message);
    if (rc == SQLITE_OK) {
        return;
    }
    const std::string detail = message ? message : sqlite3_errstr(rc);
    sqlite3_free(message);
    throw StoreError(std::string(sql) + " failed: " + detail);
}

void stepDone(sqlite3 *db, sqlite3_stmt *stmt, const char *what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw StoreError(std::string("failed to ") + what + ": " + sqlite3_errmsg(db));
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text64(stmt, index, value.data(), value.size(), SQLITE_TRANSIENT, SQLITE_UTF8);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bindText(stmt, index, value);
    }
}

void bindJson(sqlite3_stmt *stmt, int index, const nlohmann::json &value)
{
    if (value.is_null()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bindText(stmt, index, value.dump());
    }
}

void bindTimestamp(sqlite3_stmt *stmt, int index,
                   std::chrono::system_clock::time_point timestamp)
{
    if (timestamp == std::chrono::system_clock::time_point{}) {
        sqlite3_bind_null(stmt, index);
    } else {
        sqlite3_bind_int64(stmt, index, toClockTicks(timestamp));
    }
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const auto *data = static_cast<const char *>(
        static_cast<const void *>(sqlite3_column_text(stmt, index)));
    if (!data) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(sqlite3_column_bytes(stmt, index)));
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return nlohmann::json::object();
    }
    nlohmann::json value = nlohmann::json::parse(columnText(stmt, index), nullptr, false);
    if (value.is_discarded()) {
        throw StoreError("column " + std::string(sqlite3_column_name(stmt, index))
                         + " holds malformed JSON");
    }
    return value;
}

std::chrono::system_clock::time_point columnTimestamp(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::chrono::system_clock::time_point{};
    }
    return fromClockTicks(sqlite3_column_int64(stmt, index));
}

std::int64_t toClockTicks(std::chrono::system_clock::time_point timestamp)
{
    return static_cast<std::int64_t>(timestamp.time_since_epoch().count());
}

std::chrono::system_clock::time_point fromClockTicks(std::int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::system_clock::duration{value}};
}

} // namespace foldermind::sqlite

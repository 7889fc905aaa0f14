#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace foldermind::sqlite {

// Owns a prepared statement for the lifetime of the object.
class Statement {
public:
    Statement(sqlite3 *db, const char *sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return m_stmt;
    }

private:
    sqlite3_stmt *m_stmt = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back unless commit() was called.
class Transaction {
public:
    explicit Transaction(sqlite3 *db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:
    sqlite3 *m_db = nullptr;
    bool m_done = false;
};

// Opens (creating when needed) a database with WAL, foreign keys and a busy timeout.
sqlite3 *openDatabase(const std::string &path);
void closeDatabase(sqlite3 *db);

void execOrThrow(sqlite3 *db, const char *sql);
void stepDone(sqlite3 *db, sqlite3_stmt *stmt, const char *what);

void bindText(sqlite3_stmt *stmt, int index, const std::string &value);
void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value);
void bindJson(sqlite3_stmt *stmt, int index, const nlohmann::json &value);
void bindTimestamp(sqlite3_stmt *stmt, int index,
                   std::chrono::system_clock::time_point timestamp);

std::string columnText(sqlite3_stmt *stmt, int index);
// NULL reads as an empty object. Throws StoreError on unparseable JSON.
nlohmann::json columnJson(sqlite3_stmt *stmt, int index);
std::chrono::system_clock::time_point columnTimestamp(sqlite3_stmt *stmt, int index);

// Native clock ticks so timestamps round-trip exactly; the zero time_point is stored as NULL.
std::int64_t toClockTicks(std::chrono::system_clock::time_point timestamp);
std::chrono::system_clock::time_point fromClockTicks(std::int64_t value);

} // namespace foldermind::sqlite

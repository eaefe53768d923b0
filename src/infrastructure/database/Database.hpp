#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>

namespace fleetwatch::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @param stmt Prepared statement handle; ownership is taken.
     */
    explicit Statement(sqlite3_stmt* stmt);

    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    void bind(int index, int64_t value);
    void bind(int index, const std::string& value);
    void bindNull(int index);

    /**
     * @brief Advances to the next row.
     * @return True if a row is available, false when done.
     * @throws std::runtime_error on SQLite failure.
     */
    bool step();

    int64_t columnInt64(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection with WAL journaling and versioned migrations.
 *
 * Failures are reported as std::runtime_error; callers translate them into
 * their own error types.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates the database at @p path (":memory:" is allowed).
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Database(const std::string& path);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void execute(const std::string& sql);

    Statement prepare(const std::string& sql);

    /**
     * @brief Rows changed by the most recent statement on this connection.
     */
    int changes() const;

    /**
     * @brief Runs @p func between BEGIN and COMMIT, rolling back if it throws.
     */
    template <typename Func>
    void transaction(Func&& func) {
        execute("BEGIN IMMEDIATE");
        try {
            func();
        } catch (...) {
            execute("ROLLBACK");
            throw;
        }
        execute("COMMIT");
    }

    /**
     * @brief Brings the schema to the latest version.
     */
    void runMigrations();

    int schemaVersion();

private:
    void configure();
    void setVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

} // namespace fleetwatch::infra

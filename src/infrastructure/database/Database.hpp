#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Exception raised for SQLite failures, carrying the result code.
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string& message, int resultCode)
        : std::runtime_error(message), resultCode_(resultCode) {}

    /**
     * @brief Returns the (extended) SQLite result code.
     */
    int resultCode() const { return resultCode_; }

    /**
     * @brief Checks whether the failure was a UNIQUE, FOREIGN KEY or similar constraint.
     */
    bool isConstraintViolation() const { return (resultCode_ & 0xFF) == SQLITE_CONSTRAINT; }

private:
    int resultCode_;
};

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * Provides type-safe parameter binding and column value extraction
 * for SQLite prepared statements. Supports move semantics.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Constructs a Statement from a raw SQLite statement handle.
     * @param stmt SQLite prepared statement handle (takes ownership).
     * @param mutex Connection lock held while the statement steps.
     */
    Statement(sqlite3_stmt* stmt, std::recursive_mutex* mutex);

    /**
     * @brief Destructor. Finalizes the statement.
     */
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /**
     * @brief Binds an integer value to a parameter.
     * @param index Parameter index (1-based).
     * @param value Integer value to bind.
     */
    void bind(int index, int value);

    /**
     * @brief Binds a double value to a parameter.
     * @param index Parameter index (1-based).
     * @param value Double value to bind.
     */
    void bind(int index, double value);

    /**
     * @brief Binds a string value to a parameter.
     * @param index Parameter index (1-based).
     * @param value String value to bind.
     */
    void bind(int index, const std::string& value);

    /**
     * @brief Binds a string, or NULL when the string is empty.
     * @param index Parameter index (1-based).
     * @param value String value to bind.
     */
    void bindTextOrNull(int index, const std::string& value);

    /**
     * @brief Binds NULL to a parameter.
     * @param index Parameter index (1-based).
     */
    void bindNull(int index);

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     * @throws DatabaseError on failure.
     */
    bool step();

    int columnInt(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
    std::recursive_mutex* mutex_{nullptr};
};

/**
 * @brief SQLite database wrapper with connection management.
 *
 * Provides high-level database operations including transactions,
 * prepared statements, and automatic schema migrations. Uses WAL
 * mode and enforces foreign keys.
 *
 * One connection is shared by all threads. Every statement step takes the
 * connection lock, and transaction() holds it for the whole transaction so
 * that statements from other threads never interleave with it.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database at the specified path.
     * @param path File path to the SQLite database.
     * @throws DatabaseError if database cannot be opened.
     */
    explicit Database(const std::string& path);

    /**
     * @brief Destructor. Closes the database connection.
     */
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes a SQL statement without returning results.
     * @param sql SQL statement to execute.
     * @throws DatabaseError on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a SQL statement for execution.
     * @param sql SQL statement to prepare.
     * @return Prepared Statement object.
     * @throws DatabaseError if preparation fails.
     */
    Statement prepare(const std::string& sql);

    /**
     * @brief Returns the number of rows affected by the last statement.
     *
     * Only meaningful while the caller holds the connection, i.e. inside
     * transaction().
     *
     * @return Number of changed rows.
     */
    int changes() const;

    /**
     * @brief Executes a function within a transaction.
     *
     * Commits on success or rolls back on exception. Nested calls join the
     * outermost transaction.
     *
     * @tparam Func Callable type.
     * @param func Function to execute within the transaction.
     */
    template <typename Func>
    void transaction(Func&& func) {
        std::lock_guard lock(mutex_);
        if (transactionDepth_ > 0) {
            ++transactionDepth_;
            try {
                func();
            } catch (...) {
                --transactionDepth_;
                throw;
            }
            --transactionDepth_;
            return;
        }

        beginTransaction();
        ++transactionDepth_;
        try {
            func();
        } catch (...) {
            --transactionDepth_;
            rollback();
            throw;
        }
        --transactionDepth_;
        commit();
    }

    /**
     * @brief Runs pending database schema migrations.
     */
    void runMigrations();

private:
    void beginTransaction();
    void commit();
    void rollback();

    void configureConnection();
    void createMigrationsTable();
    int getCurrentVersion();
    void setVersion(int version);

    sqlite3* db_{nullptr};
    mutable std::recursive_mutex mutex_;
    int transactionDepth_{0};
};

} // namespace rackscan::infra

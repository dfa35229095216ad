#pragma once

#include <xferq/core/types.h>

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace xferq::storage {

class SqliteConnection;

/**
 * @brief Owning handle for one prepared statement.
 *
 * Placeholders are 1-based. Column accessors are 0-based and only valid
 * after next() returned true.
 */
class SqliteStatement {
public:
    SqliteStatement() = default;
    ~SqliteStatement();

    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;
    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    Result<void> bindNull(int index);
    Result<void> bindInt64(int index, int64_t value);
    Result<void> bindReal(int index, double value);
    Result<void> bindText(int index, std::string_view value);

    /**
     * @brief Type-directed bind; std::nullopt binds SQL NULL.
     */
    template <typename T> Result<void> bind(int index, const T& value) {
        using V = std::decay_t<T>;
        if constexpr (std::is_same_v<V, std::nullptr_t>) {
            return bindNull(index);
        } else if constexpr (std::is_same_v<V, bool>) {
            return bindInt64(index, value ? 1 : 0);
        } else if constexpr (std::is_integral_v<V>) {
            return bindInt64(index, static_cast<int64_t>(value));
        } else if constexpr (std::is_floating_point_v<V>) {
            return bindReal(index, static_cast<double>(value));
        } else if constexpr (std::is_convertible_v<const V&, std::string_view>) {
            return bindText(index, std::string_view(value));
        } else {
            if (!value)
                return bindNull(index);
            return bind(index, *value);
        }
    }

    /// Binds each argument to consecutive placeholders starting at 1.
    template <typename... Args> Result<void> bindAll(const Args&... args) {
        int index = 0;
        Result<void> status{};
        ((status = status ? bind(++index, args) : status), ...);
        return status;
    }

    /// Runs a statement that produces no rows.
    Result<void> run();

    /// Advances to the next row; false once the result set is exhausted.
    Result<bool> next();

    bool isNull(int column) const;
    int64_t int64(int column) const;
    double real(int column) const;
    std::string text(int column) const;

    std::optional<int64_t> optInt64(int column) const;
    std::optional<double> optReal(int column) const;
    std::optional<std::string> optText(int column) const;

private:
    friend class SqliteConnection;
    SqliteStatement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

    Error stepError(int rc) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

struct SqliteOpenOptions {
    std::chrono::milliseconds busyTimeout{5000};
    bool writeAheadLog = true; ///< ignored for ":memory:"
};

/**
 * @brief Single SQLite connection, serialized (SQLITE_OPEN_FULLMUTEX).
 *
 * Opening creates the file if needed. Callers sharing a connection across
 * threads still serialize multi-statement work themselves.
 */
class SqliteConnection {
public:
    SqliteConnection() = default;
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    Result<void> open(const std::string& path, const SqliteOpenOptions& options = {});
    void close();
    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    Result<SqliteStatement> prepare(std::string_view sql);

    /// Executes one or more statements, discarding any rows.
    Result<void> exec(const std::string& sql);

    /// Rows modified by the most recent INSERT, UPDATE or DELETE.
    [[nodiscard]] int64_t changes() const;

    /**
     * @brief Runs fn inside BEGIN IMMEDIATE.
     *
     * Commits when fn succeeds; rolls back when it returns an error or throws.
     */
    template <typename Fn> Result<void> withTransaction(Fn&& fn) {
        auto begun = exec("BEGIN IMMEDIATE");
        if (!begun)
            return begun;
        RollbackGuard guard{this};
        auto result = fn();
        if (!result)
            return result;
        auto committed = exec("COMMIT");
        if (committed)
            guard.armed = false;
        return committed;
    }

    static std::string libraryVersion();

private:
    struct RollbackGuard {
        SqliteConnection* conn;
        bool armed = true;
        ~RollbackGuard() {
            if (armed)
                conn->rollbackQuietly();
        }
    };

    void rollbackQuietly() noexcept;

    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace xferq::storage

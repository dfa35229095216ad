#include <xferq/storage/sqlite_connection.h>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <utility>

namespace xferq::storage {

namespace {

Error sqliteError(sqlite3* db, int rc, std::string_view what) {
    const char* detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return Error{ErrorCode::DatabaseError, fmt::format("{}: {}", what, detail)};
}

} // namespace

// --- SqliteStatement --------------------------------------------------------

SqliteStatement::~SqliteStatement() {
    if (stmt_)
        sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (stmt_)
            sqlite3_finalize(stmt_);
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Result<void> SqliteStatement::bindNull(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK)
        return sqliteError(db_, rc, fmt::format("bind NULL to ?{}", index));
    return {};
}

Result<void> SqliteStatement::bindInt64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK)
        return sqliteError(db_, rc, fmt::format("bind integer to ?{}", index));
    return {};
}

Result<void> SqliteStatement::bindReal(int index, double value) {
    int rc = sqlite3_bind_double(stmt_, index, value);
    if (rc != SQLITE_OK)
        return sqliteError(db_, rc, fmt::format("bind real to ?{}", index));
    return {};
}

Result<void> SqliteStatement::bindText(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        return sqliteError(db_, rc, fmt::format("bind text to ?{}", index));
    return {};
}

Error SqliteStatement::stepError(int rc) const {
    const char* sql = stmt_ ? sqlite3_sql(stmt_) : nullptr;
    std::string_view text = sql ? std::string_view(sql) : std::string_view();
    if (text.size() > 80)
        text = text.substr(0, 80);
    return sqliteError(db_, rc, fmt::format("statement failed [{}]", text));
}

Result<void> SqliteStatement::run() {
    int rc = sqlite3_step(stmt_);
    while (rc == SQLITE_ROW)
        rc = sqlite3_step(stmt_);
    if (rc != SQLITE_DONE)
        return stepError(rc);
    return {};
}

Result<bool> SqliteStatement::next() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    return stepError(rc);
}

bool SqliteStatement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t SqliteStatement::int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double SqliteStatement::real(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string SqliteStatement::text(int column) const {
    const auto* bytes = sqlite3_column_text(stmt_, column);
    if (!bytes)
        return {};
    return std::string(reinterpret_cast<const char*>(bytes),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<int64_t> SqliteStatement::optInt64(int column) const {
    if (isNull(column))
        return std::nullopt;
    return int64(column);
}

std::optional<double> SqliteStatement::optReal(int column) const {
    if (isNull(column))
        return std::nullopt;
    return real(column);
}

std::optional<std::string> SqliteStatement::optText(int column) const {
    if (isNull(column))
        return std::nullopt;
    return text(column);
}

// --- SqliteConnection -------------------------------------------------------

SqliteConnection::~SqliteConnection() {
    close();
}

Result<void> SqliteConnection::open(const std::string& path, const SqliteOpenOptions& options) {
    if (db_)
        return Error{ErrorCode::InvalidState, "connection already open: " + path_};

    const bool inMemory = path == ":memory:";
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        auto err = sqliteError(handle, rc, "open " + path);
        sqlite3_close(handle);
        return err;
    }
    db_ = handle;
    path_ = path;

    sqlite3_busy_timeout(db_, static_cast<int>(options.busyTimeout.count()));
    if (options.writeAheadLog && !inMemory) {
        // WAL is an optimization; some filesystems refuse it.
        if (auto wal = exec("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;"); !wal)
            spdlog::warn("[sqlite] WAL unavailable for {}: {}", path, wal.error().message);
    }
    return {};
}

void SqliteConnection::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
}

Result<SqliteStatement> SqliteConnection::prepare(std::string_view sql) {
    if (!db_)
        return Error{ErrorCode::DatabaseError, "connection is not open"};
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return sqliteError(db_, rc, "prepare");
    }
    return SqliteStatement(db_, stmt);
}

Result<void> SqliteConnection::exec(const std::string& sql) {
    if (!db_)
        return Error{ErrorCode::DatabaseError, "connection is not open"};
    char* message = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string detail = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        return Error{ErrorCode::DatabaseError, "exec failed: " + detail};
    }
    return {};
}

int64_t SqliteConnection::changes() const {
    return db_ ? static_cast<int64_t>(sqlite3_changes(db_)) : 0;
}

void SqliteConnection::rollbackQuietly() noexcept {
    if (!db_)
        return;
    char* message = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &message) != SQLITE_OK) {
        spdlog::warn("[sqlite] rollback failed: {}", message ? message : "unknown");
    }
    sqlite3_free(message);
}

std::string SqliteConnection::libraryVersion() {
    return sqlite3_libversion();
}

} // namespace xferq::storage

#include <xferq/jobs/job_store.h>
#include <xferq/storage/schema_migrator.h>

#include <spdlog/spdlog.h>

#include <functional>

namespace xferq::jobs {

using storage::SchemaMigrator;
using storage::SchemaStep;
using storage::SqliteStatement;

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, kind, identifier, files, options, status, progress, transferred_bytes, "
    "total_bytes, rate, error, created_at, updated_at, started_at, completed_at FROM jobs";

constexpr const char* kNonTerminalSet = "('pending', 'running')";
constexpr const char* kTerminalSet = "('completed', 'failed', 'cancelled')";

const std::vector<SchemaStep>& jobSchema() {
    static const std::vector<SchemaStep> steps = {
        {1, "create jobs table", R"(
            CREATE TABLE IF NOT EXISTS jobs (
                id TEXT PRIMARY KEY,
                kind TEXT NOT NULL,
                identifier TEXT NOT NULL,
                files TEXT,
                options TEXT NOT NULL,
                status TEXT NOT NULL,
                progress REAL NOT NULL DEFAULT 0,
                transferred_bytes INTEGER,
                total_bytes INTEGER,
                rate REAL,
                error TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                started_at INTEGER,
                completed_at INTEGER
            );
            CREATE INDEX IF NOT EXISTS idx_jobs_status_created ON jobs(status, created_at);
        )"},
        {2, "index jobs by kind",
         "CREATE INDEX IF NOT EXISTS idx_jobs_kind_created ON jobs(kind, created_at);"},
    };
    return steps;
}

Error notOpen() {
    return Error{ErrorCode::DatabaseError, "job store is not open"};
}

Result<Job> readRow(const SqliteStatement& stmt) {
    Job job;
    job.id = stmt.text(0);

    auto kind = parseJobKind(stmt.text(1));
    if (!kind)
        return Error{ErrorCode::InvalidData, "unknown job kind for " + job.id};
    job.kind = *kind;

    job.target.identifier = stmt.text(2);
    if (auto files = stmt.optText(3)) {
        auto parsed = nlohmann::json::parse(*files, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_array())
            return Error{ErrorCode::InvalidData, "corrupt files column for " + job.id};
        for (const auto& f : parsed) {
            if (f.is_string())
                job.target.files.push_back(f.get<std::string>());
        }
    }

    auto optionsJson = nlohmann::json::parse(stmt.text(4), nullptr, false);
    if (optionsJson.is_discarded())
        return Error{ErrorCode::InvalidData, "corrupt options column for " + job.id};
    auto options = optionsFromJson(optionsJson);
    if (!options)
        return Error{ErrorCode::InvalidData,
                     "corrupt options for " + job.id + ": " + options.error().message};
    job.options = std::move(options).value();

    auto status = parseJobStatus(stmt.text(5));
    if (!status)
        return Error{ErrorCode::InvalidData, "unknown job status for " + job.id};
    job.status = *status;

    job.progress = stmt.real(6);
    job.transferredBytes = stmt.optInt64(7);
    job.totalBytes = stmt.optInt64(8);
    job.rate = stmt.optReal(9);
    job.error = stmt.optText(10);
    job.createdAt = fromEpochMillis(stmt.int64(11));
    job.updatedAt = fromEpochMillis(stmt.int64(12));
    if (auto started = stmt.optInt64(13))
        job.startedAt = fromEpochMillis(*started);
    if (auto completed = stmt.optInt64(14))
        job.completedAt = fromEpochMillis(*completed);
    return job;
}

} // namespace

SqliteJobStore::~SqliteJobStore() {
    close();
}

Result<void> SqliteJobStore::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_.isOpen())
        return {};

    auto opened = db_.open(path);
    if (!opened)
        return opened;

    SchemaMigrator schema(db_, jobSchema());
    auto migrated = schema.migrate();
    if (!migrated) {
        db_.close();
        return Error{ErrorCode::DatabaseError,
                     "job store migration failed: " + migrated.error().message};
    }

    spdlog::info("[JobStore] Opened {} (schema v{}, sqlite {})", path, migrated.value(),
                 storage::SqliteConnection::libraryVersion());
    return {};
}

void SqliteJobStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    db_.close();
}

bool SqliteJobStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_.isOpen();
}

Result<void> SqliteJobStore::create(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen())
        return notOpen();
    if (job.status != JobStatus::Pending)
        return Error{ErrorCode::InvalidArgument, "new jobs must be pending"};

    auto stmtResult = db_.prepare(
        "INSERT INTO jobs (id, kind, identifier, files, options, status, progress, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();
    SqliteStatement stmt = std::move(stmtResult).value();

    std::optional<std::string> files;
    if (!job.target.files.empty())
        files = nlohmann::json(job.target.files).dump();

    auto bound = stmt.bindAll(job.id, std::string(toString(job.kind)), job.target.identifier,
                              files, optionsToJson(job.options).dump(),
                              std::string(toString(job.status)), job.progress,
                              toEpochMillis(job.createdAt), toEpochMillis(job.updatedAt));
    if (!bound)
        return bound;
    return stmt.run();
}

Result<void> SqliteJobStore::update(const JobId& id, const JobPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen())
        return notOpen();

    std::string sql = "UPDATE jobs SET ";
    std::vector<std::function<Result<void>(SqliteStatement&, int)>> binders;

    auto set = [&](const char* column, auto value) {
        sql += column;
        sql += " = ?, ";
        binders.push_back([value](SqliteStatement& s, int index) { return s.bind(index, value); });
    };
    auto setTelemetry = [&](const char* column, const auto& value) {
        if (value) {
            set(column, *value);
        } else if (patch.clearTelemetry) {
            sql += column;
            sql += " = NULL, ";
        }
    };

    if (patch.status)
        set("status", std::string(toString(*patch.status)));
    if (patch.progress)
        set("progress", *patch.progress);
    setTelemetry("transferred_bytes", patch.transferredBytes);
    setTelemetry("total_bytes", patch.totalBytes);
    setTelemetry("rate", patch.rate);
    if (patch.error)
        set("error", *patch.error);
    if (patch.startedAt)
        set("started_at", toEpochMillis(*patch.startedAt));
    if (patch.completedAt)
        set("completed_at", toEpochMillis(*patch.completedAt));
    set("updated_at", toEpochMillis(patch.updatedAt));

    sql.resize(sql.size() - 2);
    sql += " WHERE id = ?";

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    SqliteStatement stmt = std::move(stmtResult).value();

    int index = 1;
    for (auto& bind : binders) {
        auto bound = bind(stmt, index++);
        if (!bound)
            return bound;
    }
    if (auto bound = stmt.bind(index, id); !bound)
        return bound;

    auto executed = stmt.run();
    if (!executed)
        return executed;
    if (db_.changes() == 0)
        return Error{ErrorCode::NotFound, "job not found: " + id};
    return {};
}

Result<Job> SqliteJobStore::get(const JobId& id) {
    auto rows = queryJobs(std::string(kSelectColumns) + " WHERE id = ?", {id});
    if (!rows)
        return rows.error();
    if (rows.value().empty())
        return Error{ErrorCode::NotFound, "job not found: " + id};
    return rows.value().front();
}

Result<std::vector<Job>> SqliteJobStore::list(const JobQuery& query) {
    std::string sql = kSelectColumns;
    std::vector<std::string> params;
    std::vector<std::string> where;

    switch (query.scope) {
        case JobQuery::Scope::All:
            break;
        case JobQuery::Scope::NonTerminal:
            where.push_back(std::string("status IN ") + kNonTerminalSet);
            break;
        case JobQuery::Scope::Terminal:
            where.push_back(std::string("status IN ") + kTerminalSet);
            break;
    }
    if (query.status) {
        where.emplace_back("status = ?");
        params.emplace_back(toString(*query.status));
    }
    if (query.kind) {
        where.emplace_back("kind = ?");
        params.emplace_back(toString(*query.kind));
    }
    for (std::size_t i = 0; i < where.size(); ++i) {
        sql += i == 0 ? " WHERE " : " AND ";
        sql += where[i];
    }
    sql += " ORDER BY created_at DESC, rowid DESC";
    if (query.limit)
        sql += " LIMIT " + std::to_string(*query.limit);

    return queryJobs(sql, params);
}

Result<std::size_t> SqliteJobStore::clearTerminal() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen())
        return notOpen();

    auto executed = db_.exec(std::string("DELETE FROM jobs WHERE status IN ") + kTerminalSet);
    if (!executed)
        return executed.error();
    auto removed = static_cast<std::size_t>(db_.changes());
    spdlog::info("[JobStore] Cleared {} terminal jobs", removed);
    return removed;
}

Result<std::vector<Job>> SqliteJobStore::findNonTerminal() {
    return queryJobs(std::string(kSelectColumns) + " WHERE status IN " + kNonTerminalSet +
                         " ORDER BY created_at ASC, rowid ASC",
                     {});
}

Result<std::size_t> SqliteJobStore::failNonTerminal(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen())
        return notOpen();

    std::size_t changed = 0;
    auto result = db_.withTransaction([&]() -> Result<void> {
        auto stmtResult = db_.prepare(
            std::string("UPDATE jobs SET status = 'failed', error = ?, transferred_bytes = NULL, "
                        "total_bytes = NULL, rate = NULL, updated_at = ?, completed_at = ? "
                        "WHERE status IN ") +
            kNonTerminalSet);
        if (!stmtResult)
            return stmtResult.error();
        SqliteStatement stmt = std::move(stmtResult).value();
        const int64_t now = toEpochMillis(nowMillis());
        auto bound = stmt.bindAll(reason, now, now);
        if (!bound)
            return bound;
        auto executed = stmt.run();
        if (!executed)
            return executed;
        changed = static_cast<std::size_t>(db_.changes());
        return {};
    });
    if (!result)
        return result.error();
    return changed;
}

Result<std::vector<Job>> SqliteJobStore::queryJobs(const std::string& sql,
                                                   const std::vector<std::string>& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_.isOpen())
        return notOpen();

    auto stmtResult = db_.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();
    SqliteStatement stmt = std::move(stmtResult).value();

    for (std::size_t i = 0; i < params.size(); ++i) {
        auto bound = stmt.bind(static_cast<int>(i + 1), params[i]);
        if (!bound)
            return bound.error();
    }

    std::vector<Job> jobs;
    while (true) {
        auto stepped = stmt.next();
        if (!stepped)
            return stepped.error();
        if (!stepped.value())
            break;
        auto job = readRow(stmt);
        if (!job) {
            spdlog::warn("[JobStore] Skipping unreadable row: {}", job.error().message);
            continue;
        }
        jobs.push_back(std::move(job).value());
    }
    return jobs;
}

std::unique_ptr<SqliteJobStore> makeSqliteJobStore() {
    return std::make_unique<SqliteJobStore>();
}

} // namespace xferq::jobs

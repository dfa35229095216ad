#pragma once

#include <xferq/jobs/job.h>
#include <xferq/storage/sqlite_connection.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xferq::jobs {

/**
 * @brief Durable record of every submitted job. Only component touching persistent storage.
 *
 * Every write is atomic per job and every read reflects the latest committed write.
 * Implementations must be safe to call from multiple threads.
 */
class IJobStore {
public:
    virtual ~IJobStore() = default;

    /**
     * @brief Insert a new record. The job must be pending.
     * @return DatabaseError on I/O failure; the job is not queued in that case.
     */
    virtual Result<void> create(const Job& job) = 0;

    /**
     * @brief Apply a partial update atomically.
     * @return NotFound for an unknown id, DatabaseError on I/O failure.
     */
    virtual Result<void> update(const JobId& id, const JobPatch& patch) = 0;

    virtual Result<Job> get(const JobId& id) = 0;

    /**
     * @brief Jobs matching the query, newest first.
     */
    virtual Result<std::vector<Job>> list(const JobQuery& query = {}) = 0;

    /**
     * @brief Delete every completed, failed and cancelled row.
     * @return number of rows removed
     */
    virtual Result<std::size_t> clearTerminal() = 0;

    /**
     * @brief All pending and running jobs, oldest first.
     */
    virtual Result<std::vector<Job>> findNonTerminal() = 0;

    /**
     * @brief Move every pending or running row to failed with the given reason in one
     * batch. Used only by startup recovery.
     * @return number of rows changed
     */
    virtual Result<std::size_t> failNonTerminal(const std::string& reason) = 0;
};

/**
 * @brief SQLite-backed job store (WAL, synchronous=NORMAL, busy timeout 5s).
 */
class SqliteJobStore : public IJobStore {
public:
    SqliteJobStore() = default;
    ~SqliteJobStore() override;

    SqliteJobStore(const SqliteJobStore&) = delete;
    SqliteJobStore& operator=(const SqliteJobStore&) = delete;

    /**
     * @brief Open (creating if needed) the database at path and apply schema migrations.
     * Use ":memory:" for a private in-memory database.
     */
    Result<void> open(const std::string& path);
    void close();
    bool isOpen() const;

    Result<void> create(const Job& job) override;
    Result<void> update(const JobId& id, const JobPatch& patch) override;
    Result<Job> get(const JobId& id) override;
    Result<std::vector<Job>> list(const JobQuery& query = {}) override;
    Result<std::size_t> clearTerminal() override;
    Result<std::vector<Job>> findNonTerminal() override;
    Result<std::size_t> failNonTerminal(const std::string& reason) override;

private:
    Result<std::vector<Job>> queryJobs(const std::string& sql,
                                       const std::vector<std::string>& params);

    mutable std::mutex mutex_;
    storage::SqliteConnection db_;
};

std::unique_ptr<SqliteJobStore> makeSqliteJobStore();

} // namespace xferq::jobs

// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <xferq/core/types.h>
#include <xferq/jobs/job_store.h>

#include <memory>
#include <string>
#include <vector>

namespace xferq::daemon {

/**
 * @brief Reconciles jobs left non-terminal by a previous process.
 *
 * A pending or running row found at startup has no live runner behind it. run() moves
 * every such row to failed with reason kInterruptedReason in one batch, so the store
 * never shows a job as active that nothing is executing.
 *
 * Must run after the store is open and before the JobManager accepts submissions.
 * Running it a second time finds nothing to do.
 */
class RecoveryService {
public:
    static constexpr const char* kInterruptedReason = "interrupted by restart";

    struct Report {
        std::size_t recovered{0};
        std::vector<JobId> ids; ///< Oldest first
    };

    explicit RecoveryService(std::shared_ptr<jobs::IJobStore> store);

    /**
     * @brief Fail every pending or running job.
     * @return the jobs that were recovered; DatabaseError if the batch could not be written
     */
    Result<Report> run();

private:
    std::shared_ptr<jobs::IJobStore> store_;
};

} // namespace xferq::daemon

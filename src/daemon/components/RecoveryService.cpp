// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#include <xferq/daemon/components/RecoveryService.h>

#include <spdlog/spdlog.h>

namespace xferq::daemon {

RecoveryService::RecoveryService(std::shared_ptr<jobs::IJobStore> store)
    : store_(std::move(store)) {}

Result<RecoveryService::Report> RecoveryService::run() {
    if (!store_)
        return Error{ErrorCode::NotInitialized, "recovery requires a job store"};

    auto stale = store_->findNonTerminal();
    if (!stale) {
        spdlog::error("[RecoveryService] Scan for interrupted jobs failed: {}",
                      stale.error().message);
        return stale.error();
    }

    Report report;
    if (stale.value().empty()) {
        spdlog::debug("[RecoveryService] No interrupted jobs");
        return report;
    }

    for (const auto& job : stale.value()) {
        report.ids.push_back(job.id);
        spdlog::debug("[RecoveryService] {} job {} was {} at shutdown", jobs::toString(job.kind),
                      job.id, jobs::toString(job.status));
    }

    auto failed = store_->failNonTerminal(kInterruptedReason);
    if (!failed) {
        spdlog::error("[RecoveryService] Failed to mark {} interrupted jobs: {}", report.ids.size(),
                      failed.error().message);
        return failed.error();
    }
    report.recovered = failed.value();
    spdlog::info("[RecoveryService] Marked {} interrupted jobs as failed", report.recovered);
    return report;
}

} // namespace xferq::daemon

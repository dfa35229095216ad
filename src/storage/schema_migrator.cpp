#include <xferq/storage/schema_migrator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace xferq::storage {

SchemaMigrator::SchemaMigrator(SqliteConnection& conn, std::vector<SchemaStep> steps)
    : conn_(conn), steps_(std::move(steps)) {
    std::stable_sort(steps_.begin(), steps_.end(),
                     [](const SchemaStep& a, const SchemaStep& b) { return a.version < b.version; });
}

int SchemaMigrator::targetVersion() const {
    return steps_.empty() ? 0 : steps_.back().version;
}

Result<void> SchemaMigrator::ensureTable() {
    return conn_.exec("CREATE TABLE IF NOT EXISTS schema_version ("
                      "version INTEGER PRIMARY KEY, "
                      "name TEXT NOT NULL, "
                      "applied_at INTEGER NOT NULL)");
}

Result<int> SchemaMigrator::currentVersion() {
    if (auto ready = ensureTable(); !ready)
        return ready.error();
    auto stmt = conn_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_version");
    if (!stmt)
        return stmt.error();
    auto select = std::move(stmt).value();
    auto row = select.next();
    if (!row)
        return row.error();
    return row.value() ? static_cast<int>(select.int64(0)) : 0;
}

Result<void> SchemaMigrator::applyStep(const SchemaStep& step) {
    return conn_.withTransaction([&]() -> Result<void> {
        if (auto applied = conn_.exec(step.sql); !applied)
            return applied;
        auto stmt =
            conn_.prepare("INSERT INTO schema_version (version, name, applied_at) VALUES (?, ?, ?)");
        if (!stmt)
            return stmt.error();
        auto insert = std::move(stmt).value();
        const int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
        if (auto bound = insert.bindAll(step.version, step.name, now); !bound)
            return bound;
        return insert.run();
    });
}

Result<int> SchemaMigrator::migrate() {
    auto current = currentVersion();
    if (!current)
        return current.error();

    int version = current.value();
    for (const auto& step : steps_) {
        if (step.version <= version)
            continue;
        if (auto applied = applyStep(step); !applied) {
            spdlog::error("[schema] step {} '{}' failed: {}", step.version, step.name,
                          applied.error().message);
            return applied.error();
        }
        spdlog::debug("[schema] applied step {} '{}'", step.version, step.name);
        version = step.version;
    }
    return version;
}

} // namespace xferq::storage

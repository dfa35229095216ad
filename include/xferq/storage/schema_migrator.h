#pragma once

#include <xferq/storage/sqlite_connection.h>

#include <string>
#include <vector>

namespace xferq::storage {

/// One forward-only schema change.
struct SchemaStep {
    int version = 0;
    std::string name;
    std::string sql;
};

/**
 * @brief Brings a database up to the newest SchemaStep.
 *
 * Applied versions are recorded in `schema_version`. Each pending step runs
 * in its own transaction together with its bookkeeping row, so a failing
 * step leaves the database at the previous version.
 */
class SchemaMigrator {
public:
    SchemaMigrator(SqliteConnection& conn, std::vector<SchemaStep> steps);

    /// Highest applied version, 0 for a fresh database.
    Result<int> currentVersion();

    /// Newest version known to this migrator.
    [[nodiscard]] int targetVersion() const;

    /// Applies pending steps in version order; returns the resulting version.
    Result<int> migrate();

private:
    Result<void> ensureTable();
    Result<void> applyStep(const SchemaStep& step);

    SqliteConnection& conn_;
    std::vector<SchemaStep> steps_;
};

} // namespace xferq::storage

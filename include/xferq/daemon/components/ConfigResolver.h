// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace xferq::daemon {

struct ServiceConfig;

/**
 * @brief Builds a ServiceConfig from defaults, config.toml and XFERQ_* variables.
 *
 * ## Precedence
 * command-line flags (applied by the caller) > environment > config file > defaults
 *
 * ## Recognized keys
 * - `[daemon]` data_dir, database, log_file, log_level
 * - `[jobs]` max_concurrent, cancel_grace, progress_interval, terminal_write_attempts,
 *   terminal_write_backoff, io_threads, subscriber_capacity
 * - `[transfer]` executable, download_root, kill_grace, poll_interval, poll_destination
 * - `[downloads]` ignore_existing, checksum, retries, timeout, no_directories,
 *   no_change_timestamp, on_the_fly
 *
 * Durations accept plain milliseconds or an `ms`/`s` suffix. Values that do not parse
 * are ignored with a warning.
 */
class ConfigResolver {
public:
    ConfigResolver() = delete;

    /// False for null, "", "0", "false", "off" and "no" (any case); true otherwise.
    static bool envTruthy(const char* value);

    /**
     * First existing file among XFERQ_CONFIG_PATH, $XDG_CONFIG_HOME/xferq/config.toml
     * and ~/.config/xferq/config.toml. An empty path means no config file.
     */
    static std::filesystem::path resolveDefaultConfigPath();

    /**
     * Reads `key = value` lines into "section.key" entries. Only the flat subset of
     * TOML that xferq's config uses is understood; a missing file yields an empty map.
     */
    static std::map<std::string, std::string> parseSimpleTomlFlat(const std::filesystem::path& path);

    static void applyFlat(const std::map<std::string, std::string>& values, ServiceConfig& config);

    /// XFERQ_DATA_DIR and XFERQ_MAX_CONCURRENT (clamped to 1..10).
    static void applyEnvironment(ServiceConfig& config);

    /// Defaults, then `explicitPath` (or the default search), then the environment.
    static ServiceConfig resolve(const std::filesystem::path& explicitPath = {});
};

} // namespace xferq::daemon

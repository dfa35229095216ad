// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#include <xferq/config/config_helpers.h>
#include <xferq/daemon/components/ConfigResolver.h>
#include <xferq/daemon/job_service.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace xferq::daemon {

namespace {

using Flat = std::map<std::string, std::string>;

const std::string* lookup(const Flat& values, const std::string& key) {
    auto it = values.find(key);
    return it == values.end() ? nullptr : &it->second;
}

void readPath(const Flat& values, const std::string& key, std::filesystem::path& out) {
    if (auto* v = lookup(values, key); v && !v->empty())
        out = config::expand_tilde(*v);
}

void readString(const Flat& values, const std::string& key, std::string& out) {
    if (auto* v = lookup(values, key); v && !v->empty())
        out = *v;
}

template <typename Int>
void readInt(const Flat& values, const std::string& key, Int& out, long long min, long long max) {
    auto* v = lookup(values, key);
    if (!v)
        return;
    auto n = config::parse_int(*v);
    if (!n || *n < min || *n > max) {
        spdlog::warn("[ConfigResolver] Ignoring {}='{}': expected an integer in [{}, {}]", key, *v,
                     min, max);
        return;
    }
    out = static_cast<Int>(*n);
}

void readBool(const Flat& values, const std::string& key, bool& out) {
    auto* v = lookup(values, key);
    if (!v)
        return;
    auto b = config::parse_bool(*v);
    if (!b) {
        spdlog::warn("[ConfigResolver] Ignoring {}='{}': expected true or false", key, *v);
        return;
    }
    out = *b;
}

void readDuration(const Flat& values, const std::string& key, std::chrono::milliseconds& out) {
    auto* v = lookup(values, key);
    if (!v)
        return;
    auto ms = config::parse_ms(*v);
    if (!ms) {
        spdlog::warn("[ConfigResolver] Ignoring {}='{}': expected a duration", key, *v);
        return;
    }
    out = *ms;
}

} // namespace

bool ConfigResolver::envTruthy(const char* value) {
    if (!value || !*value) {
        return false;
    }
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return !(v == "0" || v == "false" || v == "off" || v == "no");
}

std::filesystem::path ConfigResolver::resolveDefaultConfigPath() {
    if (const char* explicitPath = std::getenv("XFERQ_CONFIG_PATH"); explicitPath && *explicitPath) {
        std::filesystem::path p = config::expand_tilde(explicitPath);
        if (std::filesystem::exists(p))
            return p;
        spdlog::warn("[ConfigResolver] XFERQ_CONFIG_PATH={} does not exist", p.string());
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        std::filesystem::path p = std::filesystem::path(xdg) / "xferq" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        std::filesystem::path p = std::filesystem::path(home) / ".config" / "xferq" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    return {};
}

std::map<std::string, std::string>
ConfigResolver::parseSimpleTomlFlat(const std::filesystem::path& path) {
    std::map<std::string, std::string> values;
    std::ifstream file(path);
    if (!file)
        return values;

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        line = config::trimmed(line);
        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[') {
            auto end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                currentSection = config::trimmed(currentSection);
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        key = config::trimmed(key);
        value = config::trimmed(value);

        // Inline comments, unless the value is quoted
        if (!value.empty() && value.front() != '"' && value.front() != '\'') {
            auto comment = value.find('#');
            if (comment != std::string::npos) {
                value.resize(comment);
                value = config::trimmed(value);
            }
        } else if (!value.empty()) {
            auto close = value.find(value.front(), 1);
            if (close != std::string::npos)
                value.resize(close + 1);
        }
        value = config::unquote(value);

        if (!currentSection.empty())
            values[currentSection + "." + key] = value;
        else
            values[key] = value;
    }
    return values;
}

void ConfigResolver::applyFlat(const std::map<std::string, std::string>& values,
                               ServiceConfig& config) {
    readPath(values, "daemon.data_dir", config.dataDir);
    readPath(values, "daemon.database", config.databasePath);
    readPath(values, "daemon.log_file", config.logFile);
    readString(values, "daemon.log_level", config.logLevel);

    auto& jobs = config.jobs;
    readInt(values, "jobs.max_concurrent", jobs.maxConcurrent, JobManager::kMinConcurrent,
            JobManager::kMaxConcurrent);
    readDuration(values, "jobs.cancel_grace", jobs.cancelGracePeriod);
    readDuration(values, "jobs.progress_interval", jobs.progressInterval);
    readInt(values, "jobs.terminal_write_attempts", jobs.terminalWriteAttempts, 1, 100);
    readDuration(values, "jobs.terminal_write_backoff", jobs.terminalWriteBackoff);
    readInt(values, "jobs.io_threads", jobs.ioThreads, 1, 64);
    readInt(values, "jobs.subscriber_capacity", config.subscriberCapacity, 1, 1 << 20);

    readString(values, "transfer.executable", config.transfer.executable);
    readPath(values, "transfer.download_root", jobs.downloadRoot);
    readDuration(values, "transfer.kill_grace", config.transfer.killGrace);
    readDuration(values, "transfer.poll_interval", config.transfer.pollInterval);
    readBool(values, "transfer.poll_destination", config.transfer.pollDestination);

    auto& defaults = jobs.defaults;
    readBool(values, "downloads.ignore_existing", defaults.ignoreExisting);
    readBool(values, "downloads.checksum", defaults.checksum);
    readInt(values, "downloads.retries", defaults.retries, 0, 100);
    if (auto* v = lookup(values, "downloads.timeout")) {
        auto n = config::parse_int(*v);
        if (n && *n > 0 && *n <= 86400)
            defaults.timeoutSeconds = static_cast<int>(*n);
        else
            spdlog::warn("[ConfigResolver] Ignoring downloads.timeout='{}'", *v);
    }
    readBool(values, "downloads.no_directories", defaults.noDirectories);
    readBool(values, "downloads.no_change_timestamp", defaults.noChangeTimestamp);
    readBool(values, "downloads.on_the_fly", defaults.onTheFly);
}

void ConfigResolver::applyEnvironment(ServiceConfig& config) {
    if (const char* env = std::getenv("XFERQ_DATA_DIR"); env && *env)
        config.dataDir = config::expand_tilde(env);
    if (const char* env = std::getenv("XFERQ_MAX_CONCURRENT"); env && *env) {
        auto n = config::parse_int(env);
        if (n && *n > 0) {
            config.jobs.maxConcurrent = JobManager::clampConcurrency(static_cast<std::size_t>(*n));
        } else {
            spdlog::warn("[ConfigResolver] Ignoring XFERQ_MAX_CONCURRENT='{}'", env);
        }
    }
}

ServiceConfig ConfigResolver::resolve(const std::filesystem::path& explicitPath) {
    ServiceConfig config;
    config.dataDir = config::get_data_dir();

    auto path = explicitPath.empty() ? resolveDefaultConfigPath() : explicitPath;
    if (!path.empty()) {
        if (std::filesystem::exists(path)) {
            applyFlat(parseSimpleTomlFlat(path), config);
            config.configFilePath = path;
            spdlog::debug("[ConfigResolver] Loaded {}", path.string());
        } else {
            spdlog::warn("[ConfigResolver] Config file {} not found; using defaults", path.string());
        }
    }

    applyEnvironment(config);
    return config;
}

} // namespace xferq::daemon

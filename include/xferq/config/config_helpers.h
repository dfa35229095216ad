#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace xferq::config {

/// `s` without leading and trailing ASCII whitespace.
std::string trimmed(std::string_view s);

/// Strips one pair of matching single or double quotes after trimming.
std::string unquote(std::string_view s);

/// Expands a leading "~" or "~/" against $HOME; other paths are returned as-is.
std::filesystem::path expand_tilde(const std::string& path);

// Typed parsing of config and environment values. Each returns nullopt unless
// the whole (trimmed) text is a valid value.
std::optional<long long> parse_int(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);        // 1/0, true/false, yes/no, on/off
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s); // "750", "750ms", "5s"

/// $XDG_CONFIG_HOME/xferq, else ~/.config/xferq
std::filesystem::path get_config_dir();

/// $XDG_DATA_HOME/xferq, else ~/.local/share/xferq
std::filesystem::path get_data_dir();

} // namespace xferq::config

#include <xferq/config/config_helpers.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <initializer_list>
#include <system_error>

namespace xferq::config {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::filesystem::path envDir(const char* xdgVar, std::initializer_list<const char*> homeRelative,
                             const char* fallback) {
    if (const char* xdg = std::getenv(xdgVar); xdg && *xdg)
        return std::filesystem::path(xdg) / "xferq";
    if (const char* home = std::getenv("HOME"); home && *home) {
        std::filesystem::path dir(home);
        for (const char* part : homeRelative)
            dir /= part;
        return dir / "xferq";
    }
    return std::filesystem::current_path() / fallback;
}

} // namespace

std::string trimmed(std::string_view s) {
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return std::string(s);
}

std::string unquote(std::string_view s) {
    std::string v = trimmed(s);
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
        return v.substr(1, v.size() - 2);
    return v;
}

std::filesystem::path expand_tilde(const std::string& path) {
    const bool tilde = !path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/');
    const char* home = tilde ? std::getenv("HOME") : nullptr;
    if (!home)
        return path;
    std::filesystem::path base(home);
    return path.size() <= 2 ? base : base / path.substr(2);
}

std::optional<long long> parse_int(std::string_view s) {
    std::string text = trimmed(s);
    std::string_view digits(text);
    if (!digits.empty() && digits.front() == '+')
        digits.remove_prefix(1);
    if (digits.empty())
        return std::nullopt;
    long long value = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || end != digits.data() + digits.size())
        return std::nullopt;
    return value;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v = trimmed(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    std::string v = trimmed(s);
    std::string_view number(v);
    long long scale = 1;
    if (number.size() > 2 && number.substr(number.size() - 2) == "ms") {
        number.remove_suffix(2);
    } else if (number.size() > 1 && number.back() == 's') {
        number.remove_suffix(1);
        scale = 1000;
    }
    auto n = parse_int(number);
    if (!n || *n < 0)
        return std::nullopt;
    return std::chrono::milliseconds(*n * scale);
}

std::filesystem::path get_config_dir() {
    return envDir("XDG_CONFIG_HOME", {".config"}, ".xferq");
}

std::filesystem::path get_data_dir() {
    return envDir("XDG_DATA_HOME", {".local", "share"}, "xferq_data");
}

} // namespace xferq::config

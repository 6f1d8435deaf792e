#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace daemux::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Non-empty environment value or nullopt
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Strict millisecond parsing; nullopt on anything but a non-negative integer
std::optional<std::chrono::milliseconds> parse_ms(std::string_view s);

// Flattened view of a TOML-subset file: "section.key" -> unquoted value.
// Keys outside any section are stored without a prefix.
using ConfigMap = std::map<std::string, std::string>;

ConfigMap parse_config_file(const std::filesystem::path& config_path);

/// Returns the config file path
/// override > DAEMUX_CONFIG > $XDG_CONFIG_HOME/daemux/config.toml > ~/.config/daemux/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace daemux::config

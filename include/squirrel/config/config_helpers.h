#pragma once

#include <spdlog/common.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace squirrel::config {

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
    if (path == "~") {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home);
        }
    } else if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from a TOML config file. Returns "" when the file, section or key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// $XDG_CONFIG_HOME/squirrel/config.toml, or the override when non-empty.
std::filesystem::path get_config_path(const std::string& override_path = "");

// $XDG_DATA_HOME/squirrel, falling back to ~/.local/share/squirrel.
std::filesystem::path get_data_dir();

// Textual level (syslog-style names accepted) to spdlog level. Unknown names map to info.
spdlog::level::level_enum parseLogLevel(const std::string& level);

void applyLogLevel(const std::string& level);

} // namespace squirrel::config

#pragma once

#include <fragmenter/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace fragmenter::config {

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

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// Unix: $XDG_CONFIG_HOME/fragmenter/config.toml or ~/.config/fragmenter/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * Settings used by the command-line front end
 */
struct CliSettings {
    int64_t maxLength = DEFAULT_MAX_FRAGMENT_LENGTH;
    std::filesystem::path outputDir = "fragments";
    bool writeManifest = false;
};

// Parse a strictly decimal integer; InvalidArgument on anything else
Result<int64_t> parse_int(const std::string& raw);

/**
 * Resolve CLI settings from the [split] section of the config file.
 * Order: env (FRAGMENTER_MAX_LENGTH, FRAGMENTER_OUTPUT_DIR) > config file > defaults
 */
Result<CliSettings> resolve_cli_settings(const std::filesystem::path& config_path);

} // namespace fragmenter::config

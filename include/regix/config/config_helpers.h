#pragma once

#include <regix/core/types.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regix::config {

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
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// section -> key -> raw (unquoted) value
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Read every key of a TOML-subset file in one pass. Keys before the first section header
// land in section "". Dotted keys ("search.vector_weight") are split into section and key.
Result<ConfigSections> read_config_file(const std::filesystem::path& config_path);

// Parse a value from TOML config file ("" when absent or unreadable)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Accepts forms like "a,b" or ["a", "b"]; items are unquoted and trimmed.
std::vector<std::string> parse_string_list(const std::string& raw);

// Numeric parsing; nullopt on malformed input or trailing garbage
std::optional<float> parse_float(std::string_view s);
std::optional<long long> parse_integer(std::string_view s);

/// Returns the user config directory
/// $XDG_CONFIG_HOME/regix or ~/.config/regix
std::filesystem::path get_config_dir();

// Get standard config path ($REGIX_CONFIG wins unless override_path is given)
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace regix::config

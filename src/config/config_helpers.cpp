#include <regix/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace regix::config {

Result<ConfigSections> read_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + config_path.string()};
    }

    ConfigSections sections;
    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidData, config_path.string() + ":" +
                                                         std::to_string(lineNo) +
                                                         ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidData, config_path.string() + ":" +
                                                     std::to_string(lineNo) +
                                                     ": expected key = value"};
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        bool inQuote = false;
        char quote = 0;
        for (size_t i = 0; i < v.size(); ++i) {
            char c = v[i];
            if (inQuote) {
                if (c == quote) {
                    inQuote = false;
                }
            } else if (c == '"' || c == '\'') {
                inQuote = true;
                quote = c;
            } else if (c == '#') {
                v.resize(i);
                trim(v);
                break;
            }
        }

        std::string section = currentSection;
        if (auto dot = k.find('.'); dot != std::string::npos && currentSection.empty()) {
            section = k.substr(0, dot);
            k = k.substr(dot + 1);
        }
        sections[section][k] = unquote(v);
    }

    return sections;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto sections = read_config_file(config_path);
    if (!sections) {
        return "";
    }
    const auto& all = sections.value();
    auto sit = all.find(section);
    if (sit == all.end()) {
        return "";
    }
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? "" : kit->second;
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::string current;
    bool inQuote = false;
    char quote = 0;
    auto flush = [&]() {
        std::string item = unquote(current);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        current.clear();
    };
    for (char c : s) {
        if (inQuote) {
            if (c == quote) {
                inQuote = false;
            }
            current.push_back(c);
        } else if (c == '"' || c == '\'') {
            inQuote = true;
            quote = c;
            current.push_back(c);
        } else if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return out;
}

std::optional<float> parse_float(std::string_view s) {
    std::string tmp(s);
    trim(tmp);
    if (tmp.empty()) {
        return std::nullopt;
    }
    float value = 0.0f;
    auto [ptr, ec] = std::from_chars(tmp.data(), tmp.data() + tmp.size(), value);
    if (ec != std::errc{} || ptr != tmp.data() + tmp.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<long long> parse_integer(std::string_view s) {
    std::string tmp(s);
    trim(tmp);
    if (tmp.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    auto [ptr, ec] = std::from_chars(tmp.data(), tmp.data() + tmp.size(), value);
    if (ec != std::errc{} || ptr != tmp.data() + tmp.size()) {
        return std::nullopt;
    }
    return value;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "regix";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "regix";
    }
    return std::filesystem::path("~/.config") / "regix";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("REGIX_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace regix::config

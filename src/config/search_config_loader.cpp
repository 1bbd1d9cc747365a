#include <regix/common/utf8_utils.h>
#include <regix/config/config_helpers.h>
#include <regix/config/search_config_loader.h>

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <fstream>
#include <functional>
#include <map>
#include <string>

namespace regix::config {

using search::SearchConfig;

namespace {

using Setter = std::function<Result<void>(SearchConfig&, const std::string& key,
                                          const std::string& raw)>;

Error badValue(const std::string& key, const std::string& raw, const char* expected) {
    return Error{ErrorCode::InvalidData,
                 "Config key '" + key + "': expected " + expected + ", got '" + raw + "'"};
}

Setter floatField(float SearchConfig::*member) {
    return [member](SearchConfig& cfg, const std::string& key,
                    const std::string& raw) -> Result<void> {
        auto v = parse_float(raw);
        if (!v || *v < 0.0f) {
            return badValue(key, raw, "a non-negative number");
        }
        cfg.*member = *v;
        return {};
    };
}

Setter sizeField(size_t SearchConfig::*member) {
    return [member](SearchConfig& cfg, const std::string& key,
                    const std::string& raw) -> Result<void> {
        auto v = parse_integer(raw);
        if (!v || *v < 0) {
            return badValue(key, raw, "a non-negative integer");
        }
        cfg.*member = static_cast<size_t>(*v);
        return {};
    };
}

Setter listField(std::vector<std::string> SearchConfig::*member) {
    return [member](SearchConfig& cfg, const std::string&, const std::string& raw) -> Result<void> {
        cfg.*member = parse_string_list(raw);
        return {};
    };
}

const std::map<std::string, std::map<std::string, Setter>>& fieldTable() {
    static const std::map<std::string, std::map<std::string, Setter>> table = {
        {"search",
         {
             {"vector_weight", floatField(&SearchConfig::vectorWeight)},
             {"keyword_weight", floatField(&SearchConfig::keywordWeight)},
             {"metadata_weight", floatField(&SearchConfig::metadataWeight)},
             {"simple_query_results", sizeField(&SearchConfig::simpleQueryResults)},
             {"medium_query_results", sizeField(&SearchConfig::mediumQueryResults)},
             {"complex_query_results", sizeField(&SearchConfig::complexQueryResults)},
             {"candidate_multiplier", sizeField(&SearchConfig::candidateMultiplier)},
             {"worker_threads", sizeField(&SearchConfig::workerThreads)},
             {"component_timeout_ms",
              [](SearchConfig& cfg, const std::string& key,
                 const std::string& raw) -> Result<void> {
                  auto v = parse_integer(raw);
                  if (!v || *v < 0) {
                      return badValue(key, raw, "milliseconds >= 0");
                  }
                  cfg.componentTimeout = std::chrono::milliseconds(*v);
                  return {};
              }},
         }},
        {"relevance",
         {
             {"exact_match", floatField(&SearchConfig::exactMatchWeight)},
             {"partial_match", floatField(&SearchConfig::partialMatchWeight)},
             {"domain_keyword", floatField(&SearchConfig::domainKeywordWeight)},
             {"metadata_match", floatField(&SearchConfig::metadataMatchWeight)},
             {"content_quality", floatField(&SearchConfig::contentQualityWeight)},
             {"recency", floatField(&SearchConfig::recencyWeight)},
             {"authority", floatField(&SearchConfig::authorityWeight)},
             {"long_content_chars", sizeField(&SearchConfig::longContentChars)},
             {"medium_content_chars", sizeField(&SearchConfig::mediumContentChars)},
             {"authority_sources", listField(&SearchConfig::authoritySources)},
             {"recency_reference_year",
              [](SearchConfig& cfg, const std::string& key,
                 const std::string& raw) -> Result<void> {
                  auto v = parse_integer(raw);
                  if (!v || *v < 1 || *v > 9999) {
                      return badValue(key, raw, "a calendar year");
                  }
                  cfg.recencyReferenceYear = static_cast<int>(*v);
                  return {};
              }},
             {"recency_window_years",
              [](SearchConfig& cfg, const std::string& key,
                 const std::string& raw) -> Result<void> {
                  auto v = parse_integer(raw);
                  if (!v || *v < 1 || *v > 100) {
                      return badValue(key, raw, "a year count in [1, 100]");
                  }
                  cfg.recencyWindowYears = static_cast<int>(*v);
                  return {};
              }},
         }},
        {"selection",
         {
             {"low_quota", sizeField(&SearchConfig::lowComplexityQuota)},
             {"medium_quota", sizeField(&SearchConfig::mediumComplexityQuota)},
             {"high_quota", sizeField(&SearchConfig::highComplexityQuota)},
             {"high_threshold", floatField(&SearchConfig::highRelevanceThreshold)},
             {"medium_threshold", floatField(&SearchConfig::mediumRelevanceThreshold)},
             {"low_threshold", floatField(&SearchConfig::lowRelevanceThreshold)},
         }},
        {"tables",
         {
             {"stop_words", listField(&SearchConfig::stopWords)},
         }},
    };
    return table;
}

} // namespace

Result<search::KeywordTables> loadKeywordTables(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open keyword tables: " + path.string()};
    }

    try {
        const auto j = nlohmann::json::parse(in);
        if (!j.is_object()) {
            return Error{ErrorCode::InvalidData, "Keyword tables must be a JSON object"};
        }

        search::KeywordTables tables;
        if (auto it = j.find("domains"); it != j.end()) {
            for (const auto& d : *it) {
                search::DomainKeywords entry;
                entry.domain = d.at("name").get<std::string>();
                for (const auto& kw : d.at("keywords")) {
                    // Matched against lower-cased query and content text
                    entry.keywords.push_back(common::toLowerAscii(kw.get<std::string>()));
                }
                tables.domainKeywords.push_back(std::move(entry));
            }
        }
        if (auto it = j.find("synonyms"); it != j.end()) {
            for (const auto& [term, syns] : it->items()) {
                tables.synonyms[term] = syns.get<std::vector<std::string>>();
            }
        }

        spdlog::debug("Loaded keyword tables from {}: {} domains, {} synonym entries",
                      path.string(), tables.domainKeywords.size(), tables.synonyms.size());
        return tables;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     "Malformed keyword tables " + path.string() + ": " + e.what()};
    }
}

Result<void> applyEnvOverrides(SearchConfig& config) {
    if (const char* env = std::getenv("REGIX_COMPONENT_TIMEOUT_MS"); env && *env) {
        auto v = parse_integer(env);
        if (!v || *v < 0) {
            return badValue("REGIX_COMPONENT_TIMEOUT_MS", env, "milliseconds >= 0");
        }
        config.componentTimeout = std::chrono::milliseconds(*v);
    }
    if (const char* env = std::getenv("REGIX_WORKER_THREADS"); env && *env) {
        auto v = parse_integer(env);
        if (!v || *v < 1) {
            return badValue("REGIX_WORKER_THREADS", env, "a positive integer");
        }
        config.workerThreads = static_cast<size_t>(*v);
    }
    return {};
}

Result<SearchConfig> loadSearchConfig(const std::filesystem::path& path) {
    auto sections = read_config_file(path);
    if (!sections) {
        return sections.error();
    }

    SearchConfig config;
    const auto& table = fieldTable();

    for (const auto& [section, values] : sections.value()) {
        auto sit = table.find(section);
        if (sit == table.end()) {
            spdlog::debug("Ignoring config section [{}]", section);
            continue;
        }
        for (const auto& [key, raw] : values) {
            if (section == "tables" && key == "path") {
                continue;
            }
            auto kit = sit->second.find(key);
            if (kit == sit->second.end()) {
                spdlog::warn("Unknown config key {}.{} in {}", section, key, path.string());
                continue;
            }
            if (auto r = kit->second(config, section + "." + key, raw); !r) {
                return r.error();
            }
        }
    }

    if (auto tit = sections.value().find("tables"); tit != sections.value().end()) {
        if (auto pit = tit->second.find("path"); pit != tit->second.end() && !pit->second.empty()) {
            std::filesystem::path tablesPath = expand_tilde(pit->second);
            if (tablesPath.is_relative()) {
                tablesPath = path.parent_path() / tablesPath;
            }
            auto tables = loadKeywordTables(tablesPath);
            if (!tables) {
                return tables.error();
            }
            config.tables = std::move(tables).value();
        }
    }

    if (auto r = applyEnvOverrides(config); !r) {
        return r.error();
    }

    if (!config.isValid()) {
        return Error{ErrorCode::InvalidArgument,
                     "Inconsistent search configuration in " + path.string()};
    }

    spdlog::info("Loaded search config from {}", path.string());
    return config;
}

Result<SearchConfig> loadSearchConfig() {
    const bool explicitPath = std::getenv("REGIX_CONFIG") != nullptr;
    const auto path = get_config_path();

    if (!explicitPath && !std::filesystem::exists(path)) {
        SearchConfig config;
        if (auto r = applyEnvOverrides(config); !r) {
            return r.error();
        }
        if (!config.isValid()) {
            return Error{ErrorCode::InvalidArgument, "Inconsistent search configuration"};
        }
        spdlog::debug("No config at {}, using defaults", path.string());
        return config;
    }
    return loadSearchConfig(path);
}

} // namespace regix::config

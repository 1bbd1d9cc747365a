#pragma once

#include <regix/core/types.h>
#include <regix/search/search_config.h>

#include <filesystem>

namespace regix::config {

/**
 * @brief Load a SearchConfig from a TOML-subset file
 *
 * Recognized sections:
 * - [search]     fusion weights, candidate budgets, component_timeout_ms, worker_threads
 * - [relevance]  signal weights, content length thresholds, recency and authority settings
 * - [selection]  quotas and tier thresholds
 * - [tables]     path to a JSON keyword table file, stop_words list
 *
 * Keys not present keep their defaults. Unknown keys are logged and ignored. Environment
 * overrides are applied after the file. The result is validated with SearchConfig::isValid.
 *
 * @return NotFound if the file cannot be opened, InvalidData on malformed values,
 *         InvalidArgument if the merged configuration is inconsistent
 */
Result<search::SearchConfig> loadSearchConfig(const std::filesystem::path& path);

/**
 * @brief Load from the standard location
 *
 * Uses $REGIX_CONFIG, else $XDG_CONFIG_HOME/regix/config.toml (or ~/.config/...). A missing
 * default file is not an error: defaults plus environment overrides are returned. A missing
 * file named by $REGIX_CONFIG is NotFound.
 */
Result<search::SearchConfig> loadSearchConfig();

// REGIX_COMPONENT_TIMEOUT_MS, REGIX_WORKER_THREADS
Result<void> applyEnvOverrides(search::SearchConfig& config);

/**
 * @brief Load domain keywords and synonyms from JSON
 *
 * Format:
 * {
 *   "domains":  [{"name": "cloud", "keywords": ["cloud", "aws"]}, ...],
 *   "synonyms": {"클라우드": ["cloud", "cloud computing"], ...}
 * }
 * Either member may be omitted; an omitted member leaves that table empty.
 */
Result<search::KeywordTables> loadKeywordTables(const std::filesystem::path& path);

} // namespace regix::config

#pragma once

#include <regix/core/types.h>
#include <regix/search/search_config.h>
#include <regix/search/search_types.h>

#include <memory>
#include <string>
#include <vector>

namespace regix::search {

/**
 * @brief Classifies a raw query into complexity tier, domain matches and query type
 *
 * Matching is substring-based over the ASCII-lower-cased query. Complexity takes the tier
 * with the most indicator hits (ties resolved HIGH > MEDIUM > LOW, MEDIUM when nothing
 * matches). Query type is first-match-wins over the information, compliance, problem and
 * comparison term families.
 */
class QueryAnalyzer {
public:
    explicit QueryAnalyzer(std::shared_ptr<const SearchConfig> config);

    // Fails with InvalidQuery on empty or whitespace-only input
    Result<QueryAnalysis> analyze(const std::string& query) const;

    QueryType classifyQueryType(const std::string& queryLower) const;

private:
    QueryComplexity classifyComplexity(const std::string& queryLower) const;

    std::shared_ptr<const SearchConfig> config_;
};

} // namespace regix::search

#pragma once

#include <regix/search/search_config.h>
#include <regix/search/search_types.h>

#include <cstddef>
#include <memory>
#include <optional>

namespace regix::search {

/**
 * @brief Resolved execution plan for one search call
 */
struct SearchPlan {
    SearchMethod method = SearchMethod::HYBRID;
    size_t candidateBudget = 50; // Fused candidates kept before enhancement
    bool runVector = false;
    bool runKeyword = false;
    bool runMetadata = false;
    bool includeMetadataInFusion = false;
    bool normalizeFinalScores = false;

    size_t vectorLimit = 0;
    size_t keywordLimit = 0;
    size_t metadataLimit = 0;
};

/**
 * @brief Maps a QueryAnalysis and the requested method to a SearchPlan
 *
 * ADAPTIVE always resolves to HYBRID; the single-signal methods are reachable only by
 * explicit caller override.
 */
class StrategySelector {
public:
    explicit StrategySelector(std::shared_ptr<const SearchConfig> config);

    SearchMethod selectMethod(const QueryAnalysis& analysis, SearchMethod requested) const;

    size_t candidateBudget(QueryComplexity complexity) const;

    SearchPlan plan(const QueryAnalysis& analysis, SearchMethod requested,
                    std::optional<size_t> maxResults) const;

private:
    std::shared_ptr<const SearchConfig> config_;
};

} // namespace regix::search

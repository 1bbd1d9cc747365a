#pragma once

#include <regix/search/search_config.h>
#include <regix/search/search_types.h>

#include <memory>
#include <string_view>
#include <vector>

namespace regix::search {

enum class SelectionStrategy {
    HighRelevancePriority, // Enough high-tier candidates to fill the quota alone
    MixedRelevance,        // High and medium tiers
    AllLevels              // High, medium and low tiers
};

constexpr std::string_view selectionStrategyToString(SelectionStrategy s) {
    switch (s) {
        case SelectionStrategy::HighRelevancePriority:
            return "high_relevance_priority";
        case SelectionStrategy::MixedRelevance:
            return "mixed_relevance";
        case SelectionStrategy::AllLevels:
            return "all_levels";
    }
    return "all_levels";
}

struct Selection {
    std::vector<SearchResult> results; // Ranked 1..k
    SelectionStrategy strategy = SelectionStrategy::AllLevels;
};

/**
 * @brief Picks the final result set from relevance-sorted candidates
 *
 * Candidates are partitioned into high/medium/low tiers by relevanceScore; anything below
 * the low threshold is discarded. The quota depends on query complexity.
 */
class DocumentSelector {
public:
    explicit DocumentSelector(std::shared_ptr<const SearchConfig> config);

    /**
     * @brief Select and re-rank
     * @param candidates Must already be sorted by descending relevanceScore
     */
    Selection select(std::vector<SearchResult> candidates, QueryComplexity complexity) const;

    size_t quotaFor(QueryComplexity complexity) const;

private:
    std::shared_ptr<const SearchConfig> config_;
};

} // namespace regix::search

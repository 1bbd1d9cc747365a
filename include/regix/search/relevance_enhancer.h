#pragma once

#include <regix/search/search_config.h>
#include <regix/search/search_types.h>

#include <memory>
#include <string>
#include <vector>

namespace regix::search {

/**
 * @brief Per-signal contributions to a relevance score, before clamping
 */
struct RelevanceBreakdown {
    float exactMatch = 0.0f;
    float partialMatch = 0.0f;
    float domainKeyword = 0.0f;
    float metadataMatch = 0.0f;
    float contentQuality = 0.0f;
    float recency = 0.0f;
    float authority = 0.0f;

    float total() const {
        return exactMatch + partialMatch + domainKeyword + metadataMatch + contentQuality +
               recency + authority;
    }
};

/**
 * @brief Recomputes a domain-aware relevance score from seven weighted signals
 *
 * Independent of fusion's finalScore. The summed signals are clamped to [0, 1] and the
 * list is re-sorted by relevance with a stable sort, so equal scores keep fusion order.
 */
class RelevanceEnhancer {
public:
    explicit RelevanceEnhancer(std::shared_ptr<const SearchConfig> config);

    void enhance(const std::string& query, std::vector<SearchResult>& results) const;

    RelevanceBreakdown score(const std::string& query, const SearchResult& result) const;

private:
    std::shared_ptr<const SearchConfig> config_;
    std::vector<std::string> recentYears_;
};

} // namespace regix::search

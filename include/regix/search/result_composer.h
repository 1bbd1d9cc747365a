#pragma once

#include <regix/core/types.h>
#include <regix/search/document_selector.h>
#include <regix/search/search_config.h>
#include <regix/search/search_types.h>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace regix::search {

/**
 * @brief Per-call statistics echoed in the response envelope
 */
struct SearchStats {
    size_t totalResults = 0;
    double executionTimeSeconds = 0.0;
    std::map<std::string, size_t> sourceDistribution; // Source label -> count
    float avgRelevance = 0.0f;
    float maxRelevance = 0.0f;
    float minRelevance = 0.0f;
    std::string selectionStrategy;

    // Fusion weights in effect for this call
    float vectorWeight = 0.0f;
    float keywordWeight = 0.0f;
    float metadataWeight = 0.0f;

    std::vector<std::string> contributingComponents;
    std::vector<std::string> failedComponents;
    std::vector<std::string> timedOutComponents;
};

/**
 * @brief Response envelope returned by SearchEngine::search
 *
 * On failure success is false, results are empty and error carries the code and message.
 */
struct SearchResponse {
    std::string query;
    std::string method; // Resolved method name, or the requested name on entry failures
    QueryAnalysis queryAnalysis;
    std::vector<SearchResult> results;
    SearchStats stats;
    bool success = false;
    std::optional<Error> error;

    [[nodiscard]] bool hasResults() const { return !results.empty(); }
    [[nodiscard]] bool isDegraded() const {
        return !stats.failedComponents.empty() || !stats.timedOutComponents.empty();
    }
};

/**
 * @brief Component outcome lists gathered at the sub-search barrier
 */
struct ComponentReport {
    std::vector<std::string> contributing;
    std::vector<std::string> failed;
    std::vector<std::string> timedOut;
};

class ResultComposer {
public:
    explicit ResultComposer(std::shared_ptr<const SearchConfig> config);

    SearchResponse compose(const std::string& query, SearchMethod method,
                           const QueryAnalysis& analysis, Selection selection,
                           double executionTimeSeconds, ComponentReport report) const;

    SearchResponse errorResponse(const std::string& query, std::string method, Error error,
                                 double executionTimeSeconds) const;

private:
    std::shared_ptr<const SearchConfig> config_;
};

nlohmann::json toJson(const QueryAnalysis& analysis);
nlohmann::json toJson(const SearchResult& result);
nlohmann::json toJson(const SearchStats& stats);
nlohmann::json toJson(const SearchResponse& response);

} // namespace regix::search

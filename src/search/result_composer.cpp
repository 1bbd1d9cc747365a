#include <regix/search/result_composer.h>

#include <algorithm>
#include <utility>

namespace regix::search {

ResultComposer::ResultComposer(std::shared_ptr<const SearchConfig> config)
    : config_(std::move(config)) {}

SearchResponse ResultComposer::compose(const std::string& query, SearchMethod method,
                                       const QueryAnalysis& analysis, Selection selection,
                                       double executionTimeSeconds,
                                       ComponentReport report) const {
    SearchResponse response;
    response.query = query;
    response.method = searchMethodToString(method);
    response.queryAnalysis = analysis;
    response.results = std::move(selection.results);
    response.success = true;

    auto& stats = response.stats;
    stats.totalResults = response.results.size();
    stats.executionTimeSeconds = executionTimeSeconds;
    stats.selectionStrategy = std::string(selectionStrategyToString(selection.strategy));
    stats.vectorWeight = config_->vectorWeight;
    stats.keywordWeight = config_->keywordWeight;
    stats.metadataWeight = config_->metadataWeight;
    stats.contributingComponents = std::move(report.contributing);
    stats.failedComponents = std::move(report.failed);
    stats.timedOutComponents = std::move(report.timedOut);

    if (!response.results.empty()) {
        float sum = 0.0f;
        float maxRel = response.results.front().relevanceScore;
        float minRel = maxRel;
        for (const auto& r : response.results) {
            sum += r.relevanceScore;
            maxRel = std::max(maxRel, r.relevanceScore);
            minRel = std::min(minRel, r.relevanceScore);
            ++stats.sourceDistribution[documentSource(r.metadata)];
        }
        stats.avgRelevance = sum / static_cast<float>(response.results.size());
        stats.maxRelevance = maxRel;
        stats.minRelevance = minRel;
    }

    return response;
}

SearchResponse ResultComposer::errorResponse(const std::string& query, std::string method,
                                             Error error, double executionTimeSeconds) const {
    SearchResponse response;
    response.query = query;
    response.method = std::move(method);
    response.success = false;
    response.stats.executionTimeSeconds = executionTimeSeconds;
    response.stats.vectorWeight = config_->vectorWeight;
    response.stats.keywordWeight = config_->keywordWeight;
    response.stats.metadataWeight = config_->metadataWeight;
    response.error = std::move(error);
    return response;
}

nlohmann::json toJson(const QueryAnalysis& analysis) {
    nlohmann::json domains = nlohmann::json::object();
    for (const auto& [domain, keywords] : analysis.domainMatches) {
        domains[domain] = keywords;
    }
    return {{"complexity", complexityToString(analysis.complexity)},
            {"queryType", queryTypeToString(analysis.queryType)},
            {"domainMatches", std::move(domains)},
            {"hasTechnicalTerms", analysis.hasTechnicalTerms},
            {"wordCount", analysis.wordCount},
            {"charCount", analysis.charCount}};
}

nlohmann::json toJson(const SearchResult& result) {
    nlohmann::json j;
    j["id"] = result.id;
    j["content"] = result.content;
    j["metadata"] = result.metadata;
    j["scores"] = {{"vector", result.vectorScore},
                   {"keyword", result.keywordScore},
                   {"metadata", result.metadataScore},
                   {"relevance", result.relevanceScore},
                   {"final", result.finalScore}};
    j["rank"] = result.rank;
    if (result.distance) {
        j["distance"] = *result.distance;
    } else {
        j["distance"] = nullptr;
    }
    return j;
}

nlohmann::json toJson(const SearchStats& stats) {
    return {{"totalResults", stats.totalResults},
            {"executionTimeSeconds", stats.executionTimeSeconds},
            {"sourceDistribution", stats.sourceDistribution},
            {"avgRelevance", stats.avgRelevance},
            {"maxRelevance", stats.maxRelevance},
            {"minRelevance", stats.minRelevance},
            {"selectionStrategy", stats.selectionStrategy},
            {"vectorWeight", stats.vectorWeight},
            {"keywordWeight", stats.keywordWeight},
            {"metadataWeight", stats.metadataWeight},
            {"contributingComponents", stats.contributingComponents},
            {"failedComponents", stats.failedComponents},
            {"timedOutComponents", stats.timedOutComponents}};
}

nlohmann::json toJson(const SearchResponse& response) {
    nlohmann::json j;
    j["query"] = response.query;
    j["method"] = response.method;
    j["success"] = response.success;

    if (response.success) {
        j["queryAnalysis"] = toJson(response.queryAnalysis);
    }

    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : response.results) {
        results.push_back(toJson(r));
    }
    j["results"] = std::move(results);
    j["stats"] = toJson(response.stats);

    if (response.error) {
        j["error"] = {{"code", errorCodeName(response.error->code)},
                      {"message", response.error->message}};
    }
    return j;
}

} // namespace regix::search

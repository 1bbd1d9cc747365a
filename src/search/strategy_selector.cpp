#include <regix/search/strategy_selector.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace regix::search {

StrategySelector::StrategySelector(std::shared_ptr<const SearchConfig> config)
    : config_(std::move(config)) {}

SearchMethod StrategySelector::selectMethod(const QueryAnalysis& /*analysis*/,
                                            SearchMethod requested) const {
    // ADAPTIVE always resolves to HYBRID; the analysis is reserved for finer routing
    return requested == SearchMethod::ADAPTIVE ? SearchMethod::HYBRID : requested;
}

size_t StrategySelector::candidateBudget(QueryComplexity complexity) const {
    switch (complexity) {
        case QueryComplexity::HIGH:
            return config_->complexQueryResults;
        case QueryComplexity::MEDIUM:
            return config_->mediumQueryResults;
        case QueryComplexity::LOW:
            return config_->simpleQueryResults;
    }
    return config_->mediumQueryResults;
}

SearchPlan StrategySelector::plan(const QueryAnalysis& analysis, SearchMethod requested,
                                  std::optional<size_t> maxResults) const {
    SearchPlan p;
    p.method = selectMethod(analysis, requested);
    p.candidateBudget = (maxResults && *maxResults > 0) ? *maxResults
                                                        : candidateBudget(analysis.complexity);

    const size_t wide = p.candidateBudget * std::max<size_t>(1, config_->candidateMultiplier);
    switch (p.method) {
        case SearchMethod::VECTOR_ONLY:
            p.runVector = true;
            p.vectorLimit = p.candidateBudget;
            break;
        case SearchMethod::KEYWORD_ONLY:
            p.runKeyword = true;
            p.keywordLimit = p.candidateBudget;
            break;
        case SearchMethod::MULTI_MODAL:
            p.runMetadata = true;
            p.metadataLimit = p.candidateBudget;
            p.includeMetadataInFusion = true;
            p.normalizeFinalScores = true;
            [[fallthrough]];
        case SearchMethod::HYBRID:
        case SearchMethod::ADAPTIVE:
            p.runVector = true;
            p.runKeyword = true;
            p.vectorLimit = wide;
            p.keywordLimit = wide;
            break;
    }

    spdlog::debug("Search plan: method={} budget={} vector={} keyword={} metadata={}",
                  searchMethodToString(p.method), p.candidateBudget, p.vectorLimit,
                  p.keywordLimit, p.metadataLimit);
    return p;
}

} // namespace regix::search

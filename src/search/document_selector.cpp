#include <regix/search/document_selector.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace regix::search {

DocumentSelector::DocumentSelector(std::shared_ptr<const SearchConfig> config)
    : config_(std::move(config)) {}

size_t DocumentSelector::quotaFor(QueryComplexity complexity) const {
    switch (complexity) {
        case QueryComplexity::HIGH:
            return config_->highComplexityQuota;
        case QueryComplexity::MEDIUM:
            return config_->mediumComplexityQuota;
        case QueryComplexity::LOW:
            return config_->lowComplexityQuota;
    }
    return config_->mediumComplexityQuota;
}

Selection DocumentSelector::select(std::vector<SearchResult> candidates,
                                   QueryComplexity complexity) const {
    std::vector<SearchResult> high;
    std::vector<SearchResult> medium;
    std::vector<SearchResult> low;

    for (auto& c : candidates) {
        if (c.relevanceScore >= config_->highRelevanceThreshold) {
            high.push_back(std::move(c));
        } else if (c.relevanceScore >= config_->mediumRelevanceThreshold) {
            medium.push_back(std::move(c));
        } else if (c.relevanceScore >= config_->lowRelevanceThreshold) {
            low.push_back(std::move(c));
        }
    }

    const size_t quota = quotaFor(complexity);
    const size_t half = quota / 2;

    Selection selection;
    auto take = [&](std::vector<SearchResult>& tier) {
        for (auto& r : tier) {
            if (selection.results.size() >= quota) {
                break;
            }
            selection.results.push_back(std::move(r));
        }
    };

    if (high.size() >= half) {
        selection.strategy = SelectionStrategy::HighRelevancePriority;
        take(high);
    } else if (high.size() + medium.size() >= half) {
        selection.strategy = SelectionStrategy::MixedRelevance;
        take(high);
        take(medium);
    } else {
        selection.strategy = SelectionStrategy::AllLevels;
        take(high);
        take(medium);
        take(low);
    }

    for (size_t i = 0; i < selection.results.size(); ++i) {
        selection.results[i].rank = i + 1;
    }

    spdlog::debug("Selection: strategy={} quota={} high={} medium={} low={} selected={}",
                  selectionStrategyToString(selection.strategy), quota, high.size(),
                  medium.size(), low.size(), selection.results.size());

    return selection;
}

} // namespace regix::search

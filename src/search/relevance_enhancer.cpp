#include <regix/common/utf8_utils.h>
#include <regix/search/relevance_enhancer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <unordered_set>
#include <utility>

namespace regix::search {

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

RelevanceEnhancer::RelevanceEnhancer(std::shared_ptr<const SearchConfig> config)
    : config_(std::move(config)), recentYears_(config_->recentYears()) {}

RelevanceBreakdown RelevanceEnhancer::score(const std::string& query,
                                            const SearchResult& result) const {
    const SearchConfig& cfg = *config_;
    const std::string queryLower = common::toLowerAscii(query);
    const std::string contentLower = common::toLowerAscii(result.content);
    const std::string filename = common::toLowerAscii(documentFilename(result.metadata));

    // Ordered set keeps iteration deterministic
    const auto queryTokens = common::splitWhitespace(queryLower);
    const std::set<std::string> queryWords(queryTokens.begin(), queryTokens.end());
    const auto contentTokens = common::splitWhitespace(contentLower);
    const std::unordered_set<std::string> contentWords(contentTokens.begin(),
                                                       contentTokens.end());

    RelevanceBreakdown b;

    size_t exact = 0;
    for (const auto& word : queryWords) {
        if (contentWords.contains(word)) {
            ++exact;
        }
    }
    b.exactMatch = static_cast<float>(exact) * cfg.exactMatchWeight;

    for (const auto& word : queryWords) {
        if (common::codePointCount(word) > 2 && contains(contentLower, word)) {
            b.partialMatch += cfg.partialMatchWeight;
        }
    }

    for (const auto& domain : cfg.tables.domainKeywords) {
        const bool domainInQuery =
            std::any_of(domain.keywords.begin(), domain.keywords.end(),
                        [&](const std::string& kw) { return contains(queryLower, kw); });
        if (!domainInQuery) {
            continue;
        }
        for (const auto& kw : domain.keywords) {
            if (contains(contentLower, kw)) {
                b.domainKeyword += cfg.domainKeywordWeight;
                break;
            }
        }
    }

    for (const auto& word : queryWords) {
        if (common::codePointCount(word) > 2 && contains(filename, word)) {
            b.metadataMatch += cfg.metadataMatchWeight;
        }
    }

    const size_t length = common::codePointCount(result.content);
    if (length > cfg.longContentChars) {
        b.contentQuality = cfg.contentQualityWeight;
    } else if (length > cfg.mediumContentChars) {
        b.contentQuality = cfg.contentQualityWeight * 0.5f;
    }

    if (std::any_of(recentYears_.begin(), recentYears_.end(),
                    [&](const std::string& year) { return contains(filename, year); })) {
        b.recency = cfg.recencyWeight;
    }

    if (std::any_of(cfg.authoritySources.begin(), cfg.authoritySources.end(),
                    [&](const std::string& source) {
                        return contains(filename, common::toLowerAscii(source));
                    })) {
        b.authority = cfg.authorityWeight;
    }

    return b;
}

void RelevanceEnhancer::enhance(const std::string& query,
                                std::vector<SearchResult>& results) const {
    if (results.empty()) {
        return;
    }

    for (auto& r : results) {
        r.relevanceScore = std::clamp(score(query, r).total(), 0.0f, 1.0f);
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         return a.relevanceScore > b.relevanceScore;
                     });
}

} // namespace regix::search

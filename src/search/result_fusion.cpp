#include <regix/search/result_fusion.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace regix::search {

ResultFusion::ResultFusion(std::shared_ptr<const SearchConfig> config)
    : config_(std::move(config)) {}

float ResultFusion::compositeScore(const SearchResult& r, bool includeMetadata) const {
    float score = r.vectorScore * config_->vectorWeight + r.keywordScore * config_->keywordWeight;
    if (includeMetadata) {
        score += r.metadataScore * config_->metadataWeight;
    }
    return score;
}

std::vector<SearchResult> ResultFusion::fuse(const ComponentResults& components,
                                             const Options& options) const {
    // Union in first-seen order: vector, then keyword-only, then metadata-only ids
    std::vector<SearchResult> merged;
    merged.reserve(components.vector.size() + components.keyword.size() +
                   components.metadata.size());
    std::unordered_map<std::string, size_t> index;
    index.reserve(merged.capacity());

    auto absorb = [&](const std::vector<SearchResult>& source, auto&& applyScore) {
        for (const auto& candidate : source) {
            auto [it, inserted] = index.try_emplace(candidate.id, merged.size());
            if (inserted) {
                SearchResult r;
                r.id = candidate.id;
                r.content = candidate.content;
                r.metadata = candidate.metadata;
                r.distance = candidate.distance;
                merged.push_back(std::move(r));
            }
            applyScore(merged[it->second], candidate);
        }
    };

    absorb(components.vector, [](SearchResult& r, const SearchResult& c) {
        r.vectorScore = c.vectorScore;
        r.distance = c.distance;
    });
    absorb(components.keyword,
           [](SearchResult& r, const SearchResult& c) { r.keywordScore = c.keywordScore; });
    absorb(components.metadata,
           [](SearchResult& r, const SearchResult& c) { r.metadataScore = c.metadataScore; });

    float maxScore = 0.0f;
    for (auto& r : merged) {
        r.finalScore = compositeScore(r, options.includeMetadata);
        maxScore = std::max(maxScore, r.finalScore);
    }

    if (options.normalize && maxScore > 0.0f) {
        for (auto& r : merged) {
            r.finalScore /= maxScore;
        }
    }

    std::stable_sort(merged.begin(), merged.end(), [](const SearchResult& a, const SearchResult& b) {
        return a.finalScore > b.finalScore;
    });
    if (options.maxResults > 0 && merged.size() > options.maxResults) {
        merged.resize(options.maxResults);
    }

    spdlog::debug("Fused {} vector, {} keyword, {} metadata candidates into {}",
                  components.vector.size(), components.keyword.size(),
                  components.metadata.size(), merged.size());
    return merged;
}

} // namespace regix::search

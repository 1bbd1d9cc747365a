#pragma once

#include <regix/search/search_config.h>
#include <regix/search/search_types.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace regix::search {

/**
 * @brief Per-signal candidate lists handed to fusion after the sub-search barrier
 */
struct ComponentResults {
    std::vector<SearchResult> vector;
    std::vector<SearchResult> keyword;
    std::vector<SearchResult> metadata;
};

/**
 * @brief Merges sub-search candidates by document id into a weighted composite
 *
 * The id set of the output is the union of the inputs; a signal absent for an id stays
 * 0.0. Record content/metadata prefer the vector hit, then keyword, then metadata. The
 * output is stably sorted by finalScore, so fusion is deterministic for identical inputs.
 */
class ResultFusion {
public:
    struct Options {
        bool includeMetadata = false; // Add metadataScore * metadataWeight
        bool normalize = false;       // Divide by the batch maximum (skipped when it is 0)
        size_t maxResults = 0;        // 0 = keep everything
    };

    explicit ResultFusion(std::shared_ptr<const SearchConfig> config);

    std::vector<SearchResult> fuse(const ComponentResults& components,
                                   const Options& options) const;

    float compositeScore(const SearchResult& r, bool includeMetadata) const;

private:
    std::shared_ptr<const SearchConfig> config_;
};

} // namespace regix::search

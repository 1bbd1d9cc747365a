#include <regix/search/vector_search_adapter.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace regix::search {

VectorSearchAdapter::VectorSearchAdapter(std::shared_ptr<vector::IVectorStore> store,
                                         std::shared_ptr<vector::IEmbeddingFunction> embedder)
    : store_(std::move(store)), embedder_(std::move(embedder)) {}

Result<std::vector<SearchResult>> VectorSearchAdapter::search(const std::string& query, size_t n,
                                                              const MetadataFilter* filter,
                                                              std::stop_token stopToken) const {
    if (!isAvailable()) {
        return Error{ErrorCode::NotInitialized, "Vector store or embedding function not set"};
    }
    if (n == 0) {
        return std::vector<SearchResult>{};
    }

    Result<std::vector<float>> embedding = Error{ErrorCode::Unknown};
    Result<std::vector<vector::VectorMatch>> matches = Error{ErrorCode::Unknown};
    try {
        embedding = embedder_->embed(query);
        if (!embedding) {
            return Error{ErrorCode::UpstreamError,
                         "Query embedding failed: " + embedding.error().message};
        }
        if (stopToken.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Vector search cancelled"};
        }
        matches = store_->queryNearest(embedding.value(), n, filter);
    } catch (const std::exception& e) {
        return Error{ErrorCode::UpstreamError, std::string("Vector store exception: ") + e.what()};
    }

    if (!matches) {
        return Error{ErrorCode::UpstreamError,
                     "Vector store query failed: " + matches.error().message};
    }
    if (stopToken.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Vector search cancelled"};
    }

    const auto& hits = matches.value();
    std::vector<SearchResult> results;
    results.reserve(std::min(n, hits.size()));
    for (const auto& hit : hits) {
        if (results.size() >= n) {
            break;
        }
        if (hit.distance < 0.0f) {
            return Error{ErrorCode::UpstreamError,
                         "Vector store returned negative distance for '" + hit.id + "'"};
        }
        SearchResult r;
        r.id = hit.id;
        r.content = hit.content;
        r.metadata = hit.metadata;
        r.vectorScore = 1.0f - hit.distance;
        r.distance = hit.distance;
        results.push_back(std::move(r));
    }

    spdlog::debug("Vector search returned {} candidates (requested {})", results.size(), n);
    return results;
}

} // namespace regix::search

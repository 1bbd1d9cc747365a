#pragma once

#include <regix/core/types.h>
#include <regix/search/search_types.h>
#include <regix/vector/embedding_function.h>
#include <regix/vector/vector_store.h>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace regix::search {

/**
 * @brief Wraps the external vector store behind the sub-search contract
 *
 * Embeds the query with the injected embedding function, asks the store for the nearest
 * neighbors and converts cosine distance to vectorScore = 1.0 - distance. Store and
 * embedding failures, as well as negative distances (a store-contract violation), come
 * back as UpstreamError; the engine degrades those to an empty contribution.
 */
class VectorSearchAdapter {
public:
    VectorSearchAdapter(std::shared_ptr<vector::IVectorStore> store,
                        std::shared_ptr<vector::IEmbeddingFunction> embedder);

    Result<std::vector<SearchResult>> search(const std::string& query, size_t n,
                                             const MetadataFilter* filter = nullptr,
                                             std::stop_token stopToken = {}) const;

    bool isAvailable() const { return store_ && embedder_; }

private:
    std::shared_ptr<vector::IVectorStore> store_;
    std::shared_ptr<vector::IEmbeddingFunction> embedder_;
};

} // namespace regix::search

#pragma once

#include <regix/core/types.h>
#include <regix/search/search_types.h>

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <vector>

namespace regix::vector {

/**
 * @brief Raw nearest-neighbor hit returned by a vector store
 */
struct VectorMatch {
    std::string id;
    std::string content;
    search::Metadata metadata;
    float distance = 0.0f; // Cosine distance in [0, 2]
};

/**
 * @brief Abstract interface for the external vector store
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    /**
     * @brief KNN query
     *
     * @param embedding Query vector
     * @param k Number of nearest neighbors to return
     * @param filter Optional metadata predicate (nullptr = no filtering)
     * @return Up to k matches ordered by ascending distance
     */
    virtual Result<std::vector<VectorMatch>>
    queryNearest(const std::vector<float>& embedding, size_t k,
                 const search::MetadataFilter* filter = nullptr) = 0;

    virtual size_t size() const = 0;
};

/**
 * Brute-force cosine store held in memory. Reads take a shared lock, so concurrent
 * queries from sub-search tasks do not serialize.
 */
class InMemoryVectorStore final : public IVectorStore {
public:
    explicit InMemoryVectorStore(size_t dimension);

    Result<void> addVector(const std::string& id, const std::string& content,
                           const search::Metadata& metadata, std::vector<float> embedding);

    Result<std::vector<VectorMatch>> queryNearest(const std::vector<float>& embedding, size_t k,
                                                  const search::MetadataFilter* filter) override;

    size_t size() const override;
    size_t dimension() const { return dimension_; }

private:
    struct Record {
        std::string id;
        std::string content;
        search::Metadata metadata;
        std::vector<float> embedding;
    };

    size_t dimension_;
    std::vector<Record> records_;
    mutable std::shared_mutex mutex_;
};

} // namespace regix::vector

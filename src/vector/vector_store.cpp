#include <regix/vector/embedding_function.h>
#include <regix/vector/vector_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace regix::vector {

InMemoryVectorStore::InMemoryVectorStore(size_t dimension) : dimension_(dimension) {}

Result<void> InMemoryVectorStore::addVector(const std::string& id, const std::string& content,
                                            const search::Metadata& metadata,
                                            std::vector<float> embedding) {
    if (id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Vector id must not be empty"};
    }
    if (embedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     "Embedding dimension " + std::to_string(embedding.size()) +
                         " does not match store dimension " + std::to_string(dimension_)};
    }

    std::unique_lock lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const Record& r) { return r.id == id; });
    if (it != records_.end()) {
        it->content = content;
        it->metadata = metadata;
        it->embedding = std::move(embedding);
        return Result<void>();
    }
    records_.push_back(Record{id, content, metadata, std::move(embedding)});
    return Result<void>();
}

Result<std::vector<VectorMatch>>
InMemoryVectorStore::queryNearest(const std::vector<float>& embedding, size_t k,
                                  const search::MetadataFilter* filter) {
    if (embedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     "Query dimension " + std::to_string(embedding.size()) +
                         " does not match store dimension " + std::to_string(dimension_)};
    }

    std::shared_lock lock(mutex_);
    std::vector<std::pair<float, const Record*>> scored;
    scored.reserve(records_.size());
    for (const auto& record : records_) {
        if (filter && filter->hasFilters() && !filter->matches(record.id, record.metadata)) {
            continue;
        }
        auto distance = embedding_utils::cosineDistance(embedding, record.embedding);
        if (!distance) {
            return distance.error();
        }
        scored.emplace_back(distance.value(), &record);
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    const size_t count = std::min(k, scored.size());
    std::vector<VectorMatch> matches;
    matches.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const Record& r = *scored[i].second;
        matches.push_back(VectorMatch{r.id, r.content, r.metadata, scored[i].first});
    }
    return matches;
}

size_t InMemoryVectorStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace regix::vector

#pragma once

#include <regix/core/types.h>
#include <regix/search/search_types.h>

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace regix::search {

/**
 * @brief Abstract interface for the external document/metadata store
 */
class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;

    // Every document passing the filter (nullptr = whole corpus), in store order
    virtual Result<std::vector<Document>> getAll(const MetadataFilter* filter = nullptr) = 0;

    virtual size_t size() const = 0;
};

/**
 * In-memory document store. Insertion order is the scan order, which keeps keyword and
 * metadata tie-breaking reproducible.
 */
class InMemoryDocumentStore final : public IDocumentStore {
public:
    InMemoryDocumentStore() = default;

    Result<void> addDocument(Document document);

    Result<std::vector<Document>> getAll(const MetadataFilter* filter) override;

    size_t size() const override;

private:
    std::vector<Document> documents_;
    mutable std::shared_mutex mutex_;
};

/**
 * @brief One entry of a JSON corpus file
 */
struct CorpusEntry {
    Document document;
    std::optional<std::vector<float>> embedding;
};

/**
 * Load a JSON corpus: an array of {"id", "content", "metadata": {...}, "embedding": [...]}.
 * Numeric and boolean metadata values are stringified.
 */
Result<std::vector<CorpusEntry>> loadCorpusFile(const std::filesystem::path& path);

} // namespace regix::search

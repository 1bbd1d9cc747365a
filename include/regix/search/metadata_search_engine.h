#pragma once

#include <regix/core/types.h>
#include <regix/search/document_store.h>
#include <regix/search/search_types.h>

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace regix::search {

/**
 * @brief Scores documents by query terms against structured metadata fields
 *
 * Each field awards its full weight once if any query term is a substring of the
 * lower-cased field value: filename 0.4, category 0.3, document_type 0.2, domain 0.1.
 */
class MetadataSearchEngine {
public:
    struct FieldWeight {
        const char* field;
        float weight;
    };

    explicit MetadataSearchEngine(std::shared_ptr<IDocumentStore> store);

    Result<std::vector<SearchResult>> search(const std::string& query, size_t n,
                                             const MetadataFilter* filter = nullptr,
                                             std::stop_token stopToken = {}) const;

    static float scoreMetadata(const std::vector<std::string>& queryTerms,
                               const Metadata& metadata);

private:
    std::shared_ptr<IDocumentStore> store_;
};

} // namespace regix::search

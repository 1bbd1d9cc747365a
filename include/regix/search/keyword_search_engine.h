#pragma once

#include <regix/core/types.h>
#include <regix/search/document_store.h>
#include <regix/search/search_config.h>
#include <regix/search/search_types.h>

#include <memory>
#include <stop_token>
#include <string>
#include <unordered_set>
#include <vector>

namespace regix::search {

/**
 * @brief Lexical sub-search with synonym expansion over the (filtered) corpus
 *
 * Score per document is the mean over expanded keywords of 1.0 for a whole-word match,
 * 0.5 for a substring-only match and 0 otherwise (case-insensitive), clamped to 1.0.
 * This is a full scan of IDocumentStore::getAll and checks the stop token between
 * documents.
 */
class KeywordSearchEngine {
public:
    KeywordSearchEngine(std::shared_ptr<IDocumentStore> store,
                        std::shared_ptr<const SearchConfig> config);

    Result<std::vector<SearchResult>> search(const std::string& query, size_t n,
                                             const MetadataFilter* filter = nullptr,
                                             std::stop_token stopToken = {}) const;

    // Punctuation stripped, whitespace split, short tokens and stop words dropped
    std::vector<std::string> extractKeywords(const std::string& query) const;

    // Keywords plus their synonyms, de-duplicated in first-seen order
    std::vector<std::string> expandKeywords(const std::vector<std::string>& keywords) const;

    static float scoreDocument(const std::string& content,
                               const std::vector<std::string>& keywords);

private:
    std::shared_ptr<IDocumentStore> store_;
    std::shared_ptr<const SearchConfig> config_;
    std::unordered_set<std::string> stopWords_;
};

} // namespace regix::search

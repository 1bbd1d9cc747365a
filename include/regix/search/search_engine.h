#pragma once

#include <regix/core/types.h>
#include <regix/search/document_store.h>
#include <regix/search/result_composer.h>
#include <regix/search/search_config.h>
#include <regix/search/search_types.h>
#include <regix/vector/embedding_function.h>
#include <regix/vector/vector_store.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

namespace regix::search {

/**
 * @brief Process-lifetime search statistics
 */
struct SearchStatistics {
    uint64_t totalSearches = 0;
    double avgSearchTimeSeconds = 0.0; // Running average over completed searches
};

/**
 * @brief Static capabilities of a configured engine
 */
struct EngineInfo {
    std::vector<std::string> supportedMethods;
    size_t domainKeywordCount = 0;
    size_t synonymCount = 0;
    float vectorWeight = 0.0f;
    float keywordWeight = 0.0f;
    float metadataWeight = 0.0f;
};

/**
 * @brief Corpus summary taken from the document store
 */
struct CorpusInfo {
    size_t totalDocuments = 0;
    std::vector<std::string> sampleMetadataKeys; // Keys of the first stored document
};

/**
 * @brief Hybrid retrieval and ranking engine
 *
 * Per call:
 * 1. Analyze the query (complexity, domain terms, query type)
 * 2. Resolve the method and candidate budget
 * 3. Run the vector, keyword and metadata sub-searches the method needs in parallel
 * 4. Fuse by document id, recompute domain relevance, select by tier and quota
 * 5. Compose the response envelope
 *
 * Sub-search failures and timeouts degrade to empty contributions and are reported in the
 * response statistics. search() never throws; entry failures, cancellation, deadline expiry
 * and total sub-search failure produce an error envelope.
 *
 * Concurrent calls to search() are safe. Sub-searches run on an engine-owned thread pool
 * unless an executor is injected with setExecutor().
 */
class SearchEngine {
public:
    /**
     * @brief Construct a new SearchEngine
     *
     * @param config Immutable configuration shared with the components
     * @param documentStore Corpus for keyword and metadata search
     * @param vectorStore Nearest-neighbour store (may be null: vector search then fails soft)
     * @param embedder Query embedding function (may be null, as above)
     */
    SearchEngine(std::shared_ptr<const SearchConfig> config,
                 std::shared_ptr<IDocumentStore> documentStore,
                 std::shared_ptr<vector::IVectorStore> vectorStore,
                 std::shared_ptr<vector::IEmbeddingFunction> embedder);

    ~SearchEngine();

    // Non-copyable, movable
    SearchEngine(const SearchEngine&) = delete;
    SearchEngine& operator=(const SearchEngine&) = delete;
    SearchEngine(SearchEngine&&) noexcept;
    SearchEngine& operator=(SearchEngine&&) noexcept;

    SearchResponse search(const std::string& query, const SearchOptions& options = {});

    /**
     * @brief Search with the method given by name
     *
     * Unrecognized names produce an UnknownMethod error envelope; options.method is ignored.
     */
    SearchResponse search(const std::string& query, const std::string& method,
                          SearchOptions options = {});

    SearchStatistics getStatistics() const;

    EngineInfo getEngineInfo() const;

    Result<CorpusInfo> getCorpusInfo() const;

    const SearchConfig& getConfig() const;

    /**
     * @brief Set executor for parallel sub-searches
     *
     * When an executor is set, sub-searches are posted to it instead of the engine-owned
     * thread pool. The executor must outlive every in-flight search.
     *
     * @param executor Optional executor. If nullopt, falls back to the internal pool.
     */
    void setExecutor(std::optional<boost::asio::any_io_executor> executor);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Factory function for creating SearchEngine
 *
 * Builds the embedding function from embeddingConfig and an empty in-memory vector store of
 * the matching dimension when no vector store is given.
 */
Result<std::unique_ptr<SearchEngine>>
createSearchEngine(std::shared_ptr<const SearchConfig> config,
                   std::shared_ptr<IDocumentStore> documentStore,
                   std::shared_ptr<vector::IVectorStore> vectorStore = nullptr,
                   const vector::EmbeddingConfig& embeddingConfig = {});

// One-shot search returning the JSON envelope
nlohmann::json simpleSearch(SearchEngine& engine, const std::string& query,
                            const std::string& method = "adaptive", size_t maxResults = 10);

nlohmann::json toJson(const SearchStatistics& stats);
nlohmann::json toJson(const EngineInfo& info);
nlohmann::json toJson(const CorpusInfo& info);

} // namespace regix::search

#include <regix/search/search_engine.h>

#include <regix/search/document_selector.h>
#include <regix/search/keyword_search_engine.h>
#include <regix/search/metadata_search_engine.h>
#include <regix/search/query_analyzer.h>
#include <regix/search/relevance_enhancer.h>
#include <regix/search/result_fusion.h>
#include <regix/search/strategy_selector.h>
#include <regix/search/vector_search_adapter.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace regix::search {

namespace {

using Clock = std::chrono::steady_clock;
using ComponentOutput = Result<std::vector<SearchResult>>;

constexpr auto kPollInterval = std::chrono::milliseconds(5);

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

} // namespace

class SearchEngine::Impl {
public:
    Impl(std::shared_ptr<const SearchConfig> config, std::shared_ptr<IDocumentStore> documentStore,
         std::shared_ptr<vector::IVectorStore> vectorStore,
         std::shared_ptr<vector::IEmbeddingFunction> embedder)
        : config_(std::move(config)), documentStore_(std::move(documentStore)),
          analyzer_(config_), selector_(config_),
          vectorSearch_(std::make_shared<VectorSearchAdapter>(std::move(vectorStore),
                                                              std::move(embedder))),
          keywordSearch_(std::make_shared<KeywordSearchEngine>(documentStore_, config_)),
          metadataSearch_(std::make_shared<MetadataSearchEngine>(documentStore_)),
          fusion_(config_), enhancer_(config_), documentSelector_(config_), composer_(config_),
          pool_(std::max<size_t>(config_->workerThreads, 1)) {}

    ~Impl() { pool_.join(); }

    SearchResponse search(const std::string& query, const SearchOptions& options);

    SearchResponse reject(const std::string& query, const std::string& method, Error error) const {
        spdlog::warn("Search rejected for '{}': {}", query, error.message);
        return composer_.errorResponse(query, method, std::move(error), 0.0);
    }

    SearchStatistics getStatistics() const {
        std::lock_guard<std::mutex> lock(statsMutex_);
        return stats_;
    }

    EngineInfo getEngineInfo() const;
    Result<CorpusInfo> getCorpusInfo() const;

    const SearchConfig& getConfig() const { return *config_; }

    void setExecutor(std::optional<boost::asio::any_io_executor> executor) {
        std::lock_guard<std::mutex> lock(executorMutex_);
        executor_ = std::move(executor);
    }

private:
    enum class ComponentStatus { Success, Failed, TimedOut, Cancelled };

    template <typename Fn> std::future<ComponentOutput> launch(Fn&& fn);

    void updateStats(double seconds) {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++stats_.totalSearches;
        const double n = static_cast<double>(stats_.totalSearches);
        stats_.avgSearchTimeSeconds = (stats_.avgSearchTimeSeconds * (n - 1.0) + seconds) / n;
    }

    std::shared_ptr<const SearchConfig> config_;
    std::shared_ptr<IDocumentStore> documentStore_;

    QueryAnalyzer analyzer_;
    StrategySelector selector_;
    std::shared_ptr<VectorSearchAdapter> vectorSearch_;
    std::shared_ptr<KeywordSearchEngine> keywordSearch_;
    std::shared_ptr<MetadataSearchEngine> metadataSearch_;
    ResultFusion fusion_;
    RelevanceEnhancer enhancer_;
    DocumentSelector documentSelector_;
    ResultComposer composer_;

    boost::asio::thread_pool pool_;
    std::optional<boost::asio::any_io_executor> executor_;
    mutable std::mutex executorMutex_;

    SearchStatistics stats_;
    mutable std::mutex statsMutex_;
};

template <typename Fn> std::future<ComponentOutput> SearchEngine::Impl::launch(Fn&& fn) {
    auto promise = std::make_shared<std::promise<ComponentOutput>>();
    auto future = promise->get_future();

    auto task = [promise, fn = std::forward<Fn>(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (const std::exception& e) {
            promise->set_value(Error{ErrorCode::InternalError, e.what()});
        }
    };

    std::optional<boost::asio::any_io_executor> executor;
    {
        std::lock_guard<std::mutex> lock(executorMutex_);
        executor = executor_;
    }
    if (executor) {
        boost::asio::post(*executor, std::move(task));
    } else {
        boost::asio::post(pool_, std::move(task));
    }
    return future;
}

SearchResponse SearchEngine::Impl::search(const std::string& query,
                                          const SearchOptions& options) {
    const auto startTime = Clock::now();
    const std::string requestedMethod = searchMethodToString(options.method);

    auto fail = [&](Error error, const std::string& method) {
        spdlog::warn("Search failed for '{}': {} ({})", query, error.message, error.code);
        return composer_.errorResponse(query, method, std::move(error), secondsSince(startTime));
    };

    if (options.stopToken.stop_requested()) {
        return fail(Error{ErrorCode::OperationCancelled, "Search cancelled before start"},
                    requestedMethod);
    }
    if (options.deadline && Clock::now() >= *options.deadline) {
        return fail(Error{ErrorCode::Timeout, "Search deadline expired before start"},
                    requestedMethod);
    }

    auto analysisResult = analyzer_.analyze(query);
    if (!analysisResult) {
        return fail(analysisResult.error(), requestedMethod);
    }
    const QueryAnalysis analysis = analysisResult.value();

    const SearchPlan plan = selector_.plan(analysis, options.method, options.maxResults);
    const std::string method = searchMethodToString(plan.method);

    spdlog::info("Search started: '{}' (method: {} -> {}, budget {})", query, requestedMethod,
                 method, plan.candidateBudget);

    // Linked to the caller's token and signalled after the join so stragglers stop scanning
    std::stop_source callStop;
    std::stop_callback forwardStop(options.stopToken, [&callStop]() { callStop.request_stop(); });
    const std::stop_token token = callStop.get_token();

    const auto filter = options.filters;

    std::future<ComponentOutput> vectorFuture;
    std::future<ComponentOutput> keywordFuture;
    std::future<ComponentOutput> metadataFuture;

    // Tasks own copies of everything they touch: a timed-out task may outlive this call
    if (plan.runVector) {
        vectorFuture = launch([adapter = vectorSearch_, query, filter, n = plan.vectorLimit,
                               token]() {
            return adapter->search(query, n, filter ? &*filter : nullptr, token);
        });
    }
    if (plan.runKeyword) {
        keywordFuture = launch([engine = keywordSearch_, query, filter, n = plan.keywordLimit,
                                token]() {
            return engine->search(query, n, filter ? &*filter : nullptr, token);
        });
    }
    if (plan.runMetadata) {
        metadataFuture = launch([engine = metadataSearch_, query, filter,
                                 n = plan.metadataLimit, token]() {
            return engine->search(query, n, filter ? &*filter : nullptr, token);
        });
    }

    // Per-component deadline: componentTimeout from launch, capped by the caller deadline
    std::optional<Clock::time_point> componentDeadline;
    if (config_->componentTimeout.count() > 0) {
        componentDeadline = Clock::now() + config_->componentTimeout;
    }
    if (options.deadline) {
        componentDeadline =
            componentDeadline ? std::min(*componentDeadline, *options.deadline) : *options.deadline;
    }

    ComponentResults components;
    ComponentReport report;
    size_t launched = 0;
    bool cancelled = false;
    bool deadlineExpired = false;

    auto collectResults = [&](std::future<ComponentOutput>& future, const char* name,
                              std::vector<SearchResult>& out) -> ComponentStatus {
        if (!future.valid()) {
            return ComponentStatus::Success;
        }
        ++launched;

        while (future.wait_for(kPollInterval) != std::future_status::ready) {
            if (token.stop_requested()) {
                return ComponentStatus::Cancelled;
            }
            if (componentDeadline && Clock::now() >= *componentDeadline) {
                if (options.deadline && Clock::now() >= *options.deadline) {
                    deadlineExpired = true;
                }
                spdlog::warn("Parallel {} search timed out", name);
                return ComponentStatus::TimedOut;
            }
        }

        auto results = future.get();
        if (!results) {
            if (results.error().code == ErrorCode::OperationCancelled && token.stop_requested()) {
                return ComponentStatus::Cancelled;
            }
            spdlog::warn("Parallel {} search failed: {}", name, results.error().message);
            return ComponentStatus::Failed;
        }

        out = std::move(results).value();
        spdlog::debug("Parallel {} search returned {} candidates", name, out.size());
        return ComponentStatus::Success;
    };

    auto handleStatus = [&](ComponentStatus status, const char* name) {
        switch (status) {
            case ComponentStatus::Success:
                report.contributing.emplace_back(name);
                break;
            case ComponentStatus::Failed:
                report.failed.emplace_back(name);
                break;
            case ComponentStatus::TimedOut:
                report.timedOut.emplace_back(name);
                break;
            case ComponentStatus::Cancelled:
                cancelled = true;
                break;
        }
    };

    if (vectorFuture.valid()) {
        handleStatus(collectResults(vectorFuture, "vector", components.vector), "vector");
    }
    if (keywordFuture.valid() && !cancelled) {
        handleStatus(collectResults(keywordFuture, "keyword", components.keyword), "keyword");
    }
    if (metadataFuture.valid() && !cancelled) {
        handleStatus(collectResults(metadataFuture, "metadata", components.metadata),
                     "metadata");
    }

    callStop.request_stop();

    if (cancelled || options.stopToken.stop_requested()) {
        return fail(Error{ErrorCode::OperationCancelled, "Search cancelled"}, method);
    }
    if (deadlineExpired) {
        return fail(Error{ErrorCode::Timeout, "Search deadline expired"}, method);
    }
    if (launched > 0 && report.contributing.empty()) {
        return fail(Error{ErrorCode::UpstreamError, "All sub-searches failed or timed out"},
                    method);
    }

    ResultFusion::Options fusionOptions;
    fusionOptions.includeMetadata = plan.includeMetadataInFusion;
    fusionOptions.normalize = plan.normalizeFinalScores;
    fusionOptions.maxResults = plan.candidateBudget;
    auto fused = fusion_.fuse(components, fusionOptions);

    enhancer_.enhance(query, fused);
    Selection selection = documentSelector_.select(std::move(fused), analysis.complexity);

    const double elapsed = secondsSince(startTime);
    auto response = composer_.compose(query, plan.method, analysis, std::move(selection),
                                      elapsed, std::move(report));
    updateStats(elapsed);

    spdlog::info("Search completed: {} results ({:.3f}s){}", response.results.size(), elapsed,
                 response.isDegraded() ? " [degraded]" : "");
    return response;
}

EngineInfo SearchEngine::Impl::getEngineInfo() const {
    EngineInfo info;
    for (auto m : allSearchMethods()) {
        info.supportedMethods.emplace_back(searchMethodToString(m));
    }
    info.domainKeywordCount = config_->tables.domainKeywordCount();
    info.synonymCount = config_->tables.synonyms.size();
    info.vectorWeight = config_->vectorWeight;
    info.keywordWeight = config_->keywordWeight;
    info.metadataWeight = config_->metadataWeight;
    return info;
}

Result<CorpusInfo> SearchEngine::Impl::getCorpusInfo() const {
    if (!documentStore_) {
        return Error{ErrorCode::NotInitialized, "No document store configured"};
    }
    auto docs = documentStore_->getAll(nullptr);
    if (!docs) {
        return Error{ErrorCode::UpstreamError,
                     "Document store query failed: " + docs.error().message};
    }

    CorpusInfo info;
    info.totalDocuments = docs.value().size();
    if (!docs.value().empty()) {
        for (const auto& [key, _] : docs.value().front().metadata) {
            info.sampleMetadataKeys.push_back(key);
        }
    }
    return info;
}

SearchEngine::SearchEngine(std::shared_ptr<const SearchConfig> config,
                           std::shared_ptr<IDocumentStore> documentStore,
                           std::shared_ptr<vector::IVectorStore> vectorStore,
                           std::shared_ptr<vector::IEmbeddingFunction> embedder)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(documentStore),
                                    std::move(vectorStore), std::move(embedder))) {}

SearchEngine::~SearchEngine() = default;
SearchEngine::SearchEngine(SearchEngine&&) noexcept = default;
SearchEngine& SearchEngine::operator=(SearchEngine&&) noexcept = default;

SearchResponse SearchEngine::search(const std::string& query, const SearchOptions& options) {
    return pImpl_->search(query, options);
}

SearchResponse SearchEngine::search(const std::string& query, const std::string& method,
                                    SearchOptions options) {
    auto parsed = parseSearchMethod(method);
    if (!parsed) {
        return pImpl_->reject(query, method, parsed.error());
    }
    options.method = parsed.value();
    return pImpl_->search(query, options);
}

SearchStatistics SearchEngine::getStatistics() const {
    return pImpl_->getStatistics();
}

EngineInfo SearchEngine::getEngineInfo() const {
    return pImpl_->getEngineInfo();
}

Result<CorpusInfo> SearchEngine::getCorpusInfo() const {
    return pImpl_->getCorpusInfo();
}

const SearchConfig& SearchEngine::getConfig() const {
    return pImpl_->getConfig();
}

void SearchEngine::setExecutor(std::optional<boost::asio::any_io_executor> executor) {
    pImpl_->setExecutor(std::move(executor));
}

Result<std::unique_ptr<SearchEngine>>
createSearchEngine(std::shared_ptr<const SearchConfig> config,
                   std::shared_ptr<IDocumentStore> documentStore,
                   std::shared_ptr<vector::IVectorStore> vectorStore,
                   const vector::EmbeddingConfig& embeddingConfig) {
    if (!config) {
        config = std::make_shared<const SearchConfig>();
    }
    if (!config->isValid()) {
        return Error{ErrorCode::InvalidArgument, "Invalid search configuration"};
    }
    if (!documentStore) {
        return Error{ErrorCode::InvalidArgument, "Document store is required"};
    }

    auto embedderResult = vector::createEmbeddingFunction(embeddingConfig);
    if (!embedderResult) {
        return embedderResult.error();
    }
    std::shared_ptr<vector::IEmbeddingFunction> embedder = std::move(embedderResult).value();

    if (!vectorStore) {
        vectorStore = std::make_shared<vector::InMemoryVectorStore>(embedder->dimension());
    }

    return std::make_unique<SearchEngine>(std::move(config), std::move(documentStore),
                                          std::move(vectorStore), std::move(embedder));
}

nlohmann::json simpleSearch(SearchEngine& engine, const std::string& query,
                            const std::string& method, size_t maxResults) {
    SearchOptions options;
    options.maxResults = maxResults;
    return toJson(engine.search(query, method, std::move(options)));
}

nlohmann::json toJson(const SearchStatistics& stats) {
    return {{"totalSearches", stats.totalSearches},
            {"avgSearchTimeSeconds", stats.avgSearchTimeSeconds}};
}

nlohmann::json toJson(const EngineInfo& info) {
    return {{"supportedMethods", info.supportedMethods},
            {"domainKeywordCount", info.domainKeywordCount},
            {"synonymCount", info.synonymCount},
            {"vectorWeight", info.vectorWeight},
            {"keywordWeight", info.keywordWeight},
            {"metadataWeight", info.metadataWeight}};
}

nlohmann::json toJson(const CorpusInfo& info) {
    return {{"totalDocuments", info.totalDocuments},
            {"sampleMetadataKeys", info.sampleMetadataKeys}};
}

} // namespace regix::search

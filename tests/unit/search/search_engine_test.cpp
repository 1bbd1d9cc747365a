#include <gtest/gtest.h>
#include <regix/search/search_engine.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <set>
#include <stop_token>
#include <thread>
#include <vector>

#include <boost/asio/thread_pool.hpp>

using namespace regix;
using namespace regix::search;
using namespace std::chrono_literals;

namespace {

constexpr size_t kDim = 64;

class FailingVectorStore final : public vector::IVectorStore {
public:
    Result<std::vector<vector::VectorMatch>> queryNearest(const std::vector<float>&, size_t,
                                                          const MetadataFilter*) override {
        return Error{ErrorCode::InternalError, "vector index offline"};
    }
    size_t size() const override { return 0; }
};

// Sleeps before answering with a single far-away match
class SlowVectorStore final : public vector::IVectorStore {
public:
    explicit SlowVectorStore(std::chrono::milliseconds delay) : delay_(delay) {}

    Result<std::vector<vector::VectorMatch>> queryNearest(const std::vector<float>&, size_t,
                                                          const MetadataFilter*) override {
        std::this_thread::sleep_for(delay_);
        return std::vector<vector::VectorMatch>{{"tax", "annual tax report", {}, 0.9f}};
    }
    size_t size() const override { return 1; }

private:
    std::chrono::milliseconds delay_;
};

class FailingDocumentStore final : public IDocumentStore {
public:
    Result<std::vector<Document>> getAll(const MetadataFilter*) override {
        return Error{ErrorCode::InternalError, "catalog unavailable"};
    }
    size_t size() const override { return 0; }
};

std::vector<Document> corpus() {
    return {
        {"isms", "ISMS-P 인증기준 점검항목 보안 cloud security guide",
         {{"category", "regulation"}, {"filename", "KISA_ISMS_가이드_2023.pdf"}}},
        {"cloud", "cloud security controls for aws and azure deployments",
         {{"category", "cloud"}, {"filename", "cloud_security_2024.pdf"}}},
        {"tax", "annual tax report revenue",
         {{"category", "finance"}, {"filename", "tax_2019.pdf"}}},
        {"privacy", "개인정보 보호 gdpr privacy guide",
         {{"category", "privacy"}, {"filename", "privacy.pdf"}}},
    };
}

std::set<std::string> ids(const SearchResponse& response) {
    std::set<std::string> out;
    for (const auto& r : response.results) {
        out.insert(r.id);
    }
    return out;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

class SearchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        docStore_ = std::make_shared<InMemoryDocumentStore>();
        vectorStore_ = std::make_shared<vector::InMemoryVectorStore>(kDim);
        embedder_ = std::make_shared<vector::HashingEmbeddingFunction>(kDim);
        for (const auto& doc : corpus()) {
            auto embedding = embedder_->embed(doc.content);
            ASSERT_TRUE(embedding);
            ASSERT_TRUE(vectorStore_->addVector(doc.id, doc.content, doc.metadata,
                                                embedding.value()));
            ASSERT_TRUE(docStore_->addDocument(doc));
        }
    }

    static std::shared_ptr<const SearchConfig>
    makeConfig(std::chrono::milliseconds componentTimeout = 5000ms) {
        SearchConfig cfg;
        cfg.recencyReferenceYear = 2024;
        cfg.componentTimeout = componentTimeout;
        return std::make_shared<const SearchConfig>(std::move(cfg));
    }

    std::unique_ptr<SearchEngine>
    makeEngine(std::shared_ptr<const SearchConfig> config = makeConfig(),
               std::shared_ptr<vector::IVectorStore> vectorStore = nullptr,
               std::shared_ptr<IDocumentStore> docStore = nullptr) {
        return std::make_unique<SearchEngine>(
            std::move(config), docStore ? std::move(docStore) : docStore_,
            vectorStore ? std::move(vectorStore) : vectorStore_, embedder_);
    }

    std::shared_ptr<InMemoryDocumentStore> docStore_;
    std::shared_ptr<vector::InMemoryVectorStore> vectorStore_;
    std::shared_ptr<vector::IEmbeddingFunction> embedder_;
};

TEST_F(SearchEngineTest, AdaptiveSearchRunsHybrid) {
    auto engine = makeEngine();
    auto response = engine->search("cloud security");

    ASSERT_TRUE(response.success) << response.error->message;
    EXPECT_EQ(response.method, "hybrid");
    EXPECT_EQ(response.query, "cloud security");
    ASSERT_TRUE(response.hasResults());
    EXPECT_FALSE(response.isDegraded());

    const auto found = ids(response);
    EXPECT_TRUE(found.count("cloud"));
    EXPECT_TRUE(found.count("isms"));
    // No lexical overlap: relevance stays below the lowest tier
    EXPECT_FALSE(found.count("tax"));

    for (size_t i = 0; i < response.results.size(); ++i) {
        const auto& r = response.results[i];
        EXPECT_EQ(r.rank, i + 1);
        EXPECT_GE(r.relevanceScore, 0.2f);
        EXPECT_LE(r.relevanceScore, 1.0f);
        if (i > 0) {
            EXPECT_LE(r.relevanceScore, response.results[i - 1].relevanceScore);
        }
    }

    const auto& stats = response.stats;
    EXPECT_EQ(stats.totalResults, response.results.size());
    EXPECT_EQ(stats.contributingComponents, (std::vector<std::string>{"vector", "keyword"}));
    EXPECT_TRUE(stats.failedComponents.empty());
    EXPECT_TRUE(stats.timedOutComponents.empty());
}

TEST_F(SearchEngineTest, RepeatedCallsAreIdentical) {
    auto engine = makeEngine();
    auto first = engine->search("클라우드 보안 cloud security");
    auto second = engine->search("클라우드 보안 cloud security");

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    ASSERT_EQ(first.results.size(), second.results.size());
    for (size_t i = 0; i < first.results.size(); ++i) {
        EXPECT_EQ(first.results[i].id, second.results[i].id);
        EXPECT_FLOAT_EQ(first.results[i].finalScore, second.results[i].finalScore);
        EXPECT_FLOAT_EQ(first.results[i].relevanceScore, second.results[i].relevanceScore);
    }
}

TEST_F(SearchEngineTest, VectorFailureDegradesToKeyword) {
    auto engine = makeEngine(makeConfig(), std::make_shared<FailingVectorStore>());
    auto response = engine->search("cloud security", "hybrid");

    ASSERT_TRUE(response.success);
    EXPECT_TRUE(response.isDegraded());
    EXPECT_TRUE(contains(response.stats.failedComponents, "vector"));
    EXPECT_TRUE(contains(response.stats.contributingComponents, "keyword"));
    ASSERT_TRUE(response.hasResults());
    for (const auto& r : response.results) {
        EXPECT_FLOAT_EQ(r.vectorScore, 0.0f);
        EXPECT_FALSE(r.distance.has_value());
    }
}

TEST_F(SearchEngineTest, VectorFailureKeepsKeywordAndMetadataInMultiModal) {
    auto engine = makeEngine(makeConfig(), std::make_shared<FailingVectorStore>());
    auto response = engine->search("cloud security", "multi_modal");

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.method, "multi_modal");
    EXPECT_EQ(response.stats.failedComponents, std::vector<std::string>{"vector"});
    EXPECT_EQ(response.stats.contributingComponents,
              (std::vector<std::string>{"keyword", "metadata"}));
    ASSERT_TRUE(response.hasResults());

    bool metadataScored = false;
    for (const auto& r : response.results) {
        EXPECT_FLOAT_EQ(r.vectorScore, 0.0f);
        metadataScored = metadataScored || r.metadataScore > 0.0f;
    }
    EXPECT_TRUE(metadataScored);

    auto j = toJson(response);
    for (const auto& r : j["results"]) {
        EXPECT_FLOAT_EQ(r["scores"]["vector"].get<float>(), 0.0f);
    }
}

TEST_F(SearchEngineTest, AllSubSearchesFailingIsUpstreamError) {
    auto engine = makeEngine(makeConfig(), std::make_shared<FailingVectorStore>(),
                             std::make_shared<FailingDocumentStore>());
    auto response = engine->search("cloud security");

    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, ErrorCode::UpstreamError);
    EXPECT_TRUE(response.results.empty());
}

TEST_F(SearchEngineTest, EmptyQueryIsRejected) {
    auto engine = makeEngine();
    for (const std::string q : {"", "   \t "}) {
        auto response = engine->search(q);
        EXPECT_FALSE(response.success);
        ASSERT_TRUE(response.error.has_value());
        EXPECT_EQ(response.error->code, ErrorCode::InvalidQuery);
    }
    EXPECT_EQ(engine->getStatistics().totalSearches, 0u);
}

TEST_F(SearchEngineTest, UnknownMethodName) {
    auto engine = makeEngine();
    auto response = engine->search("cloud", "semantic");

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.method, "semantic");
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, ErrorCode::UnknownMethod);
}

TEST_F(SearchEngineTest, MethodNamesAreCaseInsensitive) {
    auto engine = makeEngine();
    auto response = engine->search("cloud security", "KEYWORD_ONLY");

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.method, "keyword_only");
    EXPECT_EQ(response.stats.contributingComponents, std::vector<std::string>{"keyword"});
    for (const auto& r : response.results) {
        EXPECT_FLOAT_EQ(r.vectorScore, 0.0f);
    }
}

TEST_F(SearchEngineTest, VectorOnlySkipsKeywordSearch) {
    auto engine = makeEngine();
    auto response = engine->search("cloud security", "vector_only");

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.stats.contributingComponents, std::vector<std::string>{"vector"});
    for (const auto& r : response.results) {
        EXPECT_FLOAT_EQ(r.keywordScore, 0.0f);
        EXPECT_TRUE(r.distance.has_value());
    }
}

TEST_F(SearchEngineTest, MultiModalNormalizesAndUsesMetadata) {
    auto engine = makeEngine();
    auto response = engine->search("cloud security", "multi_modal");

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.method, "multi_modal");
    EXPECT_TRUE(contains(response.stats.contributingComponents, "metadata"));
    ASSERT_TRUE(response.hasResults());

    float maxFinal = 0.0f;
    for (const auto& r : response.results) {
        EXPECT_LE(r.finalScore, 1.0f);
        maxFinal = std::max(maxFinal, r.finalScore);
    }
    EXPECT_FLOAT_EQ(maxFinal, 1.0f);

    auto cloud = std::find_if(response.results.begin(), response.results.end(),
                              [](const SearchResult& r) { return r.id == "cloud"; });
    ASSERT_NE(cloud, response.results.end());
    EXPECT_FLOAT_EQ(cloud->metadataScore, 0.7f);
}

TEST_F(SearchEngineTest, FiltersApplyToEverySubSearch) {
    auto engine = makeEngine();
    SearchOptions options;
    options.filters = MetadataFilter{};
    options.filters->metadata_filters["category"] = "cloud";

    auto response = engine->search("cloud security guide", options);
    ASSERT_TRUE(response.success);
    ASSERT_EQ(response.results.size(), 1u);
    EXPECT_EQ(response.results[0].id, "cloud");
}

TEST_F(SearchEngineTest, MaxResultsCapsCandidates) {
    auto engine = makeEngine();
    SearchOptions options;
    options.maxResults = 1;

    auto response = engine->search("cloud security", options);
    ASSERT_TRUE(response.success);
    EXPECT_LE(response.results.size(), 1u);
}

TEST_F(SearchEngineTest, CancelledBeforeStart) {
    auto engine = makeEngine();
    std::stop_source source;
    source.request_stop();

    SearchOptions options;
    options.stopToken = source.get_token();
    auto response = engine->search("cloud security", options);

    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, ErrorCode::OperationCancelled);
}

TEST_F(SearchEngineTest, CancelledWhileSubSearchesRun) {
    auto engine = makeEngine(makeConfig(), std::make_shared<SlowVectorStore>(400ms));
    std::stop_source source;
    SearchOptions options;
    options.stopToken = source.get_token();

    std::thread canceller([&source]() {
        std::this_thread::sleep_for(50ms);
        source.request_stop();
    });
    const auto start = std::chrono::steady_clock::now();
    auto response = engine->search("cloud security", options);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, ErrorCode::OperationCancelled);
    EXPECT_LT(elapsed, 350ms);
}

TEST_F(SearchEngineTest, ComponentTimeoutDegrades) {
    auto engine = makeEngine(makeConfig(100ms), std::make_shared<SlowVectorStore>(400ms));
    auto response = engine->search("cloud security");

    ASSERT_TRUE(response.success);
    EXPECT_TRUE(response.isDegraded());
    EXPECT_EQ(response.stats.timedOutComponents, std::vector<std::string>{"vector"});
    EXPECT_EQ(response.stats.contributingComponents, std::vector<std::string>{"keyword"});
    EXPECT_TRUE(response.hasResults());
}

TEST_F(SearchEngineTest, DeadlineAlreadyPassed) {
    auto engine = makeEngine();
    SearchOptions options;
    options.deadline = std::chrono::steady_clock::now() - 1ms;

    auto response = engine->search("cloud security", options);
    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, ErrorCode::Timeout);
}

TEST_F(SearchEngineTest, DeadlineExpiresDuringSearch) {
    auto engine = makeEngine(makeConfig(), std::make_shared<SlowVectorStore>(400ms));
    SearchOptions options;
    options.deadline = std::chrono::steady_clock::now() + 100ms;

    auto response = engine->search("cloud security", options);
    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(response.error->code, ErrorCode::Timeout);
}

TEST_F(SearchEngineTest, StatisticsCountSuccessfulSearches) {
    auto engine = makeEngine();
    EXPECT_EQ(engine->getStatistics().totalSearches, 0u);

    EXPECT_TRUE(engine->search("cloud security").success);
    EXPECT_TRUE(engine->search("privacy guide").success);
    EXPECT_FALSE(engine->search("").success);

    auto stats = engine->getStatistics();
    EXPECT_EQ(stats.totalSearches, 2u);
    EXPECT_GE(stats.avgSearchTimeSeconds, 0.0);
}

TEST_F(SearchEngineTest, ConcurrentSearches) {
    auto engine = makeEngine();
    const auto expected = engine->search("cloud security");
    ASSERT_TRUE(expected.success);

    std::vector<SearchResponse> responses(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < responses.size(); ++i) {
        threads.emplace_back(
            [&engine, &responses, i]() { responses[i] = engine->search("cloud security"); });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& r : responses) {
        ASSERT_TRUE(r.success);
        EXPECT_EQ(ids(r), ids(expected));
    }
    EXPECT_EQ(engine->getStatistics().totalSearches, 5u);
}

TEST_F(SearchEngineTest, ExternalExecutor) {
    boost::asio::thread_pool external(2);
    auto engine = makeEngine();
    engine->setExecutor(external.get_executor());

    auto response = engine->search("cloud security");
    EXPECT_TRUE(response.success);

    engine->setExecutor(std::nullopt);
    EXPECT_TRUE(engine->search("cloud security").success);

    external.join();
}

TEST_F(SearchEngineTest, EngineInfo) {
    auto engine = makeEngine();
    auto info = engine->getEngineInfo();

    const std::vector<std::string> methods{"vector_only", "keyword_only", "hybrid",
                                           "multi_modal", "adaptive"};
    EXPECT_EQ(info.supportedMethods, methods);
    EXPECT_EQ(info.domainKeywordCount, 36u);
    EXPECT_EQ(info.synonymCount, 7u);
    EXPECT_FLOAT_EQ(info.vectorWeight, 0.6f);
    EXPECT_FLOAT_EQ(info.keywordWeight, 0.4f);
    EXPECT_FLOAT_EQ(info.metadataWeight, 0.2f);

    auto j = toJson(info);
    EXPECT_EQ(j["supportedMethods"].size(), 5u);
}

TEST_F(SearchEngineTest, CorpusInfo) {
    auto engine = makeEngine();
    auto info = engine->getCorpusInfo();
    ASSERT_TRUE(info) << info.error().message;
    EXPECT_EQ(info.value().totalDocuments, 4u);
    EXPECT_EQ(info.value().sampleMetadataKeys,
              (std::vector<std::string>{"category", "filename"}));

    auto failing = makeEngine(makeConfig(), nullptr, std::make_shared<FailingDocumentStore>());
    auto err = failing->getCorpusInfo();
    ASSERT_FALSE(err);
    EXPECT_EQ(err.error().code, ErrorCode::UpstreamError);
}

TEST_F(SearchEngineTest, SimpleSearchReturnsEnvelope) {
    auto engine = makeEngine();
    auto j = simpleSearch(*engine, "cloud security", "hybrid", 10);
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_EQ(j["method"], "hybrid");
    EXPECT_LE(j["results"].size(), 10u);
    EXPECT_TRUE(j.contains("queryAnalysis"));

    auto bad = simpleSearch(*engine, "cloud", "bogus");
    EXPECT_FALSE(bad["success"].get<bool>());
    EXPECT_EQ(bad["error"]["code"], "unknown_method");
}

TEST(CreateSearchEngineTest, BuildsLocalEngine) {
    auto docs = std::make_shared<InMemoryDocumentStore>();
    ASSERT_TRUE(docs->addDocument({"a", "cloud security baseline", {{"filename", "a.pdf"}}}));

    vector::EmbeddingConfig embedding;
    embedding.embedding_dim = 32;
    auto engine = createSearchEngine(nullptr, docs, nullptr, embedding);
    ASSERT_TRUE(engine) << engine.error().message;

    // Empty vector store contributes nothing but still succeeds
    auto response = engine.value()->search("cloud security");
    ASSERT_TRUE(response.success);
    ASSERT_EQ(response.results.size(), 1u);
    EXPECT_EQ(response.results[0].id, "a");
}

TEST(CreateSearchEngineTest, RejectsBadInputs) {
    auto docs = std::make_shared<InMemoryDocumentStore>();

    auto noStore = createSearchEngine(nullptr, nullptr);
    ASSERT_FALSE(noStore);
    EXPECT_EQ(noStore.error().code, ErrorCode::InvalidArgument);

    SearchConfig bad;
    bad.vectorWeight = -1.0f;
    auto badConfig = createSearchEngine(std::make_shared<const SearchConfig>(bad), docs);
    ASSERT_FALSE(badConfig);
    EXPECT_EQ(badConfig.error().code, ErrorCode::InvalidArgument);

    vector::EmbeddingConfig azure;
    azure.provider = vector::EmbeddingConfig::Provider::Azure;
    auto remote = createSearchEngine(nullptr, docs, nullptr, azure);
    ASSERT_FALSE(remote);
    EXPECT_EQ(remote.error().code, ErrorCode::NotSupported);
}

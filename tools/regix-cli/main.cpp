#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <regix/cli/cli_support.h>
#include <regix/config/config_helpers.h>
#include <regix/config/search_config_loader.h>
#include <regix/search/document_store.h>
#include <regix/search/search_engine.h>
#include <regix/vector/embedding_function.h>
#include <regix/vector/vector_store.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace regix;

namespace {

// Documents go to the document store; every document is also indexed in the vector store,
// using the corpus embedding when present and the configured embedder otherwise.
Result<std::unique_ptr<search::SearchEngine>> buildEngine(const std::string& corpusPath,
                                                          const std::string& configPath,
                                                          vector::EmbeddingConfig embeddingConfig) {
    Result<search::SearchConfig> config =
        configPath.empty() ? config::loadSearchConfig()
                           : config::loadSearchConfig(config::get_config_path(configPath));
    if (!config) {
        return config.error();
    }

    auto entries = search::loadCorpusFile(corpusPath);
    if (!entries) {
        return entries.error();
    }

    for (const auto& entry : entries.value()) {
        if (entry.embedding) {
            embeddingConfig.embedding_dim = entry.embedding->size();
            break;
        }
    }

    auto embedderResult = vector::createEmbeddingFunction(embeddingConfig);
    if (!embedderResult) {
        return embedderResult.error();
    }
    std::shared_ptr<vector::IEmbeddingFunction> embedder = std::move(embedderResult).value();

    auto documents = std::make_shared<search::InMemoryDocumentStore>();
    auto vectors = std::make_shared<vector::InMemoryVectorStore>(embedder->dimension());

    for (const auto& entry : entries.value()) {
        const auto& doc = entry.document;
        if (auto r = documents->addDocument(doc); !r) {
            return r.error();
        }

        std::vector<float> embedding;
        if (entry.embedding) {
            embedding = *entry.embedding;
        } else {
            auto e = embedder->embed(doc.content);
            if (!e) {
                return e.error();
            }
            embedding = std::move(e).value();
        }
        if (auto r = vectors->addVector(doc.id, doc.content, doc.metadata, embedding); !r) {
            return r.error();
        }
    }

    spdlog::debug("Indexed {} documents with {} ({} dims)", documents->size(), embedder->name(),
                  embedder->dimension());

    return std::make_unique<search::SearchEngine>(
        std::make_shared<const search::SearchConfig>(std::move(config).value()), documents,
        vectors, embedder);
}

Result<search::MetadataFilter> parseFilters(const std::vector<std::string>& raw) {
    search::MetadataFilter filter;
    for (const auto& kv : raw) {
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Error{ErrorCode::InvalidArgument, "Filter must be key=value: " + kv};
        }
        filter.metadata_filters[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return filter;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // stdout is reserved for JSON output
        cli::installStderrLogger(spdlog::level::warn);

        CLI::App app{"regix hybrid document search", "regix"};
        app.set_version_flag("--version", "0.1.0");
        app.require_subcommand(1);

        // Global options
        std::string corpusPath;
        std::string configPath;
        std::string provider = "local";
        size_t embeddingDim = 384;
        bool verbose = false;

        app.add_option("--corpus", corpusPath, "JSON corpus file")
            ->required()
            ->check(CLI::ExistingFile);
        app.add_option("--config", configPath, "Config file (default: $REGIX_CONFIG or "
                                               "~/.config/regix/config.toml)");
        app.add_option("--embedding-provider", provider, "Embedding provider (local, openai, azure)")
            ->default_val("local");
        app.add_option("--embedding-dim", embeddingDim, "Embedding dimension for local provider")
            ->default_val(384);
        app.add_flag("-v,--verbose", verbose, "Enable verbose output");

        int exitCode = 0;

        auto makeEngine = [&]() -> std::unique_ptr<search::SearchEngine> {
            if (verbose) {
                spdlog::set_level(spdlog::level::debug);
            }
            vector::EmbeddingConfig embeddingConfig;
            auto parsed = vector::parseProvider(provider);
            if (!parsed) {
                spdlog::error("{}", parsed.error().message);
                return nullptr;
            }
            embeddingConfig.provider = parsed.value();
            embeddingConfig.embedding_dim = embeddingDim;

            auto loaded = buildEngine(corpusPath, configPath, embeddingConfig);
            if (!loaded) {
                spdlog::error("Failed to initialize: {}", loaded.error().message);
                return nullptr;
            }
            return std::move(loaded).value();
        };

        // Search command
        auto* searchCmd = app.add_subcommand("search", "Search the corpus");
        std::string query;
        std::string method = "adaptive";
        size_t maxResults = 0;
        std::vector<std::string> filters;
        long timeoutMs = 0;
        searchCmd->add_option("query", query, "Search query")->required();
        searchCmd->add_option("-m,--method", method,
                              "vector_only, keyword_only, hybrid, multi_modal or adaptive")
            ->default_val("adaptive");
        searchCmd->add_option("-n,--max-results", maxResults,
                              "Candidate budget (default depends on query complexity)");
        searchCmd->add_option("-f,--filter", filters, "Metadata filter key=value (repeatable)");
        searchCmd->add_option("--timeout-ms", timeoutMs, "Overall deadline in milliseconds");
        searchCmd->callback([&]() {
            auto engine = makeEngine();
            if (!engine) {
                exitCode = 1;
                return;
            }

            search::SearchOptions options;
            if (maxResults > 0) {
                options.maxResults = maxResults;
            }
            if (!filters.empty()) {
                auto filter = parseFilters(filters);
                if (!filter) {
                    spdlog::error("{}", filter.error().message);
                    exitCode = 2;
                    return;
                }
                options.filters = std::move(filter).value();
            }
            if (timeoutMs > 0) {
                options.deadline =
                    std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
            }
            std::stop_source interrupt;
            options.stopToken = interrupt.get_token();
            cli::InterruptForwarder forwarder(interrupt);

            auto response = engine->search(query, method, options);
            std::cout << search::toJson(response).dump(2) << std::endl;
            exitCode = response.success ? 0 : 1;
        });

        // Info command
        auto* infoCmd = app.add_subcommand("info", "Show engine and corpus information");
        infoCmd->callback([&]() {
            auto engine = makeEngine();
            if (!engine) {
                exitCode = 1;
                return;
            }

            json info;
            info["engine"] = search::toJson(engine->getEngineInfo());
            auto corpus = engine->getCorpusInfo();
            if (corpus) {
                info["corpus"] = search::toJson(corpus.value());
            } else {
                info["corpus"] = {{"error", corpus.error().message}};
            }
            info["statistics"] = search::toJson(engine->getStatistics());
            std::cout << info.dump(2) << std::endl;
        });

        cli::installSignalHandlers();

        // Parse command line
        CLI11_PARSE(app, argc, argv);

        return exitCode;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

#include <regix/common/utf8_utils.h>
#include <regix/search/metadata_search_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <exception>
#include <utility>

namespace regix::search {

namespace {

constexpr std::array<MetadataSearchEngine::FieldWeight, 4> kFieldWeights = {{
    {"filename", 0.4f},
    {"category", 0.3f},
    {"document_type", 0.2f},
    {"domain", 0.1f},
}};

std::string fieldValue(const Metadata& metadata, const char* field) {
    if (std::string_view(field) == "filename") {
        return documentFilename(metadata);
    }
    auto it = metadata.find(field);
    return it == metadata.end() ? std::string{} : it->second;
}

} // namespace

MetadataSearchEngine::MetadataSearchEngine(std::shared_ptr<IDocumentStore> store)
    : store_(std::move(store)) {}

float MetadataSearchEngine::scoreMetadata(const std::vector<std::string>& queryTerms,
                                          const Metadata& metadata) {
    float score = 0.0f;
    for (const auto& [field, weight] : kFieldWeights) {
        const std::string value = common::toLowerAscii(fieldValue(metadata, field));
        if (value.empty()) {
            continue;
        }
        const bool matched = std::any_of(queryTerms.begin(), queryTerms.end(),
                                         [&](const std::string& term) {
                                             return value.find(term) != std::string::npos;
                                         });
        if (matched) {
            score += weight;
        }
    }
    return std::min(score, 1.0f);
}

Result<std::vector<SearchResult>> MetadataSearchEngine::search(const std::string& query, size_t n,
                                                               const MetadataFilter* filter,
                                                               std::stop_token stopToken) const {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Document store not set"};
    }

    const auto terms = common::splitWhitespace(common::toLowerAscii(query));
    if (terms.empty() || n == 0) {
        return std::vector<SearchResult>{};
    }

    Result<std::vector<Document>> corpus = Error{ErrorCode::Unknown};
    try {
        corpus = store_->getAll(filter);
    } catch (const std::exception& e) {
        return Error{ErrorCode::UpstreamError, std::string("Document store exception: ") +
                                                   e.what()};
    }
    if (!corpus) {
        return Error{ErrorCode::UpstreamError,
                     "Document store scan failed: " + corpus.error().message};
    }

    std::vector<SearchResult> scored;
    for (const auto& doc : corpus.value()) {
        if (stopToken.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Metadata search cancelled"};
        }
        const float score = scoreMetadata(terms, doc.metadata);
        if (score <= 0.0f) {
            continue;
        }
        SearchResult r;
        r.id = doc.id;
        r.content = doc.content;
        r.metadata = doc.metadata;
        r.metadataScore = score;
        scored.push_back(std::move(r));
    }

    std::stable_sort(scored.begin(), scored.end(), [](const SearchResult& a, const SearchResult& b) {
        return a.metadataScore > b.metadataScore;
    });
    if (scored.size() > n) {
        scored.resize(n);
    }

    spdlog::debug("Metadata search: {} terms, {} candidates", terms.size(), scored.size());
    return scored;
}

} // namespace regix::search

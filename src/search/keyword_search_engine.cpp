#include <regix/common/utf8_utils.h>
#include <regix/search/keyword_search_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace regix::search {

KeywordSearchEngine::KeywordSearchEngine(std::shared_ptr<IDocumentStore> store,
                                         std::shared_ptr<const SearchConfig> config)
    : store_(std::move(store)), config_(std::move(config)),
      stopWords_(config_->stopWords.begin(), config_->stopWords.end()) {}

std::vector<std::string> KeywordSearchEngine::extractKeywords(const std::string& query) const {
    std::vector<std::string> keywords;
    for (auto& word : common::splitWhitespace(common::replacePunctuation(query))) {
        if (common::codePointCount(word) < 2 || stopWords_.contains(word)) {
            continue;
        }
        keywords.push_back(std::move(word));
    }
    return keywords;
}

std::vector<std::string>
KeywordSearchEngine::expandKeywords(const std::vector<std::string>& keywords) const {
    std::vector<std::string> expanded;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& term) {
        if (seen.insert(term).second) {
            expanded.push_back(term);
        }
    };

    for (const auto& keyword : keywords) {
        add(keyword);
    }
    for (const auto& keyword : keywords) {
        auto it = config_->tables.synonyms.find(keyword);
        if (it == config_->tables.synonyms.end()) {
            continue;
        }
        for (const auto& synonym : it->second) {
            add(synonym);
        }
    }
    return expanded;
}

float KeywordSearchEngine::scoreDocument(const std::string& content,
                                         const std::vector<std::string>& keywords) {
    if (content.empty() || keywords.empty()) {
        return 0.0f;
    }

    const std::string docLower = common::toLowerAscii(content);
    double score = 0.0;
    for (const auto& keyword : keywords) {
        const std::string keywordLower = common::toLowerAscii(keyword);
        if (docLower.find(keywordLower) == std::string::npos) {
            continue;
        }
        score += common::containsWholeWord(docLower, keywordLower) ? 1.0 : 0.5;
    }
    return static_cast<float>(std::min(score / static_cast<double>(keywords.size()), 1.0));
}

Result<std::vector<SearchResult>> KeywordSearchEngine::search(const std::string& query, size_t n,
                                                              const MetadataFilter* filter,
                                                              std::stop_token stopToken) const {
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Document store not set"};
    }

    const auto keywords = expandKeywords(extractKeywords(query));
    if (keywords.empty() || n == 0) {
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
            return Error{ErrorCode::OperationCancelled, "Keyword search cancelled"};
        }
        const float score = scoreDocument(doc.content, keywords);
        if (score <= 0.0f) {
            continue;
        }
        SearchResult r;
        r.id = doc.id;
        r.content = doc.content;
        r.metadata = doc.metadata;
        r.keywordScore = score;
        scored.push_back(std::move(r));
    }

    std::stable_sort(scored.begin(), scored.end(), [](const SearchResult& a, const SearchResult& b) {
        return a.keywordScore > b.keywordScore;
    });
    if (scored.size() > n) {
        scored.resize(n);
    }

    spdlog::debug("Keyword search: {} expanded keywords, {} candidates", keywords.size(),
                  scored.size());
    return scored;
}

} // namespace regix::search

#pragma once

#include <regix/core/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace regix::search {

using Metadata = std::map<std::string, std::string>;

/**
 * @brief Document as held by the external document store
 *
 * Read-only to the engine. Well-known metadata keys: filename, source, source_file,
 * category, document_type, domain.
 */
struct Document {
    std::string id;
    std::string content;
    Metadata metadata;
};

/**
 * @brief Metadata predicate applied by every store query
 */
struct MetadataFilter {
    // Exact key/value matches (all must hold)
    std::map<std::string, std::string> metadata_filters;

    // Custom filter function
    std::function<bool(const std::string& id, const Metadata& metadata)> custom_filter;

    bool hasFilters() const { return !metadata_filters.empty() || custom_filter != nullptr; }

    bool matches(const std::string& id, const Metadata& metadata) const {
        for (const auto& [key, value] : metadata_filters) {
            auto it = metadata.find(key);
            if (it == metadata.end() || it->second != value) {
                return false;
            }
        }
        if (custom_filter && !custom_filter(id, metadata)) {
            return false;
        }
        return true;
    }
};

enum class SearchMethod { VECTOR_ONLY, KEYWORD_ONLY, HYBRID, MULTI_MODAL, ADAPTIVE };

enum class QueryComplexity { LOW, MEDIUM, HIGH };

enum class QueryType { InformationRetrieval, ComplianceCheck, ProblemSolving, Comparison, General };

constexpr const char* searchMethodToString(SearchMethod method) noexcept {
    switch (method) {
        case SearchMethod::VECTOR_ONLY:
            return "vector_only";
        case SearchMethod::KEYWORD_ONLY:
            return "keyword_only";
        case SearchMethod::HYBRID:
            return "hybrid";
        case SearchMethod::MULTI_MODAL:
            return "multi_modal";
        case SearchMethod::ADAPTIVE:
            return "adaptive";
    }
    return "unknown";
}

constexpr const char* complexityToString(QueryComplexity complexity) noexcept {
    switch (complexity) {
        case QueryComplexity::LOW:
            return "low";
        case QueryComplexity::MEDIUM:
            return "medium";
        case QueryComplexity::HIGH:
            return "high";
    }
    return "unknown";
}

constexpr const char* queryTypeToString(QueryType type) noexcept {
    switch (type) {
        case QueryType::InformationRetrieval:
            return "information_retrieval";
        case QueryType::ComplianceCheck:
            return "compliance_check";
        case QueryType::ProblemSolving:
            return "problem_solving";
        case QueryType::Comparison:
            return "comparison";
        case QueryType::General:
            return "general";
    }
    return "general";
}

// Parses the wire names produced by searchMethodToString (case-insensitive).
Result<SearchMethod> parseSearchMethod(std::string_view name);

// All methods in declaration order, used for capability listings.
std::vector<SearchMethod> allSearchMethods();

/**
 * @brief Per-query analysis computed by QueryAnalyzer
 */
struct QueryAnalysis {
    QueryComplexity complexity = QueryComplexity::MEDIUM;
    size_t wordCount = 0;
    size_t charCount = 0; // Unicode code points
    std::map<std::string, std::vector<std::string>> domainMatches;
    bool hasTechnicalTerms = false;
    QueryType queryType = QueryType::General;
};

/**
 * @brief Candidate document carried through fusion, enhancement and selection
 */
struct SearchResult {
    std::string id;
    std::string content;
    Metadata metadata;

    float vectorScore = 0.0f;
    float keywordScore = 0.0f;
    float metadataScore = 0.0f;
    float relevanceScore = 0.0f;
    float finalScore = 0.0f;

    size_t rank = 0;                     // 1-based once selected
    std::optional<float> distance;       // Raw vector distance when produced by the vector store
};

/**
 * @brief Caller options for a single search call
 */
struct SearchOptions {
    SearchMethod method = SearchMethod::ADAPTIVE;
    std::optional<size_t> maxResults;    // Candidate budget override
    std::optional<MetadataFilter> filters;

    // Cancellation: either signal aborts the call and all in-flight sub-searches
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::stop_token stopToken;
};

// Filename used for scoring: "filename", falling back to "source".
std::string documentFilename(const Metadata& metadata);

// Source label used for distribution statistics.
std::string documentSource(const Metadata& metadata);

} // namespace regix::search

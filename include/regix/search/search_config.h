#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace regix::search {

/**
 * @brief Domain name with the keywords that signal it
 */
struct DomainKeywords {
    std::string domain;
    std::vector<std::string> keywords; // Lower case
};

/**
 * @brief Static lexical tables loaded once at startup
 *
 * Domain order is preserved so that analysis and relevance scoring iterate deterministically.
 */
struct KeywordTables {
    std::vector<DomainKeywords> domainKeywords;
    std::map<std::string, std::vector<std::string>> synonyms; // Exact-case term -> synonyms

    size_t domainKeywordCount() const {
        size_t total = 0;
        for (const auto& d : domainKeywords) {
            total += d.keywords.size();
        }
        return total;
    }

    // Built-in financial-regulation / cloud / security vocabulary
    static KeywordTables defaults();
};

/**
 * @brief Immutable search engine configuration
 *
 * Constructed once (defaults, TOML file, env overrides) and shared read-only as
 * std::shared_ptr<const SearchConfig>. Weights are independently tunable and are not
 * required to sum to 1.0; the relevance score is clamped after summation.
 */
struct SearchConfig {
    // Fusion weights
    float vectorWeight = 0.6f;
    float keywordWeight = 0.4f;
    float metadataWeight = 0.2f; // Only applied by MULTI_MODAL

    // Relevance signal weights
    float exactMatchWeight = 0.3f;
    float partialMatchWeight = 0.2f;
    float domainKeywordWeight = 0.4f;
    float metadataMatchWeight = 0.3f;
    float contentQualityWeight = 0.1f;
    float recencyWeight = 0.05f;
    float authorityWeight = 0.1f;

    // Candidate budget per complexity (used when the caller gives no maxResults)
    size_t simpleQueryResults = 30;
    size_t mediumQueryResults = 50;
    size_t complexQueryResults = 80;

    // Vector and keyword sub-searches fetch budget * multiplier candidates before fusion
    size_t candidateMultiplier = 2;

    // Selection quota per complexity
    size_t lowComplexityQuota = 5;
    size_t mediumComplexityQuota = 10;
    size_t highComplexityQuota = 15;

    // Tier thresholds
    float highRelevanceThreshold = 0.6f;
    float mediumRelevanceThreshold = 0.4f;
    float lowRelevanceThreshold = 0.2f;

    // Content length thresholds (code points) for the content quality signal
    size_t longContentChars = 2000;
    size_t mediumContentChars = 1000;

    // Recency window: {year-2, year-1, year}; nullopt = current calendar year
    std::optional<int> recencyReferenceYear;
    int recencyWindowYears = 3;

    // Filename substrings that mark an authoritative source
    std::vector<std::string> authoritySources = {"금융보안원", "금융위원회", "kisa",
                                                 "한국인터넷진흥원"};

    // Keyword extraction stop words
    std::vector<std::string> stopWords = {"이",    "그",  "저",  "것",   "수",    "등",   "및",
                                          "또는",  "그리고", "하는", "있는", "되는", "the", "a",
                                          "an",    "and", "or",  "but",  "in",   "on",  "at",
                                          "to",    "for", "is",  "are"};

    // Execution
    std::chrono::milliseconds componentTimeout{10000}; // Per sub-search; 0 = no timeout
    size_t workerThreads = 3;                         // Engine-owned pool size

    KeywordTables tables = KeywordTables::defaults();

    // Years counted as recent for the configured (or current) reference year
    std::vector<std::string> recentYears() const;

    bool isValid() const {
        return vectorWeight >= 0 && keywordWeight >= 0 && metadataWeight >= 0 &&
               exactMatchWeight >= 0 && partialMatchWeight >= 0 && domainKeywordWeight >= 0 &&
               metadataMatchWeight >= 0 && contentQualityWeight >= 0 && recencyWeight >= 0 &&
               authorityWeight >= 0 && candidateMultiplier > 0 && simpleQueryResults > 0 &&
               mediumQueryResults > 0 && complexQueryResults > 0 && workerThreads > 0 &&
               recencyWindowYears > 0 && lowRelevanceThreshold <= mediumRelevanceThreshold &&
               mediumRelevanceThreshold <= highRelevanceThreshold;
    }
};

} // namespace regix::search

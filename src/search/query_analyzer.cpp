#include <regix/common/utf8_utils.h>
#include <regix/search/query_analyzer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <utility>

namespace regix::search {

namespace {

struct ComplexityIndicators {
    QueryComplexity tier;
    std::vector<std::string> terms;
};

// Iteration order doubles as tie precedence
const std::array<ComplexityIndicators, 3>& complexityIndicators() {
    static const std::array<ComplexityIndicators, 3> indicators = {{
        {QueryComplexity::HIGH,
         {"거버넌스", "자동화", "종합", "체계", "프레임워크", "로드맵", "구현", "설계",
          "아키텍처"}},
        {QueryComplexity::MEDIUM,
         {"요구사항", "규정", "준수", "보안", "인증", "가이드라인", "분석", "평가"}},
        {QueryComplexity::LOW, {"무엇", "어떤", "언제", "어디서", "누가", "왜", "어떻게"}},
    }};
    return indicators;
}

struct QueryTypeTerms {
    QueryType type;
    std::vector<std::string> terms;
};

const std::array<QueryTypeTerms, 4>& queryTypeTerms() {
    static const std::array<QueryTypeTerms, 4> families = {{
        {QueryType::InformationRetrieval, {"무엇", "어떤", "어떻게", "what", "how"}},
        {QueryType::ComplianceCheck, {"규정", "준수", "인증", "compliance"}},
        {QueryType::ProblemSolving, {"문제", "오류", "해결", "error", "problem"}},
        {QueryType::Comparison, {"비교", "차이", "구분", "compare", "difference"}},
    }};
    return families;
}

bool isBlank(const std::string& s) {
    return common::splitWhitespace(s).empty();
}

} // namespace

QueryAnalyzer::QueryAnalyzer(std::shared_ptr<const SearchConfig> config)
    : config_(std::move(config)) {}

Result<QueryAnalysis> QueryAnalyzer::analyze(const std::string& query) const {
    if (query.empty() || isBlank(query)) {
        return Error{ErrorCode::InvalidQuery, "Query must not be empty"};
    }

    const std::string queryLower = common::toLowerAscii(query);

    QueryAnalysis analysis;
    analysis.complexity = classifyComplexity(queryLower);
    analysis.wordCount = common::splitWhitespace(query).size();
    analysis.charCount = common::codePointCount(query);

    for (const auto& domain : config_->tables.domainKeywords) {
        std::vector<std::string> matches;
        for (const auto& keyword : domain.keywords) {
            if (queryLower.find(keyword) != std::string::npos) {
                matches.push_back(keyword);
            }
        }
        if (!matches.empty()) {
            analysis.domainMatches.emplace(domain.domain, std::move(matches));
        }
    }
    analysis.hasTechnicalTerms = !analysis.domainMatches.empty();
    analysis.queryType = classifyQueryType(queryLower);

    spdlog::debug("Query analysis: complexity={} type={} domains={} words={}",
                  complexityToString(analysis.complexity), queryTypeToString(analysis.queryType),
                  analysis.domainMatches.size(), analysis.wordCount);
    return analysis;
}

QueryComplexity QueryAnalyzer::classifyComplexity(const std::string& queryLower) const {
    QueryComplexity best = QueryComplexity::MEDIUM;
    size_t bestScore = 0;
    for (const auto& indicators : complexityIndicators()) {
        size_t score = 0;
        for (const auto& term : indicators.terms) {
            if (queryLower.find(term) != std::string::npos) {
                ++score;
            }
        }
        // Strictly greater keeps the earlier (higher precedence) tier on ties
        if (score > bestScore) {
            bestScore = score;
            best = indicators.tier;
        }
    }
    return best;
}

QueryType QueryAnalyzer::classifyQueryType(const std::string& queryLower) const {
    for (const auto& family : queryTypeTerms()) {
        for (const auto& term : family.terms) {
            if (queryLower.find(term) != std::string::npos) {
                return family.type;
            }
        }
    }
    return QueryType::General;
}

} // namespace regix::search

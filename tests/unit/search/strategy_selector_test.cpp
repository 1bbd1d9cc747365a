#include <gtest/gtest.h>
#include <regix/search/strategy_selector.h>

#include <memory>

using namespace regix::search;

namespace {

QueryAnalysis analysisFor(QueryComplexity complexity, bool technical = false) {
    QueryAnalysis a;
    a.complexity = complexity;
    a.hasTechnicalTerms = technical;
    if (technical) {
        a.domainMatches["클라우드"] = {"cloud"};
    }
    return a;
}

class StrategySelectorTest : public ::testing::Test {
protected:
    std::shared_ptr<const SearchConfig> config_ = std::make_shared<const SearchConfig>();
    StrategySelector selector_{config_};
};

} // namespace

TEST_F(StrategySelectorTest, AdaptiveAlwaysResolvesToHybrid) {
    for (auto complexity : {QueryComplexity::LOW, QueryComplexity::MEDIUM, QueryComplexity::HIGH}) {
        for (bool technical : {false, true}) {
            EXPECT_EQ(selector_.selectMethod(analysisFor(complexity, technical),
                                             SearchMethod::ADAPTIVE),
                      SearchMethod::HYBRID);
        }
    }
}

TEST_F(StrategySelectorTest, ExplicitMethodsPassThrough) {
    auto a = analysisFor(QueryComplexity::HIGH, true);
    for (auto m : {SearchMethod::VECTOR_ONLY, SearchMethod::KEYWORD_ONLY, SearchMethod::HYBRID,
                   SearchMethod::MULTI_MODAL}) {
        EXPECT_EQ(selector_.selectMethod(a, m), m);
    }
}

TEST_F(StrategySelectorTest, BudgetFollowsComplexity) {
    EXPECT_EQ(selector_.candidateBudget(QueryComplexity::LOW), 30u);
    EXPECT_EQ(selector_.candidateBudget(QueryComplexity::MEDIUM), 50u);
    EXPECT_EQ(selector_.candidateBudget(QueryComplexity::HIGH), 80u);
}

TEST_F(StrategySelectorTest, HybridPlanWidensSubSearches) {
    auto plan = selector_.plan(analysisFor(QueryComplexity::MEDIUM), SearchMethod::ADAPTIVE,
                               std::nullopt);
    EXPECT_EQ(plan.method, SearchMethod::HYBRID);
    EXPECT_EQ(plan.candidateBudget, 50u);
    EXPECT_TRUE(plan.runVector);
    EXPECT_TRUE(plan.runKeyword);
    EXPECT_FALSE(plan.runMetadata);
    EXPECT_EQ(plan.vectorLimit, 100u);
    EXPECT_EQ(plan.keywordLimit, 100u);
    EXPECT_FALSE(plan.includeMetadataInFusion);
    EXPECT_FALSE(plan.normalizeFinalScores);
}

TEST_F(StrategySelectorTest, MultiModalPlanAddsMetadataAndNormalization) {
    auto plan = selector_.plan(analysisFor(QueryComplexity::LOW), SearchMethod::MULTI_MODAL,
                               std::nullopt);
    EXPECT_EQ(plan.candidateBudget, 30u);
    EXPECT_TRUE(plan.runVector);
    EXPECT_TRUE(plan.runKeyword);
    EXPECT_TRUE(plan.runMetadata);
    EXPECT_EQ(plan.vectorLimit, 60u);
    EXPECT_EQ(plan.keywordLimit, 60u);
    EXPECT_EQ(plan.metadataLimit, 30u);
    EXPECT_TRUE(plan.includeMetadataInFusion);
    EXPECT_TRUE(plan.normalizeFinalScores);
}

TEST_F(StrategySelectorTest, SingleSignalPlansUseBudgetDirectly) {
    auto vectorPlan =
        selector_.plan(analysisFor(QueryComplexity::HIGH), SearchMethod::VECTOR_ONLY, 7);
    EXPECT_EQ(vectorPlan.candidateBudget, 7u);
    EXPECT_TRUE(vectorPlan.runVector);
    EXPECT_FALSE(vectorPlan.runKeyword);
    EXPECT_EQ(vectorPlan.vectorLimit, 7u);

    auto keywordPlan =
        selector_.plan(analysisFor(QueryComplexity::HIGH), SearchMethod::KEYWORD_ONLY, 0);
    EXPECT_EQ(keywordPlan.candidateBudget, 80u); // 0 means "not given"
    EXPECT_FALSE(keywordPlan.runVector);
    EXPECT_EQ(keywordPlan.keywordLimit, 80u);
}

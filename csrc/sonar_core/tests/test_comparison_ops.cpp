/**
 * @file test_comparison_ops.cpp
 * @brief Unit tests for batch evaluation and quietest/loudest ranking
 */

#include <gtest/gtest.h>
#include "sonar/comparison_ops.h"
#include "sonar/errors.h"
#include <algorithm>
#include <vector>

namespace sonar {
namespace {

class ComparisonTest : public ::testing::Test {
protected:
    AcousticModel model;
    Scenario scenario{15.0, 5000.0, 50.0};

    std::vector<SubmarineProfile> fleet = {
        {"Mid",   95.0, 20.0, 2.5, 0.1, 2.5, 30.0},
        {"Quiet", 85.0, 22.0, 2.0, 0.1, 2.5, 30.0},
        {"Loud", 110.0, 18.0, 3.0, 0.1, 2.5, 30.0},
    };
};

TEST_F(ComparisonTest, EvaluateAllPreservesInputOrder) {
    auto results = evaluate_all(model, fleet, scenario);
    ASSERT_EQ(results.size(), fleet.size());
    for (std::size_t i = 0; i < fleet.size(); ++i) {
        EXPECT_EQ(results[i].profile_id, fleet[i].name);
        EXPECT_EQ(results[i].snr_db, model.snr(fleet[i], scenario));
    }
}

TEST_F(ComparisonTest, EvaluateAllEmptyInput) {
    EXPECT_TRUE(evaluate_all(model, {}, scenario).empty());
}

TEST_F(ComparisonTest, QuietestAndLoudest) {
    EXPECT_EQ(quietest(model, fleet, scenario).profile_id, "Quiet");
    EXPECT_EQ(loudest(model, fleet, scenario).profile_id, "Loud");
}

TEST_F(ComparisonTest, RankingMatchesMinMaxOfBatch) {
    auto results = evaluate_all(model, fleet, scenario);
    auto by_snr = [](const SNRResult& a, const SNRResult& b) { return a.snr_db < b.snr_db; };
    double lo = std::min_element(results.begin(), results.end(), by_snr)->snr_db;
    double hi = std::max_element(results.begin(), results.end(), by_snr)->snr_db;

    EXPECT_EQ(quietest(model, fleet, scenario).snr_db, lo);
    EXPECT_EQ(loudest(model, fleet, scenario).snr_db, hi);
    EXPECT_EQ(quietest_of(results).snr_db, lo);
    EXPECT_EQ(loudest_of(results).snr_db, hi);
}

TEST_F(ComparisonTest, TiesResolveToFirstListed) {
    std::vector<SubmarineProfile> twins = {
        {"TwinA", 90.0, 20.0, 2.5, 0.1, 2.5, 30.0},
        {"TwinB", 90.0, 20.0, 2.5, 0.1, 2.5, 30.0},
    };
    EXPECT_EQ(quietest(model, twins, scenario).profile_id, "TwinA");
    EXPECT_EQ(loudest(model, twins, scenario).profile_id, "TwinA");

    std::vector<SubmarineProfile> reversed(twins.rbegin(), twins.rend());
    EXPECT_EQ(quietest(model, reversed, scenario).profile_id, "TwinB");
    EXPECT_EQ(loudest(model, reversed, scenario).profile_id, "TwinB");
}

TEST_F(ComparisonTest, BatchIsAllOrNothing) {
    auto with_bad = fleet;
    with_bad.push_back({"Broken", 90.0, 0.0, 2.5, 0.1, 2.5, 30.0});
    EXPECT_THROW(evaluate_all(model, with_bad, scenario), DomainError);
    EXPECT_THROW(quietest(model, with_bad, scenario), DomainError);
    EXPECT_THROW(loudest(model, with_bad, scenario), DomainError);
}

TEST_F(ComparisonTest, BadScenarioAbortsBatch) {
    EXPECT_THROW(evaluate_all(model, fleet, Scenario{-1.0, 5000.0}), DomainError);
    EXPECT_THROW(evaluate_all(model, fleet, Scenario{15.0, 0.0}), DomainError);
}

TEST_F(ComparisonTest, EmptySetCannotBeRanked) {
    EXPECT_THROW(quietest(model, {}, scenario), DomainError);
    EXPECT_THROW(loudest(model, {}, scenario), DomainError);
    EXPECT_THROW(quietest_of({}), DomainError);
}

TEST_F(ComparisonTest, CavitationCanReorderRanking) {
    // Quiet hull with an early, steep cavitation onset overtakes a louder
    // hull once both are driven hard.
    std::vector<SubmarineProfile> pair = {
        {"EarlyCavitator", 85.0, 10.0, 2.0, 1.0, 2.5, 30.0},
        {"SteadyHull",     95.0, 25.0, 2.0, 0.1, 2.5, 30.0},
    };
    EXPECT_EQ(quietest(model, pair, Scenario{8.0, 5000.0}).profile_id, "EarlyCavitator");
    EXPECT_EQ(quietest(model, pair, Scenario{20.0, 5000.0}).profile_id, "SteadyHull");
}

} // namespace
} // namespace sonar

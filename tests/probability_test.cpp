#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "metacomp/config.hpp"
#include "metacomp/pool.hpp"
#include "metacomp/probability.hpp"

namespace metacomp {
    using fixtures::error_code_of;

    class ProbabilityTest : public ::testing::Test {
    protected:
        // Opponents hold half of A and half of B.
        ProbabilityTest() {
            pool.observe_owned("A", 5, Holder::Opponent);
            pool.observe_owned("B", 5, Holder::Opponent);
        }

        std::shared_ptr<const UnitRegistry> registry{fixtures::small_registry()};
        PoolState pool{registry};
        PoolProbabilityCalculator independent{fixtures::small_odds(), 5};
        PoolProbabilityCalculator exact{fixtures::small_odds(), 5, make_draw_model(DrawModelKind::Exact)};
    };

    TEST_F(ProbabilityTest, SlotProbabilityScalesTierOddsByShare) {
        EXPECT_DOUBLE_EQ(independent.slot_probability(pool.snapshot(), "A", 5), 0.25);
        // Tier 2 is untouched: 0.3 * 8 / 16.
        EXPECT_DOUBLE_EQ(independent.slot_probability(pool.snapshot(), "C", 5), 0.15);
        EXPECT_DOUBLE_EQ(independent.slot_probability(pool.snapshot(), "D", 1), 0.0);
    }

    TEST_F(ProbabilityTest, IndependentRefreshProbability) {
        EXPECT_NEAR(independent.refresh_probability(pool.snapshot(), "A", 5), 1.0 - std::pow(0.75, 5), 1e-12);
    }

    TEST_F(ProbabilityTest, ExhaustedUnitCannotBeDrawn) {
        pool.observe_owned("A", 5, Holder::Opponent);
        const PoolSnapshot snapshot = pool.snapshot();
        for (const PoolProbabilityCalculator* calculator : { &independent, &exact }) {
            EXPECT_EQ(calculator->slot_probability(snapshot, "A", 5), 0.0);
            EXPECT_EQ(calculator->refresh_probability(snapshot, "A", 5), 0.0);
            EXPECT_EQ(calculator->completion_probability(snapshot, "A", 5, 1, 100), 0.0);
            EXPECT_TRUE(std::isinf(calculator->expected_refreshes(snapshot, "A", 5, 1)));
        }
        EXPECT_GT(independent.slot_probability(snapshot, "B", 5), 0.0);
    }

    TEST_F(ProbabilityTest, ExhaustedTierCannotBeDrawn) {
        pool.observe_owned("A", 5, Holder::Opponent);
        pool.observe_owned("B", 5, Holder::Opponent);
        const PoolSnapshot snapshot = pool.snapshot();
        EXPECT_EQ(snapshot.total_remaining_at_tier(1), 0u);
        EXPECT_EQ(independent.slot_probability(snapshot, "A", 5), 0.0);
        EXPECT_EQ(independent.slot_probability(snapshot, "B", 5), 0.0);
        EXPECT_EQ(exact.refresh_probability(snapshot, "B", 5), 0.0);
    }

    TEST_F(ProbabilityTest, ExactMatchesIndependentForOneSlot) {
        const PoolProbabilityCalculator single_independent(fixtures::small_odds(), 1);
        const PoolProbabilityCalculator single_exact(fixtures::small_odds(), 1, make_draw_model(DrawModelKind::Exact));
        const PoolSnapshot snapshot = pool.snapshot();
        for (const Unit& unit : registry->units()) {
            EXPECT_NEAR(single_exact.refresh_probability(snapshot, unit.id, 5),
                        single_independent.refresh_probability(snapshot, unit.id, 5), 1e-12) << unit.id;
        }
    }

    TEST_F(ProbabilityTest, ExactIsNeverBelowIndependent) {
        const PoolSnapshot snapshot = pool.snapshot();
        for (const Unit& unit : registry->units()) {
            for (Level level : { Level{1}, Level{5}, Level{7} }) {
                EXPECT_GE(exact.refresh_probability(snapshot, unit.id, level) + 1e-12,
                          independent.refresh_probability(snapshot, unit.id, level)) << unit.id;
            }
        }
        // Without replacement within a refresh the second A slot is more likely to hit.
        EXPECT_GT(exact.refresh_probability(snapshot, "A", 5), independent.refresh_probability(snapshot, "A", 5));
    }

    TEST_F(ProbabilityTest, ExactHandlesTierSmallerThanSlotCount) {
        pool.observe_owned("A", 4, Holder::Opponent);
        pool.observe_owned("B", 4, Holder::Opponent);
        // One A and one B remain, five slots may all land on tier 1.
        const double hit = exact.refresh_probability(pool.snapshot(), "A", 1);
        EXPECT_DOUBLE_EQ(hit, 1.0);
    }

    TEST_F(ProbabilityTest, LaterCopiesAreNeverEasier) {
        const std::vector<double> hits = independent.stage_hits(pool.snapshot(), "C", 7, 4);
        ASSERT_EQ(hits.size(), 4u);
        for (std::size_t j = 1; j < hits.size(); j++) EXPECT_LE(hits[j], hits[j - 1]);
        EXPECT_GT(hits.back(), 0.0);
    }

    TEST_F(ProbabilityTest, SingleCopyFollowsGeometricLaw) {
        const PoolSnapshot snapshot = pool.snapshot();
        const double hit = independent.refresh_probability(snapshot, "D", 5);
        EXPECT_NEAR(independent.expected_refreshes(snapshot, "D", 5, 1), 1.0 / hit, 1e-9);
        EXPECT_NEAR(independent.completion_probability(snapshot, "D", 5, 1, 4), 1.0 - std::pow(1.0 - hit, 4), 1e-12);
        EXPECT_EQ(independent.completion_probability(snapshot, "D", 5, 1, 0), 0.0);
    }

    TEST_F(ProbabilityTest, CompletionGrowsWithBudget) {
        const PoolSnapshot snapshot = pool.snapshot();
        double previous = 0.0;
        for (std::uint32_t budget : { 1u, 2u, 5u, 10u, 40u }) {
            const double completion = independent.completion_probability(snapshot, "C", 5, 3, budget);
            EXPECT_GE(completion, previous);
            EXPECT_LE(completion, 1.0);
            previous = completion;
        }
    }

    TEST_F(ProbabilityTest, ExpectedRefreshesGrowAsPoolDepletes) {
        double previous = independent.expected_refreshes(pool.snapshot(), "C", 5, 1);
        for (int taken = 0; taken < 7; taken++) {
            pool.observe_owned("C", 1, Holder::Opponent);
            const double expected = independent.expected_refreshes(pool.snapshot(), "C", 5, 1);
            EXPECT_GT(expected, previous);
            previous = expected;
        }
    }

    TEST_F(ProbabilityTest, UnitOddsReportsInputsAndContention) {
        const PoolSnapshot snapshot = pool.snapshot();
        const UnitOdds odds = independent.unit_odds(snapshot, "A", 5, 2, 10);
        EXPECT_EQ(odds.unit_id, "A");
        EXPECT_EQ(odds.cost, 1);
        EXPECT_EQ(odds.remaining, 5);
        EXPECT_EQ(odds.remaining_at_tier, 10u);
        EXPECT_EQ(odds.copies_needed, 2);
        EXPECT_DOUBLE_EQ(odds.slot_probability, 0.25);

        const UnitOdds contended = independent.unit_odds(snapshot, "A", 5, 2, 10, 0.5);
        EXPECT_DOUBLE_EQ(contended.refresh_probability, 0.5 * odds.refresh_probability);
        EXPECT_LT(contended.completion_probability, odds.completion_probability);
        EXPECT_GT(contended.expected_refreshes, odds.expected_refreshes);
    }

    TEST_F(ProbabilityTest, AllUnitOddsCoversCatalog) {
        const std::vector<UnitOdds> all = independent.all_unit_odds(pool.snapshot(), 7, 1, 10);
        ASSERT_EQ(all.size(), registry->size());
        EXPECT_EQ(all[3].unit_id, "D");
    }

    TEST_F(ProbabilityTest, RejectsBadInputs) {
        const PoolSnapshot snapshot = pool.snapshot();
        EXPECT_EQ(error_code_of([&]() { independent.slot_probability(snapshot, "Z", 5); }), ErrorCode::UnknownUnit);
        EXPECT_EQ(error_code_of([&]() { independent.slot_probability(snapshot, "A", 3); }), ErrorCode::InvalidLevel);
        EXPECT_EQ(error_code_of([]() { PoolProbabilityCalculator(fixtures::small_odds(), 0); }),
                  ErrorCode::InvalidConfig);
    }

    TEST(DrawModel, NamesAndParsing) {
        EXPECT_EQ(make_draw_model(DrawModelKind::Independent).name(), "independent");
        EXPECT_EQ(make_draw_model(DrawModelKind::Exact).name(), "exact");
        EXPECT_EQ(parse_draw_model("exact"), DrawModelKind::Exact);
        EXPECT_EQ(fixtures::error_code_of([]() { parse_draw_model("quantum"); }), ErrorCode::InvalidConfig);
    }

    TEST(CheckedProbability, SnapsRoundingAndRejectsDefects) {
        EXPECT_EQ(details::checked_probability(1.0 + 1e-12, "test"), 1.0);
        EXPECT_EQ(details::checked_probability(-1e-12, "test"), 0.0);
        EXPECT_THROW(details::checked_probability(1.01, "test"), ProbabilityInvariantError);
        EXPECT_THROW(details::checked_probability(std::numeric_limits<double>::quiet_NaN(), "test"),
                     ProbabilityInvariantError);
    }
}

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "metacomp/pool.hpp"

namespace metacomp {
    using fixtures::error_code_of;

    class PoolStateTest : public ::testing::Test {
    protected:
        std::shared_ptr<const UnitRegistry> registry{fixtures::small_registry()};
        PoolState pool{registry};
    };

    TEST_F(PoolStateTest, StartsFull) {
        for (const Unit& unit : registry->units()) EXPECT_EQ(pool.remaining(unit.id), unit.total_copies);
        EXPECT_TRUE(pool.owned_units().empty());
    }

    TEST_F(PoolStateTest, UnderflowLeavesStateUnchanged) {
        pool.observe_owned("A", 6, Holder::Opponent);
        ASSERT_EQ(pool.remaining("A"), 4);
        EXPECT_EQ(error_code_of([&]() { pool.observe_owned("A", 11); }), ErrorCode::PoolUnderflow);
        EXPECT_EQ(error_code_of([&]() { pool.observe_owned("A", 5); }), ErrorCode::PoolUnderflow);
        EXPECT_EQ(pool.remaining("A"), 4);
        EXPECT_EQ(pool.held_by("A", Holder::Self), 0);
        EXPECT_EQ(pool.held_by("A", Holder::Opponent), 6);
    }

    TEST_F(PoolStateTest, ObserveThenReleaseRestoresRemaining) {
        for (Holder holder : { Holder::Self, Holder::Opponent, Holder::Shop }) {
            const std::uint16_t before = pool.remaining("C");
            pool.observe_owned("C", 3, holder);
            EXPECT_EQ(pool.remaining("C"), before - 3);
            pool.release("C", 3, holder);
            EXPECT_EQ(pool.remaining("C"), before);
        }
    }

    TEST_F(PoolStateTest, ReleaseBeyondTotalFails) {
        EXPECT_EQ(error_code_of([&]() { pool.release("D", 1); }), ErrorCode::PoolOverflow);
        EXPECT_EQ(pool.remaining("D"), 6);
    }

    TEST_F(PoolStateTest, ReleaseFromWrongHolderFails) {
        pool.observe_owned("B", 2, Holder::Opponent);
        EXPECT_EQ(error_code_of([&]() { pool.release("B", 1, Holder::Self); }), ErrorCode::PoolOverflow);
        EXPECT_EQ(error_code_of([&]() { pool.release("B", 3, Holder::Opponent); }), ErrorCode::PoolOverflow);
        EXPECT_EQ(pool.remaining("B"), 8);
        pool.release("B", 2, Holder::Opponent);
        EXPECT_EQ(pool.remaining("B"), 10);
    }

    TEST_F(PoolStateTest, UnknownUnitFails) {
        EXPECT_EQ(error_code_of([&]() { pool.observe_owned("Z", 1); }), ErrorCode::UnknownUnit);
        EXPECT_EQ(error_code_of([&]() { pool.release("Z", 1); }), ErrorCode::UnknownUnit);
    }

    TEST_F(PoolStateTest, ReleaseAllReturnsOnlyThatHolder) {
        pool.observe_owned("A", 2, Holder::Shop);
        pool.observe_owned("C", 1, Holder::Shop);
        pool.observe_owned("A", 1, Holder::Self);
        pool.release_all(Holder::Shop);
        EXPECT_EQ(pool.remaining("A"), 9);
        EXPECT_EQ(pool.remaining("C"), 8);
        EXPECT_EQ(pool.held_by("A", Holder::Shop), 0);
        EXPECT_EQ(pool.held_by("A", Holder::Self), 1);
    }

    TEST_F(PoolStateTest, OwnedUnitsAreSelfHoldingsOnly) {
        pool.observe_owned("A", 1);
        pool.observe_owned("C", 2, Holder::Opponent);
        pool.observe_owned("D", 1, Holder::Shop);
        EXPECT_EQ(pool.owned_units(), (std::set<UnitId, std::less<>>{ "A" }));
        pool.release("A", 1);
        EXPECT_TRUE(pool.owned_units().empty());
    }

    TEST_F(PoolStateTest, RemainingStaysWithinBoundsUnderMixedOperations) {
        const std::vector<std::uint16_t> counts{ 3, 7, 1, 12, 4, 9 };
        std::size_t step = 0;
        for (const Unit& unit : registry->units()) {
            for (std::uint16_t count : counts) {
                const Holder holder = static_cast<Holder>(step++ % NUM_HOLDERS);
                const std::uint16_t before = pool.remaining(unit.id);
                try {
                    if (step % 3 == 0) pool.release(unit.id, count, holder);
                    else pool.observe_owned(unit.id, count, holder);
                } catch (const Error& error) {
                    EXPECT_TRUE(error.code() == ErrorCode::PoolUnderflow || error.code() == ErrorCode::PoolOverflow);
                    EXPECT_EQ(pool.remaining(unit.id), before);
                }
                EXPECT_LE(pool.remaining(unit.id), unit.total_copies);
            }
        }
    }

    TEST_F(PoolStateTest, SnapshotIsDetachedFromLedger) {
        pool.observe_owned("A", 5, Holder::Opponent);
        pool.observe_owned("B", 5, Holder::Opponent);
        const PoolSnapshot snapshot = pool.snapshot();
        pool.observe_owned("A", 5, Holder::Opponent);
        EXPECT_EQ(snapshot.remaining("A"), 5);
        EXPECT_EQ(snapshot.total_remaining_at_tier(1), 10u);
        EXPECT_EQ(snapshot.total_remaining_at_tier(2), 16u);
        EXPECT_EQ(snapshot.total_remaining_at_tier(9), 0u);
        EXPECT_EQ(pool.remaining("A"), 0);
    }

    TEST_F(PoolStateTest, PoolStatusGroupsByCost) {
        pool.observe_owned("E", 3, Holder::Opponent);
        const auto status = pool.snapshot().pool_status();
        ASSERT_EQ(status.size(), 3u);
        const std::vector<PoolEntry>& tier_two = status.at(2);
        ASSERT_EQ(tier_two.size(), 2u);
        EXPECT_EQ(tier_two[1].unit_id, "E");
        EXPECT_EQ(tier_two[1].remaining, 5);
        EXPECT_EQ(tier_two[1].total, 8);
    }
}

#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "metacomp/session.hpp"

namespace metacomp {
    using fixtures::error_code_of;
    using OwnedUnitSet = std::set<UnitId, std::less<>>;

    TEST(Session, KindsMapToHolders) {
        Session session(fixtures::small_registry());
        session.apply({ ObservationKind::Bought, "A", 2 });
        session.apply({ ObservationKind::Sighted, "A", 3 });
        session.apply({ ObservationKind::ShopShown, "A", 1 });
        EXPECT_EQ(session.remaining("A"), 4);
        EXPECT_EQ(session.held_by("A", Holder::Self), 2);
        EXPECT_EQ(session.held_by("A", Holder::Opponent), 3);
        EXPECT_EQ(session.held_by("A", Holder::Shop), 1);

        session.apply({ ObservationKind::Sold, "A", 1 });
        session.apply({ ObservationKind::Unsighted, "A", 3 });
        session.apply({ ObservationKind::ShopCleared, "A", 1 });
        EXPECT_EQ(session.remaining("A"), 9);
        EXPECT_EQ(session.owned_units(), (OwnedUnitSet{ "A" }));
    }

    TEST(Session, FailedApplyLeavesPoolUnchanged) {
        Session session(fixtures::small_registry());
        session.observe_owned("D", 4, Holder::Opponent);
        EXPECT_EQ(error_code_of([&]() { session.apply({ ObservationKind::Bought, "D", 3 }); }), ErrorCode::PoolUnderflow);
        EXPECT_EQ(error_code_of([&]() { session.apply({ ObservationKind::Sold, "D", 1 }); }), ErrorCode::PoolOverflow);
        EXPECT_EQ(session.remaining("D"), 2);
    }

    TEST(Session, DrainAppliesPostedObservations) {
        Session session(fixtures::small_registry());
        EXPECT_TRUE(session.post({ ObservationKind::Bought, "C", 1 }));
        EXPECT_TRUE(session.post({ ObservationKind::Sighted, "C", 2 }));
        EXPECT_EQ(session.remaining("C"), 8);
        EXPECT_TRUE(session.drain().empty());
        EXPECT_EQ(session.remaining("C"), 5);
        EXPECT_EQ(session.pending_approx(), 0u);
    }

    TEST(Session, DrainReturnsRejectedObservations) {
        Session session(fixtures::small_registry());
        session.post({ ObservationKind::Bought, "D", 7 });
        session.post({ ObservationKind::Bought, "Nobody", 1 });
        session.post({ ObservationKind::Bought, "D", 2 });
        const std::vector<RejectedObservation> rejected = session.drain();
        ASSERT_EQ(rejected.size(), 2u);
        EXPECT_EQ(rejected[0].code, ErrorCode::PoolUnderflow);
        EXPECT_EQ(rejected[0].observation.count, 7);
        EXPECT_EQ(rejected[1].code, ErrorCode::UnknownUnit);
        EXPECT_EQ(rejected[1].observation.unit_id, "Nobody");
        EXPECT_EQ(session.remaining("D"), 4);
    }

    TEST(Session, ConcurrentProducersAreSerialized) {
        Session session(fixtures::small_registry());
        {
            std::vector<std::jthread> producers;
            for (int i = 0; i < 4; i++) {
                producers.emplace_back([&session]() {
                    for (int j = 0; j < 2; j++) session.post({ ObservationKind::Sighted, "A", 1 });
                    session.apply({ ObservationKind::ShopShown, "B", 1 });
                });
            }
        }
        EXPECT_TRUE(session.drain().empty());
        EXPECT_EQ(session.remaining("A"), 2);
        EXPECT_EQ(session.remaining("B"), 6);
        EXPECT_EQ(session.held_by("A", Holder::Opponent), 8);
    }

    TEST(Session, ViewAgreesWithLedger) {
        Session session(fixtures::small_registry());
        session.observe_owned("A", 1);
        session.observe_owned("E", 2);
        const SessionView view = session.view();
        EXPECT_EQ(view.owned, (OwnedUnitSet{ "A", "E" }));
        EXPECT_EQ(view.snapshot.remaining("E"), 6);
        session.release_all(Holder::Self);
        EXPECT_EQ(view.snapshot.remaining("E"), 6);
        EXPECT_EQ(session.remaining("E"), 8);
        EXPECT_TRUE(session.owned_units().empty());
    }

    TEST(Session, SessionsDoNotShareState) {
        const auto registry = fixtures::small_registry();
        Session first(registry);
        Session second(registry);
        first.observe_owned("C", 8, Holder::Opponent);
        EXPECT_EQ(first.remaining("C"), 0);
        EXPECT_EQ(second.remaining("C"), 8);
    }
}

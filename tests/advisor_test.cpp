#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "metacomp/loader.hpp"
#include "metacomp/metacomp.hpp"

namespace metacomp {
    using fixtures::error_code_of;
    using fixtures::make_deck;

    TEST(Advisor, RejectsConfigWithoutOddsForDefaultLevel) {
        EngineConfig config;
        config.default_level = 9;
        EXPECT_EQ(error_code_of([&]() { Advisor(fixtures::small_registry(), fixtures::small_odds(), config); }),
                  ErrorCode::InvalidConfig);
        config.default_level = 5;
        config.slots_per_refresh = 0;
        EXPECT_EQ(error_code_of([&]() { Advisor(fixtures::small_registry(), fixtures::small_odds(), config); }),
                  ErrorCode::InvalidConfig);
    }

    TEST(Advisor, RecommendsFromSessionState) {
        EngineConfig config;
        config.default_level = 5;
        const Advisor advisor(fixtures::small_registry(), fixtures::small_odds(), config);
        std::unique_ptr<Session> session = advisor.new_session();
        session->apply({ ObservationKind::Bought, "C", 1 });
        session->apply({ ObservationKind::Bought, "E", 1 });
        session->apply({ ObservationKind::Sighted, "D", 5 });

        const std::vector<MetaDeck> decks{ make_deck("tier-three", { "D", "A" }), make_deck("tier-two", { "C", "E", "A" }) };
        const std::vector<RecommendationResult> results = advisor.recommend(*session, decks);
        ASSERT_EQ(results.size(), 2u);
        EXPECT_EQ(results[0].deck_id, "tier-two");
        EXPECT_EQ(results[0].owned_core, (std::vector<UnitId>{ "C", "E" }));
        EXPECT_EQ(results[1].missing.size(), 2u);
        EXPECT_EQ(results[1].missing[0].remaining, 1);

        RankOptions options = advisor.default_options();
        options.limit = 1;
        EXPECT_EQ(advisor.recommend(*session, decks, options).size(), 1u);
    }

    TEST(Advisor, ModelComesFromConfig) {
        EngineConfig config;
        config.default_level = 5;
        config.draw_model = DrawModelKind::Exact;
        const Advisor advisor(fixtures::small_registry(), fixtures::small_odds(), config);
        EXPECT_EQ(advisor.calculator().model().name(), "exact");
        const std::vector<UnitOdds> odds = advisor.unit_odds(*advisor.new_session(), 5);
        EXPECT_EQ(odds.size(), 5u);
    }

    TEST(Advisor, RanksExampleData) {
        const std::string dir = METACOMP_EXAMPLE_DATA_DIR;
        const Advisor advisor(load_registry(dir + "/champions.json"),
                              std::make_shared<const ShopOddsTable>(ShopOddsTable::standard()),
                              load_config(dir + "/config.json"));
        std::unique_ptr<Session> session = advisor.new_session();
        const SessionState state = load_session_state(dir + "/state.json", advisor.config());
        for (const Observation& observation : to_observations(state)) session->post(observation);
        EXPECT_TRUE(session->drain().empty());
        EXPECT_EQ(session->remaining("Yasuo"), 26);
        EXPECT_EQ(session->held_by("Jhin", Holder::Shop), 1);

        RankOptions options = advisor.default_options();
        options.level = state.level;
        options.refresh_budget = state.refresh_budget;
        const std::vector<RecommendationResult> first = advisor.recommend(*session, load_meta_decks(dir + "/meta.json"), options);
        const std::vector<RecommendationResult> second = advisor.recommend(*session, load_meta_decks(dir + "/meta.json"), options);
        ASSERT_EQ(first.size(), 4u);
        for (std::size_t i = 0; i < first.size(); i++) {
            EXPECT_EQ(first[i].deck_id, second[i].deck_id);
            EXPECT_GE(first[i].completion_probability, 0.0);
            EXPECT_LE(first[i].completion_probability, 1.0);
            if (i > 0) EXPECT_GE(first[i - 1].score, first[i].score);
        }
    }
}

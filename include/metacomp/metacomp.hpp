#ifndef METACOMP_METACOMP_HPP
#define METACOMP_METACOMP_HPP

#include <memory>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "metacomp/config.hpp"
#include "metacomp/errors.hpp"
#include "metacomp/matcher.hpp"
#include "metacomp/odds.hpp"
#include "metacomp/pool.hpp"
#include "metacomp/probability.hpp"
#include "metacomp/ranker.hpp"
#include "metacomp/registry.hpp"
#include "metacomp/session.hpp"
#include "metacomp/types.hpp"

namespace metacomp {
    // Binds the shared catalogs and the configuration. One Advisor serves any number of sessions.
    class Advisor {
    public:
        Advisor(std::shared_ptr<const UnitRegistry> registry_, std::shared_ptr<const ShopOddsTable> odds_,
                EngineConfig config_ = {})
            : unit_registry(std::move(registry_)), odds_table(std::move(odds_)), engine_config(validated(config_)),
              probability_calculator(odds_table, engine_config.slots_per_refresh,
                                     make_draw_model(engine_config.draw_model))
        {
            if (!odds_table->supports(engine_config.default_level)) {
                throw Error(ErrorCode::InvalidConfig,
                            fmt::format("Default level {} has no shop odds.", engine_config.default_level));
            }
        }

        auto new_session() const -> std::unique_ptr<Session> { return std::make_unique<Session>(unit_registry); }

        auto default_options() const noexcept -> RankOptions { return RankOptions::from_config(engine_config); }

        auto recommend(const Session& session, const std::vector<MetaDeck>& decks) const
                -> std::vector<RecommendationResult> {
            return recommend(session, decks, default_options());
        }

        auto recommend(const Session& session, const std::vector<MetaDeck>& decks, const RankOptions& options) const
                -> std::vector<RecommendationResult> {
            const SessionView view = session.view();
            return recommend(view.owned, decks, view.snapshot, options);
        }

        auto recommend(const OwnedUnits& owned, const std::vector<MetaDeck>& decks, const PoolSnapshot& snapshot,
                       const RankOptions& options) const -> std::vector<RecommendationResult> {
            return RecommendationRanker(probability_calculator).rank(owned, decks, snapshot, options);
        }

        auto unit_odds(const Session& session, Level level) const -> std::vector<UnitOdds> {
            return probability_calculator.all_unit_odds(session.snapshot(), level, engine_config.copies_per_unit,
                                                        engine_config.refresh_budget);
        }

        auto registry() const noexcept -> const std::shared_ptr<const UnitRegistry>& { return unit_registry; }
        auto odds() const noexcept -> const std::shared_ptr<const ShopOddsTable>& { return odds_table; }
        auto config() const noexcept -> const EngineConfig& { return engine_config; }
        auto calculator() const noexcept -> const PoolProbabilityCalculator& { return probability_calculator; }

    private:
        static auto validated(const EngineConfig& config) -> EngineConfig {
            config.validate();
            return config;
        }

        std::shared_ptr<const UnitRegistry> unit_registry;
        std::shared_ptr<const ShopOddsTable> odds_table;
        EngineConfig engine_config;
        PoolProbabilityCalculator probability_calculator;
    };
}
#endif

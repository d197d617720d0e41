#ifndef METACOMP_PROBABILITY_HPP
#define METACOMP_PROBABILITY_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "metacomp/errors.hpp"
#include "metacomp/odds.hpp"
#include "metacomp/pool.hpp"
#include "metacomp/types.hpp"
#include "metacomp/details/acquisition.hpp"
#include "metacomp/details/checks.hpp"
#include "metacomp/details/draw_model.hpp"

namespace metacomp {
    // Shop odds for individual units. A pure function of the odds table, the draw model and the
    // snapshot it is handed, so it is safe to share between threads.
    class PoolProbabilityCalculator {
    public:
        PoolProbabilityCalculator(std::shared_ptr<const ShopOddsTable> odds_, std::uint8_t slots_per_refresh_,
                                  details::DrawModel model_ = {})
            : odds_table(std::move(odds_)), slots(slots_per_refresh_), draw_model(std::move(model_))
        {
            if (slots == 0) throw Error(ErrorCode::InvalidConfig, "A shop refresh needs at least one slot.");
        }

        auto slot_probability(const PoolSnapshot& snapshot, std::string_view id, Level level) const -> double {
            return details::checked_probability(tier_draw(snapshot, id, level, 0).slot_probability(), "Slot");
        }

        auto refresh_probability(const PoolSnapshot& snapshot, std::string_view id, Level level) const -> double {
            return details::checked_probability(draw_model.refresh_probability(tier_draw(snapshot, id, level, 0)),
                                                "Refresh");
        }

        // Refresh hit probability for each of the next `copies` purchases of the unit. Each purchase
        // removes a copy from both the unit and its tier, so the rates never increase.
        auto stage_hits(const PoolSnapshot& snapshot, std::string_view id, Level level, std::uint8_t copies,
                        double contention = 1.0) const -> std::vector<double> {
            std::vector<double> hits;
            hits.reserve(copies);
            for (std::uint8_t j = 0; j < copies; j++) {
                const double hit = draw_model.refresh_probability(tier_draw(snapshot, id, level, j));
                hits.push_back(details::checked_probability(contention * hit, "Stage"));
            }
            return hits;
        }

        auto expected_refreshes(const PoolSnapshot& snapshot, std::string_view id, Level level,
                                std::uint8_t copies) const -> double {
            return details::AcquisitionCurve(stage_hits(snapshot, id, level, copies)).expected_refreshes();
        }

        auto completion_probability(const PoolSnapshot& snapshot, std::string_view id, Level level,
                                    std::uint8_t copies, std::uint32_t refresh_budget) const -> double {
            details::AcquisitionCurve curve(stage_hits(snapshot, id, level, copies));
            curve.advance(refresh_budget);
            return details::checked_probability(curve.cdf(), "Completion");
        }

        auto unit_odds(const PoolSnapshot& snapshot, std::string_view id, Level level, std::uint8_t copies,
                       std::uint32_t refresh_budget, double contention = 1.0) const -> UnitOdds {
            const Unit& unit = snapshot.registry().lookup(id);
            details::AcquisitionCurve curve(stage_hits(snapshot, id, level, copies, contention));
            const double expected = curve.expected_refreshes();
            curve.advance(refresh_budget);
            return UnitOdds{
                unit.id,
                unit.cost,
                snapshot.remaining(id),
                snapshot.total_remaining_at_tier(unit.cost),
                copies,
                slot_probability(snapshot, id, level),
                details::checked_probability(contention * refresh_probability(snapshot, id, level), "Refresh"),
                expected,
                details::checked_probability(curve.cdf(), "Completion"),
            };
        }

        // Odds for every unit in the catalog, for display next to a recommendation.
        auto all_unit_odds(const PoolSnapshot& snapshot, Level level, std::uint8_t copies,
                           std::uint32_t refresh_budget) const -> std::vector<UnitOdds> {
            std::vector<UnitOdds> result;
            result.reserve(snapshot.registry().size());
            for (const Unit& unit : snapshot.registry().units()) {
                result.push_back(unit_odds(snapshot, unit.id, level, copies, refresh_budget));
            }
            return result;
        }

        auto odds() const noexcept -> const ShopOddsTable& { return *odds_table; }
        std::uint8_t slots_per_refresh() const noexcept { return slots; }
        auto model() const noexcept -> const details::DrawModel& { return draw_model; }

    private:
        auto tier_draw(const PoolSnapshot& snapshot, std::string_view id, Level level,
                       std::uint32_t already_bought) const -> details::TierDraw {
            const Unit& unit = snapshot.registry().lookup(id);
            const std::uint32_t unit_remaining = snapshot.remaining(id);
            const std::uint32_t tier_remaining = snapshot.total_remaining_at_tier(unit.cost);
            return details::TierDraw{
                odds_table->tier_probability(level, unit.cost),
                unit_remaining > already_bought ? unit_remaining - already_bought : 0,
                tier_remaining > already_bought ? tier_remaining - already_bought : 0,
                slots,
            };
        }

        std::shared_ptr<const ShopOddsTable> odds_table;
        std::uint8_t slots;
        details::DrawModel draw_model;
    };
}
#endif

#ifndef METACOMP_MATCHER_HPP
#define METACOMP_MATCHER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "metacomp/errors.hpp"
#include "metacomp/pool.hpp"
#include "metacomp/probability.hpp"
#include "metacomp/types.hpp"
#include "metacomp/details/acquisition.hpp"
#include "metacomp/details/checks.hpp"

namespace metacomp {
    using OwnedUnits = std::set<UnitId, std::less<>>;

    struct MatchQuery {
        Level level;
        std::uint32_t refresh_budget;
        std::uint8_t copies_per_unit;
        std::uint32_t max_refresh_horizon;
    };

    struct DeckMatch {
        double match_ratio{0.0};
        double flex_ratio{0.0};
        double completion_probability{0.0};
        double expected_refreshes{0.0};
        std::uint32_t acquisition_cost{0};
        std::vector<UnitId> owned_core;
        std::vector<UnitOdds> missing;
        std::vector<TraitProgress> traits;
    };

    class DeckMatcher {
    public:
        explicit DeckMatcher(const PoolProbabilityCalculator& calculator_) noexcept : calculator(calculator_) { }

        static auto match_ratio(const MetaDeck& deck, const OwnedUnits& owned) noexcept -> double {
            return overlap(deck.core, owned);
        }

        static auto flex_ratio(const MetaDeck& deck, const OwnedUnits& owned) noexcept -> double {
            return overlap(deck.flex, owned);
        }

        auto evaluate(const MetaDeck& deck, const OwnedUnits& owned, const PoolSnapshot& snapshot,
                      const MatchQuery& query) const -> DeckMatch {
            const UnitRegistry& registry = snapshot.registry();
            for (const UnitId& id : owned) registry.index_of(id);
            for (const UnitId& id : deck.flex) registry.index_of(id);

            DeckMatch result;
            result.match_ratio = match_ratio(deck, owned);
            result.flex_ratio = flex_ratio(deck, owned);

            std::vector<std::reference_wrapper<const Unit>> missing;
            std::set<UnitId, std::less<>> seen;
            for (const UnitId& id : deck.core) {
                const Unit& unit = registry.lookup(id);
                if (!seen.insert(id).second) continue;
                if (owned.contains(id)) {
                    result.owned_core.push_back(id);
                } else {
                    missing.push_back(std::cref(unit));
                    result.acquisition_cost += unit.cost;
                }
            }

            // Missing units of one tier compete for the same slots.
            std::map<CostTier, double> tier_slot_mass;
            std::vector<double> slot_probabilities;
            slot_probabilities.reserve(missing.size());
            for (const Unit& unit : missing) {
                slot_probabilities.push_back(calculator.slot_probability(snapshot, unit.id, query.level));
                tier_slot_mass[unit.cost] += slot_probabilities.back();
            }

            std::vector<details::AcquisitionCurve> curves;
            curves.reserve(missing.size());
            double completion = 1.0;
            for (std::size_t i = 0; i < missing.size(); i++) {
                const Unit& unit = missing[i];
                const double contention = std::max(0.0, 1.0 - (tier_slot_mass[unit.cost] - slot_probabilities[i]));
                UnitOdds odds = calculator.unit_odds(snapshot, unit.id, query.level, query.copies_per_unit,
                                                     query.refresh_budget, contention);
                completion *= odds.completion_probability;
                curves.emplace_back(calculator.stage_hits(snapshot, unit.id, query.level, query.copies_per_unit,
                                                          contention));
                result.missing.push_back(std::move(odds));
            }
            result.completion_probability = details::checked_probability(completion, "Deck completion");
            result.expected_refreshes = expected_completion_time(std::move(curves), query.max_refresh_horizon);
            result.traits = trait_progress(deck, owned, registry);
            return result;
        }

        // Deck ordering: match ratio, then completion probability, then cheaper, then deck id.
        static bool precedes(const MetaDeck& deck_a, const DeckMatch& a, const MetaDeck& deck_b, const DeckMatch& b) noexcept {
            if (a.match_ratio != b.match_ratio) return a.match_ratio > b.match_ratio;
            if (a.completion_probability != b.completion_probability) {
                return a.completion_probability > b.completion_probability;
            }
            if (a.acquisition_cost != b.acquisition_cost) return a.acquisition_cost < b.acquisition_cost;
            return deck_a.id < deck_b.id;
        }

    private:
        static auto overlap(const std::vector<UnitId>& wanted, const OwnedUnits& owned) noexcept -> double {
            const std::set<std::string_view> distinct(wanted.begin(), wanted.end());
            if (distinct.empty()) return 0.0;
            std::size_t have = 0;
            for (std::string_view id : distinct) {
                if (owned.contains(id)) have++;
            }
            return static_cast<double>(have) / static_cast<double>(distinct.size());
        }

        // Expected refreshes until the last missing unit is complete, all units pursued in parallel:
        // sum over t of P(max T_u > t). Falls back to the slowest single unit past the horizon.
        static auto expected_completion_time(std::vector<details::AcquisitionCurve> curves,
                                             std::uint32_t horizon) noexcept -> double {
            if (curves.empty()) return 0.0;
            double slowest = 0.0;
            for (const auto& curve : curves) {
                if (!curve.reachable()) return std::numeric_limits<double>::infinity();
                slowest = std::max(slowest, curve.expected_refreshes());
            }
            double expected = 0.0;
            for (std::uint32_t t = 0; t < horizon; t++) {
                double all_done = 1.0;
                for (const auto& curve : curves) all_done *= curve.cdf();
                const double tail = 1.0 - all_done;
                if (tail <= constants::PROBABILITY_TOLERANCE) return expected;
                expected += tail;
                for (auto& curve : curves) curve.advance();
            }
            return std::max(expected, slowest);
        }

        static auto trait_progress(const MetaDeck& deck, const OwnedUnits& owned,
                                   const UnitRegistry& registry) -> std::vector<TraitProgress> {
            const std::map<std::string, std::uint8_t> active = registry.active_traits(owned);
            std::vector<TraitProgress> result;
            result.reserve(deck.trait_targets.size());
            for (const TraitTarget& target : deck.trait_targets) {
                auto iter = active.find(target.trait);
                result.push_back({ target.trait, iter == active.end() ? std::uint8_t{0} : iter->second, target.level });
            }
            return result;
        }

        const PoolProbabilityCalculator& calculator;
    };
}
#endif

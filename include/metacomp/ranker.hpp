#ifndef METACOMP_RANKER_HPP
#define METACOMP_RANKER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <numeric>
#include <optional>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "metacomp/config.hpp"
#include "metacomp/errors.hpp"
#include "metacomp/matcher.hpp"
#include "metacomp/odds.hpp"
#include "metacomp/pool.hpp"
#include "metacomp/probability.hpp"
#include "metacomp/types.hpp"

namespace metacomp {
    struct RankOptions {
        Level level{constants::DEFAULT_LEVEL};
        std::uint32_t refresh_budget{constants::DEFAULT_REFRESH_BUDGET};
        std::uint8_t copies_per_unit{constants::DEFAULT_COPIES_PER_UNIT};
        std::uint32_t max_refresh_horizon{constants::DEFAULT_MAX_REFRESH_HORIZON};
        RankWeights weights;
        std::optional<std::size_t> limit;

        static auto from_config(const EngineConfig& config) noexcept -> RankOptions {
            return { config.default_level, config.refresh_budget, config.copies_per_unit,
                     config.max_refresh_horizon, config.weights, std::nullopt };
        }

        void validate(const ShopOddsTable& odds) const {
            if (!odds.supports(level)) {
                throw Error(ErrorCode::InvalidLevel, fmt::format("Level {} has no shop odds.", level));
            }
            if (copies_per_unit == 0) throw Error(ErrorCode::InvalidConfig, "copies_per_unit must be positive.");
            if (max_refresh_horizon == 0) throw Error(ErrorCode::InvalidConfig, "max_refresh_horizon must be positive.");
            weights.validate();
        }
    };

    class RecommendationRanker {
    public:
        explicit RecommendationRanker(const PoolProbabilityCalculator& calculator_) noexcept
            : calculator(calculator_)
        { }

        static auto composite_score(const DeckMatch& match, const RankWeights& weights) noexcept -> double {
            return weights.match * match.match_ratio + weights.flex * match.flex_ratio
                 + weights.completion * match.completion_probability
                 - weights.cost * static_cast<double>(match.acquisition_cost);
        }

        auto rank(const OwnedUnits& owned, const std::vector<MetaDeck>& decks, std::uint32_t refresh_budget,
                  const PoolSnapshot& snapshot) const -> std::vector<RecommendationResult> {
            RankOptions options;
            options.refresh_budget = refresh_budget;
            return rank(owned, decks, snapshot, options);
        }

        auto rank(const OwnedUnits& owned, const std::vector<MetaDeck>& decks, const PoolSnapshot& snapshot,
                  const RankOptions& options) const -> std::vector<RecommendationResult> {
            if (decks.empty()) throw Error(ErrorCode::EmptyCandidateSet, "No candidate decks to rank.");
            options.validate(calculator.odds());
            std::set<std::string_view> deck_ids;
            for (const MetaDeck& deck : decks) {
                if (!deck_ids.insert(deck.id).second) {
                    throw Error(ErrorCode::InvalidDeck, fmt::format("Duplicate deck id {}.", deck.id));
                }
            }

            const DeckMatcher matcher(calculator);
            const MatchQuery query{ options.level, options.refresh_budget, options.copies_per_unit,
                                    options.max_refresh_horizon };
            std::vector<std::size_t> deck_indices;
            std::vector<DeckMatch> matches;
            std::vector<double> scores;
            for (std::size_t i = 0; i < decks.size(); i++) {
                if (decks[i].core.empty()) {
#ifndef NDEBUG
                    fmt::print(stderr, "Deck {} has no core units and was skipped.\n", decks[i].id);
#endif
                    continue;
                }
                matches.push_back(matcher.evaluate(decks[i], owned, snapshot, query));
                scores.push_back(composite_score(matches.back(), options.weights));
                deck_indices.push_back(i);
            }
            if (matches.empty()) throw Error(ErrorCode::EmptyCandidateSet, "No candidate deck has any core units.");

            std::vector<std::size_t> order(matches.size());
            std::iota(order.begin(), order.end(), 0);
            std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                if (scores[a] != scores[b]) return scores[a] > scores[b];
                return DeckMatcher::precedes(decks[deck_indices[a]], matches[a], decks[deck_indices[b]], matches[b]);
            });
            if (options.limit && *options.limit < order.size()) order.resize(*options.limit);

            std::vector<RecommendationResult> results;
            results.reserve(order.size());
            for (std::size_t i : order) {
                const MetaDeck& deck = decks[deck_indices[i]];
                DeckMatch& match = matches[i];
                results.push_back(RecommendationResult{
                    deck.id,
                    deck.name,
                    deck.tier,
                    deck.win_rate,
                    deck.pick_rate,
                    match.match_ratio,
                    match.flex_ratio,
                    match.completion_probability,
                    match.expected_refreshes,
                    match.acquisition_cost,
                    scores[i],
                    std::move(match.owned_core),
                    std::move(match.missing),
                    std::move(match.traits),
                });
            }
            return results;
        }

    private:
        const PoolProbabilityCalculator& calculator;
    };
}
#endif

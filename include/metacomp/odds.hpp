#ifndef METACOMP_ODDS_HPP
#define METACOMP_ODDS_HPP

#include <cmath>
#include <cstddef>
#include <map>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "metacomp/errors.hpp"
#include "metacomp/types.hpp"
#include "metacomp/details/constants.hpp"

namespace metacomp {
    using TierDistribution = std::map<CostTier, double>;

    // Level gated probabilities of a shop slot rolling each cost tier.
    // This is game version data, supplied or taken from constants::SHOP_ODDS.
    class ShopOddsTable {
    public:
        // rows[level][i] is the probability of tier i + 1.
        explicit ShopOddsTable(const std::map<Level, std::vector<double>>& rows) {
            if (rows.empty()) throw Error(ErrorCode::InvalidOddsTable, "Shop odds table has no levels.");
            for (const auto& [level, row] : rows) {
                if (row.empty()) {
                    throw Error(ErrorCode::InvalidOddsTable, fmt::format("Level {} has no tier odds.", level));
                }
                TierDistribution distribution;
                double total = 0.0;
                for (std::size_t i = 0; i < row.size(); i++) {
                    if (!(row[i] >= 0.0)) {
                        throw Error(ErrorCode::InvalidOddsTable,
                                    fmt::format("Level {} tier {} has invalid probability {}.", level, i + 1, row[i]));
                    }
                    total += row[i];
                    distribution.emplace(static_cast<CostTier>(i + 1), row[i]);
                }
                if (std::abs(total - 1.0) > constants::ODDS_TOLERANCE) {
                    throw Error(ErrorCode::InvalidOddsTable,
                                fmt::format("Level {} tier odds sum to {} instead of 1.", level, total));
                }
                distributions.emplace(level, std::move(distribution));
            }
        }

        static auto standard() -> ShopOddsTable {
            std::map<Level, std::vector<double>> rows;
            for (const auto& [level, odds] : constants::SHOP_ODDS) {
                rows.emplace(level, std::vector<double>(std::begin(odds), std::end(odds)));
            }
            return ShopOddsTable(rows);
        }

        auto tier_distribution(Level level) const -> const TierDistribution& {
            auto iter = distributions.find(level);
            if (iter == distributions.end()) {
                throw Error(ErrorCode::InvalidLevel,
                            fmt::format("No shop odds for level {} (supported {} to {}).", level, min_level(), max_level()));
            }
            return iter->second;
        }

        auto tier_probability(Level level, CostTier tier) const -> double {
            const TierDistribution& distribution = tier_distribution(level);
            auto iter = distribution.find(tier);
            return iter == distribution.end() ? 0.0 : iter->second;
        }

        bool supports(Level level) const noexcept { return distributions.contains(level); }
        Level min_level() const noexcept { return distributions.begin()->first; }
        Level max_level() const noexcept { return distributions.rbegin()->first; }
        auto levels() const noexcept -> const std::map<Level, TierDistribution>& { return distributions; }

    private:
        std::map<Level, TierDistribution> distributions;
    };
}
#endif

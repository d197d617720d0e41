#ifndef METACOMP_SIMULATOR_HPP
#define METACOMP_SIMULATOR_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <pcg_random.hpp>

#include "metacomp/errors.hpp"
#include "metacomp/odds.hpp"
#include "metacomp/pool.hpp"
#include "metacomp/registry.hpp"
#include "metacomp/types.hpp"

namespace metacomp {
    // Monte Carlo of actual shop refreshes, used to sanity check the analytic models.
    // Slots are filled without replacement, any needed unit shown is bought immediately.
    class ShopSimulator {
    public:
        ShopSimulator(std::shared_ptr<const ShopOddsTable> odds_, std::uint8_t slots_per_refresh_, std::uint64_t seed)
            : odds_table(std::move(odds_)), slots(slots_per_refresh_), rng(seed, 1)
        {
            if (slots == 0) throw Error(ErrorCode::InvalidConfig, "A shop refresh needs at least one slot.");
        }

        auto simulate_completion(const PoolSnapshot& snapshot, Level level,
                                 const std::map<UnitId, std::uint8_t>& needs,
                                 std::uint32_t refresh_budget, std::size_t trials) -> double {
            if (trials == 0) return 0.0;
            const UnitRegistry& registry = snapshot.registry();
            const TierDistribution& distribution = odds_table->tier_distribution(level);
            std::vector<std::uint8_t> base_needs(registry.size(), 0);
            for (const auto& [id, copies] : needs) base_needs[registry.index_of(id)] = copies;

            std::size_t successes = 0;
            for (std::size_t trial = 0; trial < trials; trial++) {
                std::vector<std::uint16_t> counts = snapshot.counts();
                std::vector<std::uint8_t> wanted = base_needs;
                if (run_game(registry, distribution, counts, wanted, refresh_budget)) successes++;
            }
            return static_cast<double>(successes) / static_cast<double>(trials);
        }

    private:
        static bool satisfied(const std::vector<std::uint8_t>& wanted) noexcept {
            for (std::uint8_t w : wanted) {
                if (w > 0) return false;
            }
            return true;
        }

        bool run_game(const UnitRegistry& registry, const TierDistribution& distribution,
                      std::vector<std::uint16_t>& counts, std::vector<std::uint8_t>& wanted,
                      std::uint32_t refresh_budget) {
            std::uniform_real_distribution<double> tier_roll(0.0, 1.0);
            std::vector<std::size_t> shown;
            shown.reserve(slots);
            for (std::uint32_t refresh = 0; refresh < refresh_budget; refresh++) {
                if (satisfied(wanted)) return true;
                shown.clear();
                for (std::uint8_t slot = 0; slot < slots; slot++) {
                    const CostTier tier = roll_tier(distribution, tier_roll(rng));
                    const std::vector<std::size_t>& tier_units = registry.indices_of_cost(tier);
                    std::uint32_t tier_total = 0;
                    for (std::size_t idx : tier_units) tier_total += counts[idx];
                    if (tier_total == 0) continue;
                    std::uint32_t pick = std::uniform_int_distribution<std::uint32_t>(0, tier_total - 1)(rng);
                    for (std::size_t idx : tier_units) {
                        if (pick < counts[idx]) {
                            counts[idx]--;
                            shown.push_back(idx);
                            break;
                        }
                        pick -= counts[idx];
                    }
                }
                for (std::size_t idx : shown) {
                    if (wanted[idx] > 0) wanted[idx]--;
                    else counts[idx]++;
                }
            }
            return satisfied(wanted);
        }

        static auto roll_tier(const TierDistribution& distribution, double roll) noexcept -> CostTier {
            CostTier last = 0;
            for (const auto& [tier, probability] : distribution) {
                if (probability <= 0.0) continue;
                last = tier;
                if (roll < probability) return tier;
                roll -= probability;
            }
            return last;
        }

        std::shared_ptr<const ShopOddsTable> odds_table;
        std::uint8_t slots;
        pcg32 rng;
    };
}
#endif

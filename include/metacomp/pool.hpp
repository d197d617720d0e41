#ifndef METACOMP_POOL_HPP
#define METACOMP_POOL_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "metacomp/errors.hpp"
#include "metacomp/registry.hpp"
#include "metacomp/types.hpp"

namespace metacomp {
    constexpr auto to_string(Holder holder) noexcept -> std::string_view {
        switch (holder) {
        case Holder::Self: return "self";
        case Holder::Opponent: return "opponents";
        case Holder::Shop: return "shop";
        }
        return "unknown";
    }

    struct PoolEntry {
        UnitId unit_id;
        std::uint16_t remaining;
        std::uint16_t total;
    };

    // Frozen view of the remaining copies. Queries reason over this while the live ledger keeps changing.
    class PoolSnapshot {
    public:
        PoolSnapshot(std::shared_ptr<const UnitRegistry> registry_, std::vector<std::uint16_t> remaining_)
            : unit_registry(std::move(registry_)), remaining_counts(std::move(remaining_)),
              tier_totals(unit_registry->max_cost() + 1, 0)
        {
            for (std::size_t i = 0; i < remaining_counts.size(); i++) {
                tier_totals[unit_registry->units()[i].cost] += remaining_counts[i];
            }
        }

        auto remaining(std::string_view id) const -> std::uint16_t {
            return remaining_counts[unit_registry->index_of(id)];
        }

        auto remaining_at(std::size_t index) const noexcept -> std::uint16_t { return remaining_counts[index]; }

        auto total_remaining_at_tier(CostTier tier) const noexcept -> std::uint32_t {
            return tier < tier_totals.size() ? tier_totals[tier] : 0;
        }

        auto registry() const noexcept -> const UnitRegistry& { return *unit_registry; }
        auto registry_ptr() const noexcept -> const std::shared_ptr<const UnitRegistry>& { return unit_registry; }
        auto counts() const noexcept -> const std::vector<std::uint16_t>& { return remaining_counts; }

        // Remaining and total copies for every unit, grouped by cost.
        auto pool_status() const -> std::map<CostTier, std::vector<PoolEntry>> {
            std::map<CostTier, std::vector<PoolEntry>> result;
            const std::vector<Unit>& units = unit_registry->units();
            for (std::size_t i = 0; i < units.size(); i++) {
                result[units[i].cost].push_back({ units[i].id, remaining_counts[i], units[i].total_copies });
            }
            return result;
        }

    private:
        std::shared_ptr<const UnitRegistry> unit_registry;
        std::vector<std::uint16_t> remaining_counts;
        std::vector<std::uint32_t> tier_totals;
    };

    // Live ledger of the shared pool for one session. Not synchronized: see Session for the
    // single writer wrapper. Every operation either succeeds or leaves the ledger untouched.
    class PoolState {
    public:
        explicit PoolState(std::shared_ptr<const UnitRegistry> registry_)
            : unit_registry(std::move(registry_)), held(unit_registry->size(), std::array<std::uint16_t, NUM_HOLDERS>{0})
        {
            remaining_counts.reserve(unit_registry->size());
            for (const Unit& unit : unit_registry->units()) remaining_counts.push_back(unit.total_copies);
        }

        void observe_owned(std::string_view id, std::uint16_t count, Holder holder = Holder::Self) {
            const std::size_t idx = unit_registry->index_of(id);
            if (count > remaining_counts[idx]) {
                throw Error(ErrorCode::PoolUnderflow,
                            fmt::format("Cannot take {} copies of {} for {}: only {} remain.",
                                        count, id, to_string(holder), remaining_counts[idx]));
            }
            remaining_counts[idx] -= count;
            held[idx][static_cast<std::size_t>(holder)] += count;
        }

        void release(std::string_view id, std::uint16_t count, Holder holder = Holder::Self) {
            const std::size_t idx = unit_registry->index_of(id);
            const std::uint16_t total = unit_registry->units()[idx].total_copies;
            std::uint16_t& holding = held[idx][static_cast<std::size_t>(holder)];
            if (static_cast<std::uint32_t>(remaining_counts[idx]) + count > total) {
                throw Error(ErrorCode::PoolOverflow,
                            fmt::format("Cannot return {} copies of {}: {} of {} already remain.",
                                        count, id, remaining_counts[idx], total));
            }
            if (count > holding) {
                throw Error(ErrorCode::PoolOverflow,
                            fmt::format("Cannot return {} copies of {} from {}: only {} are held.",
                                        count, id, to_string(holder), holding));
            }
            remaining_counts[idx] += count;
            holding -= count;
        }

        // Returns every copy the holder has to the pool, e.g. when the shop is rerolled.
        void release_all(Holder holder) noexcept {
            const std::size_t h = static_cast<std::size_t>(holder);
            for (std::size_t i = 0; i < held.size(); i++) {
                remaining_counts[i] += held[i][h];
                held[i][h] = 0;
            }
        }

        auto remaining(std::string_view id) const -> std::uint16_t {
            return remaining_counts[unit_registry->index_of(id)];
        }

        auto held_by(std::string_view id, Holder holder) const -> std::uint16_t {
            return held[unit_registry->index_of(id)][static_cast<std::size_t>(holder)];
        }

        auto owned_units() const -> std::set<UnitId, std::less<>> {
            std::set<UnitId, std::less<>> result;
            const std::size_t self = static_cast<std::size_t>(Holder::Self);
            for (std::size_t i = 0; i < held.size(); i++) {
                if (held[i][self] > 0) result.insert(unit_registry->units()[i].id);
            }
            return result;
        }

        auto snapshot() const -> PoolSnapshot { return PoolSnapshot(unit_registry, remaining_counts); }

        auto registry() const noexcept -> const UnitRegistry& { return *unit_registry; }

    private:
        std::shared_ptr<const UnitRegistry> unit_registry;
        std::vector<std::uint16_t> remaining_counts;
        std::vector<std::array<std::uint16_t, NUM_HOLDERS>> held;
    };
}
#endif

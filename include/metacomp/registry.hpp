#ifndef METACOMP_REGISTRY_HPP
#define METACOMP_REGISTRY_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "metacomp/errors.hpp"
#include "metacomp/types.hpp"

namespace metacomp {
    // Static unit catalog and trait table. Built once, validated, then shared read-only.
    class UnitRegistry {
    public:
        explicit UnitRegistry(std::vector<Unit> units_, std::vector<Trait> traits_ = {})
            : all_units(std::move(units_)), all_traits(std::move(traits_))
        {
            if (all_units.empty()) throw Error(ErrorCode::InvalidRegistry, "Unit registry is empty.");
            for (const Trait& trait : all_traits) {
                if (trait.id.empty()) throw Error(ErrorCode::InvalidRegistry, "Trait with an empty identifier.");
                for (std::size_t i = 0; i < trait.thresholds.size(); i++) {
                    if (trait.thresholds[i] == 0 || (i > 0 && trait.thresholds[i] <= trait.thresholds[i - 1])) {
                        throw Error(ErrorCode::InvalidRegistry,
                                    fmt::format("Trait {} thresholds must be positive and strictly increasing.", trait.id));
                    }
                }
                if (!trait_indices.try_emplace(trait.id, trait_indices.size()).second) {
                    throw Error(ErrorCode::InvalidRegistry, fmt::format("Duplicate trait {}.", trait.id));
                }
            }
            for (std::size_t i = 0; i < all_units.size(); i++) {
                const Unit& unit = all_units[i];
                if (unit.id.empty()) throw Error(ErrorCode::InvalidRegistry, "Unit with an empty identifier.");
                if (unit.cost == 0) {
                    throw Error(ErrorCode::InvalidRegistry, fmt::format("Unit {} must have a positive cost.", unit.id));
                }
                if (unit.total_copies == 0) {
                    throw Error(ErrorCode::InvalidRegistry,
                                fmt::format("Unit {} must have a positive number of copies in the pool.", unit.id));
                }
                if (unit.traits.empty()) {
                    throw Error(ErrorCode::InvalidRegistry, fmt::format("Unit {} must have at least one trait.", unit.id));
                }
                if (!all_traits.empty()) {
                    for (const std::string& trait : unit.traits) {
                        if (!trait_indices.contains(trait)) {
                            throw Error(ErrorCode::InvalidRegistry,
                                        fmt::format("Unit {} references undeclared trait {}.", unit.id, trait));
                        }
                    }
                }
                if (!unit_indices.try_emplace(unit.id, i).second) {
                    throw Error(ErrorCode::InvalidRegistry, fmt::format("Duplicate unit {}.", unit.id));
                }
                max_tier = std::max(max_tier, unit.cost);
            }
            indices_by_cost.resize(max_tier + 1);
            for (std::size_t i = 0; i < all_units.size(); i++) indices_by_cost[all_units[i].cost].push_back(i);
        }

        auto lookup(std::string_view id) const -> const Unit& {
            return all_units[index_of(id)];
        }

        auto find(std::string_view id) const noexcept -> const Unit* {
            auto iter = unit_indices.find(id);
            if (iter == unit_indices.end()) return nullptr;
            return &all_units[iter->second];
        }

        bool contains(std::string_view id) const noexcept { return unit_indices.find(id) != unit_indices.end(); }

        auto index_of(std::string_view id) const -> std::size_t {
            auto iter = unit_indices.find(id);
            if (iter == unit_indices.end()) throw Error(ErrorCode::UnknownUnit, fmt::format("Unknown unit {}.", id));
            return iter->second;
        }

        auto units_of_cost(CostTier tier) const -> std::vector<std::reference_wrapper<const Unit>> {
            std::vector<std::reference_wrapper<const Unit>> result;
            for (std::size_t idx : indices_of_cost(tier)) result.push_back(std::cref(all_units[idx]));
            return result;
        }

        auto indices_of_cost(CostTier tier) const noexcept -> const std::vector<std::size_t>& {
            static const std::vector<std::size_t> empty;
            if (tier >= indices_by_cost.size()) return empty;
            return indices_by_cost[tier];
        }

        auto units() const noexcept -> const std::vector<Unit>& { return all_units; }
        auto traits() const noexcept -> const std::vector<Trait>& { return all_traits; }
        std::size_t size() const noexcept { return all_units.size(); }
        CostTier max_cost() const noexcept { return max_tier; }

        auto find_trait(std::string_view id) const noexcept -> const Trait* {
            auto iter = trait_indices.find(id);
            if (iter == trait_indices.end()) return nullptr;
            return &all_traits[iter->second];
        }

        // Bonus level reached by the given number of distinct units. Undeclared traits never activate.
        auto trait_level(std::string_view trait, std::size_t distinct_count) const noexcept -> std::uint8_t {
            const Trait* found = find_trait(trait);
            if (found == nullptr) return 0;
            std::uint8_t level = 0;
            for (std::uint8_t threshold : found->thresholds) {
                if (threshold <= distinct_count) level++;
            }
            return level;
        }

        auto active_traits(const std::set<UnitId, std::less<>>& unit_ids) const -> std::map<std::string, std::uint8_t> {
            std::map<std::string, std::size_t> counts;
            for (const UnitId& id : unit_ids) {
                for (const std::string& trait : lookup(id).traits) counts[trait]++;
            }
            std::map<std::string, std::uint8_t> result;
            for (const auto& [trait, count] : counts) {
                const std::uint8_t level = trait_level(trait, count);
                if (level > 0) result.emplace(trait, level);
            }
            return result;
        }

    private:
        std::vector<Unit> all_units;
        std::vector<Trait> all_traits;
        std::map<std::string, std::size_t, std::less<>> unit_indices;
        std::map<std::string, std::size_t, std::less<>> trait_indices;
        std::vector<std::vector<std::size_t>> indices_by_cost;
        CostTier max_tier{0};
    };
}
#endif

#ifndef METACOMP_TESTS_FIXTURES_HPP
#define METACOMP_TESTS_FIXTURES_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "metacomp/errors.hpp"
#include "metacomp/odds.hpp"
#include "metacomp/registry.hpp"
#include "metacomp/types.hpp"

namespace metacomp::fixtures {
    inline auto make_unit(std::string id, CostTier cost, std::uint16_t copies, std::vector<std::string> traits) -> Unit {
        Unit unit;
        unit.name = id;
        unit.id = std::move(id);
        unit.cost = cost;
        unit.total_copies = copies;
        unit.traits = std::move(traits);
        return unit;
    }

    // A and B share tier 1 with 10 copies each, C and E share tier 2, D is alone at tier 3.
    inline auto small_registry() -> std::shared_ptr<const UnitRegistry> {
        return std::make_shared<const UnitRegistry>(
            std::vector<Unit>{
                make_unit("A", 1, 10, { "Sorcerer", "Knight" }),
                make_unit("B", 1, 10, { "Sorcerer" }),
                make_unit("C", 2, 8, { "Knight" }),
                make_unit("D", 3, 6, { "Sorcerer" }),
                make_unit("E", 2, 8, { "Ranger" }),
            },
            std::vector<Trait>{
                { "Sorcerer", { 2, 4 } },
                { "Knight", { 2 } },
                { "Ranger", { 1 } },
            });
    }

    inline auto small_odds() -> std::shared_ptr<const ShopOddsTable> {
        return std::make_shared<const ShopOddsTable>(std::map<Level, std::vector<double>>{
            { 1, { 1.0 } },
            { 5, { 0.5, 0.3, 0.2 } },
            { 7, { 0.2, 0.4, 0.4 } },
        });
    }

    inline auto make_deck(std::string id, std::vector<UnitId> core, std::vector<UnitId> flex = {}) -> MetaDeck {
        MetaDeck deck;
        deck.name = id;
        deck.id = std::move(id);
        deck.core = std::move(core);
        deck.flex = std::move(flex);
        return deck;
    }

    template<typename Callable>
    auto error_code_of(Callable&& callable) -> std::optional<ErrorCode> {
        try {
            callable();
        } catch (const Error& error) {
            return error.code();
        }
        ADD_FAILURE() << "Expected a metacomp::Error.";
        return std::nullopt;
    }
}
#endif

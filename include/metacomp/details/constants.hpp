#ifndef METACOMP_DETAILS_CONSTANTS_HPP
#define METACOMP_DETAILS_CONSTANTS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

#include <frozen/map.h>

namespace metacomp::constants {
    constexpr std::size_t NUM_COST_TIERS = 5;

    // Shop tier odds per player level for the current game version, tiers 1 through 5.
    constexpr auto SHOP_ODDS = frozen::make_map<std::uint8_t, std::array<double, NUM_COST_TIERS>>({
        {2,  {1.00, 0.00, 0.00, 0.00, 0.00}},
        {3,  {0.75, 0.25, 0.00, 0.00, 0.00}},
        {4,  {0.55, 0.30, 0.15, 0.00, 0.00}},
        {5,  {0.45, 0.33, 0.20, 0.02, 0.00}},
        {6,  {0.30, 0.40, 0.25, 0.05, 0.00}},
        {7,  {0.19, 0.30, 0.35, 0.15, 0.01}},
        {8,  {0.18, 0.25, 0.32, 0.22, 0.03}},
        {9,  {0.15, 0.20, 0.25, 0.30, 0.10}},
        {10, {0.05, 0.10, 0.20, 0.40, 0.25}},
    });

    // Copies of each unit printed into the shared pool, by cost.
    constexpr auto COPIES_PER_COST = frozen::make_map<std::uint8_t, std::uint16_t>({
        {1, 29},
        {2, 22},
        {3, 18},
        {4, 12},
        {5, 10},
    });

    constexpr double ODDS_TOLERANCE = 1e-6;
    constexpr double PROBABILITY_TOLERANCE = 1e-9;

    constexpr std::uint8_t DEFAULT_SLOTS_PER_REFRESH = 5;
    constexpr std::uint8_t DEFAULT_LEVEL = 7;
    constexpr std::uint32_t DEFAULT_REFRESH_BUDGET = 10;
    constexpr std::uint8_t DEFAULT_COPIES_PER_UNIT = 1;
    // Upper bound on refreshes considered when integrating the expected completion time of a deck.
    constexpr std::uint32_t DEFAULT_MAX_REFRESH_HORIZON = 1 << 16;

    constexpr double DEFAULT_MATCH_WEIGHT = 0.6;
    constexpr double DEFAULT_FLEX_WEIGHT = 0.1;
    constexpr double DEFAULT_COMPLETION_WEIGHT = 0.4;
    constexpr double DEFAULT_COST_WEIGHT = 0.01;
}
#endif

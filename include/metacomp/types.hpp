#ifndef METACOMP_TYPES_HPP
#define METACOMP_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace metacomp {
    using UnitId = std::string;
    using CostTier = std::uint8_t;
    using Level = std::uint8_t;

    struct Unit {
        UnitId id;
        std::string name;
        std::string localized_name;
        CostTier cost{0};
        std::uint16_t total_copies{0};
        std::vector<std::string> traits;
    };

    struct Trait {
        std::string id;
        // Distinct units needed for each bonus level, strictly increasing.
        std::vector<std::uint8_t> thresholds;
    };

    struct TraitTarget {
        std::string trait;
        std::uint8_t level{0};
    };

    struct MetaDeck {
        std::string id;
        std::string name;
        std::vector<UnitId> core;
        std::vector<UnitId> flex;
        std::vector<TraitTarget> trait_targets;
        std::string tier;
        float win_rate{0.f};
        float pick_rate{0.f};
        std::vector<std::string> core_items;
    };

    struct UnitOdds {
        UnitId unit_id;
        CostTier cost{0};
        std::uint16_t remaining{0};
        std::uint32_t remaining_at_tier{0};
        std::uint8_t copies_needed{0};
        double slot_probability{0.0};
        double refresh_probability{0.0};
        double expected_refreshes{0.0};
        double completion_probability{0.0};
    };

    struct TraitProgress {
        std::string trait;
        std::uint8_t active_level{0};
        std::uint8_t target_level{0};
    };

    struct RecommendationResult {
        std::string deck_id;
        std::string deck_name;
        std::string tier;
        float win_rate{0.f};
        float pick_rate{0.f};
        double match_ratio{0.0};
        double flex_ratio{0.0};
        double completion_probability{0.0};
        double expected_refreshes{0.0};
        std::uint32_t acquisition_cost{0};
        double score{0.0};
        std::vector<UnitId> owned_core;
        std::vector<UnitOdds> missing;
        std::vector<TraitProgress> traits;
    };

    enum struct Holder : std::uint8_t {
        Self = 0,
        Opponent = 1,
        Shop = 2,
    };
    constexpr std::size_t NUM_HOLDERS = 3;
}
#endif

#ifndef METACOMP_CONFIG_HPP
#define METACOMP_CONFIG_HPP

#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <string_view>

#include <fmt/core.h>

#include "metacomp/errors.hpp"
#include "metacomp/types.hpp"
#include "metacomp/details/constants.hpp"
#include "metacomp/details/draw_model.hpp"

namespace metacomp {
    struct RankWeights {
        double match{constants::DEFAULT_MATCH_WEIGHT};
        double flex{constants::DEFAULT_FLEX_WEIGHT};
        double completion{constants::DEFAULT_COMPLETION_WEIGHT};
        double cost{constants::DEFAULT_COST_WEIGHT};

        // NaN or negative weights break the descending score order.
        void validate() const {
            for (double weight : { match, flex, completion, cost }) {
                if (!std::isfinite(weight) || weight < 0.0) {
                    throw Error(ErrorCode::InvalidConfig, fmt::format("Rank weight {} must be finite and non-negative.", weight));
                }
            }
        }
    };

    enum struct DrawModelKind : std::uint8_t {
        Independent,
        Exact,
    };

    inline auto parse_draw_model(std::string_view name) -> DrawModelKind {
        if (name == details::IndependentDrawModel::name) return DrawModelKind::Independent;
        if (name == details::HypergeometricDrawModel::name) return DrawModelKind::Exact;
        throw Error(ErrorCode::InvalidConfig, fmt::format("Unknown draw model {}.", name));
    }

    inline auto make_draw_model(DrawModelKind kind) noexcept -> details::DrawModel {
        if (kind == DrawModelKind::Exact) return details::DrawModel(details::HypergeometricDrawModel{});
        return details::DrawModel(details::IndependentDrawModel{});
    }

    struct EngineConfig {
        std::uint8_t slots_per_refresh{constants::DEFAULT_SLOTS_PER_REFRESH};
        Level default_level{constants::DEFAULT_LEVEL};
        std::uint32_t refresh_budget{constants::DEFAULT_REFRESH_BUDGET};
        std::uint8_t copies_per_unit{constants::DEFAULT_COPIES_PER_UNIT};
        std::uint32_t max_refresh_horizon{constants::DEFAULT_MAX_REFRESH_HORIZON};
        DrawModelKind draw_model{DrawModelKind::Independent};
        RankWeights weights;

        void validate() const {
            if (slots_per_refresh == 0) throw Error(ErrorCode::InvalidConfig, "slots_per_refresh must be positive.");
            if (copies_per_unit == 0) throw Error(ErrorCode::InvalidConfig, "copies_per_unit must be positive.");
            if (max_refresh_horizon == 0) throw Error(ErrorCode::InvalidConfig, "max_refresh_horizon must be positive.");
            weights.validate();
        }
    };
}
#endif

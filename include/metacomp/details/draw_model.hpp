#ifndef METACOMP_DETAILS_DRAW_MODEL_HPP
#define METACOMP_DETAILS_DRAW_MODEL_HPP

#include <cmath>
#include <cstdint>
#include <string_view>

#include <mpark/variant.hpp>

namespace metacomp::details {
    // Everything a draw model needs to know about one unit at one point of the acquisition.
    struct TierDraw {
        double tier_probability;
        std::uint32_t unit_remaining;
        std::uint32_t tier_remaining;
        std::uint8_t slots;

        constexpr auto slot_probability() const noexcept -> double {
            if (tier_remaining == 0 || unit_remaining == 0) return 0.0;
            return tier_probability * static_cast<double>(unit_remaining) / static_cast<double>(tier_remaining);
        }
    };

    // Slots are treated as independent draws with replacement. Cheap, and the default.
    struct IndependentDrawModel {
        static constexpr std::string_view name = "independent";

        inline auto refresh_probability(const TierDraw& draw) const noexcept -> double {
            const double p_slot = draw.slot_probability();
            if (p_slot <= 0.0) return 0.0;
            return 1.0 - std::pow(1.0 - p_slot, draw.slots);
        }

        constexpr bool operator==(const IndependentDrawModel&) const noexcept = default;
    };

    // Exact within a refresh: the number of slots landing on the tier is binomial and those slots are
    // filled without replacement from the copies left at the tier.
    struct HypergeometricDrawModel {
        static constexpr std::string_view name = "exact";

        inline auto refresh_probability(const TierDraw& draw) const noexcept -> double {
            if (draw.tier_remaining == 0 || draw.unit_remaining == 0 || draw.tier_probability <= 0.0) return 0.0;
            const double q = draw.tier_probability;
            double miss = 0.0;
            double binomial = 1.0; // C(slots, k)
            double miss_given_k = 1.0;
            for (std::uint32_t k = 0; k <= draw.slots; k++) {
                if (k > 0) {
                    binomial = binomial * (draw.slots - k + 1) / k;
                    // Once the tier runs dry the remaining tier slots come up empty.
                    if (draw.tier_remaining >= k) {
                        const std::uint32_t left = draw.tier_remaining - (k - 1);
                        miss_given_k *= 1.0 - static_cast<double>(draw.unit_remaining) / static_cast<double>(left);
                        if (miss_given_k < 0.0) miss_given_k = 0.0;
                    }
                }
                miss += binomial * std::pow(q, k) * std::pow(1.0 - q, draw.slots - k) * miss_given_k;
            }
            return 1.0 - miss;
        }

        constexpr bool operator==(const HypergeometricDrawModel&) const noexcept = default;
    };

    using DrawModelVariant = mpark::variant<IndependentDrawModel, HypergeometricDrawModel>;

    struct DrawModel : public DrawModelVariant {
        inline auto refresh_probability(const TierDraw& draw) const -> double {
            return mpark::visit([&draw](const auto& model) { return model.refresh_probability(draw); }, *this);
        }

        inline auto name() const -> std::string_view {
            return mpark::visit([](const auto& model) { return model.name; }, *this);
        }

        constexpr DrawModel() noexcept
                : DrawModelVariant(IndependentDrawModel{})
        { }

        using DrawModelVariant::DrawModelVariant;
        using DrawModelVariant::operator=;
    };
}
#endif

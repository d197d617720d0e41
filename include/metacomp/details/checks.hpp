#ifndef METACOMP_DETAILS_CHECKS_HPP
#define METACOMP_DETAILS_CHECKS_HPP

#include <cmath>
#include <string_view>

#include <fmt/core.h>

#include "metacomp/errors.hpp"
#include "metacomp/details/constants.hpp"

namespace metacomp::details {
    // Final sanity check on a computed probability. Rounding noise within the tolerance is
    // snapped to the boundary, anything further out is a defect in the math and throws.
    inline auto checked_probability(double value, std::string_view what) -> double {
        if (std::isnan(value) || value < -constants::PROBABILITY_TOLERANCE
            || value > 1.0 + constants::PROBABILITY_TOLERANCE) {
            throw ProbabilityInvariantError(fmt::format("{} probability {} is outside [0, 1].", what, value));
        }
        if (value < 0.0) return 0.0;
        if (value > 1.0) return 1.0;
        return value;
    }
}
#endif

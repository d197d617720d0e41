#ifndef METACOMP_DETAILS_ACQUISITION_HPP
#define METACOMP_DETAILS_ACQUISITION_HPP

#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace metacomp::details {
    // Markov chain over how many copies of a unit have been bought so far. Stage j advances with
    // probability stage_hits[j] on each refresh, so the later (scarcer) copies use their own rate.
    class AcquisitionCurve {
    public:
        explicit AcquisitionCurve(std::vector<double> stage_hits_)
            : stage_hits(std::move(stage_hits_)), state(stage_hits.size() + 1, 0.0)
        {
            state[0] = 1.0;
        }

        void advance() noexcept {
            for (std::size_t j = stage_hits.size(); j-- > 0;) {
                const double moved = state[j] * stage_hits[j];
                state[j] -= moved;
                state[j + 1] += moved;
            }
        }

        void advance(std::size_t count) noexcept {
            for (std::size_t i = 0; i < count && !complete(); i++) advance();
        }

        // Probability every copy has been bought after the refreshes simulated so far.
        double cdf() const noexcept { return state.back(); }

        bool complete() const noexcept { return state.back() >= 1.0; }

        bool reachable() const noexcept {
            for (double hit : stage_hits) {
                if (hit <= 0.0) return false;
            }
            return true;
        }

        // Sum of the geometric waits of each stage.
        double expected_refreshes() const noexcept {
            double total = 0.0;
            for (double hit : stage_hits) {
                if (hit <= 0.0) return std::numeric_limits<double>::infinity();
                total += 1.0 / hit;
            }
            return total;
        }

        std::size_t stages() const noexcept { return stage_hits.size(); }

    private:
        std::vector<double> stage_hits;
        std::vector<double> state;
    };
}
#endif

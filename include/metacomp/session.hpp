#ifndef METACOMP_SESSION_HPP
#define METACOMP_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <moodycamel/concurrentqueue.h>

#include "metacomp/errors.hpp"
#include "metacomp/pool.hpp"
#include "metacomp/registry.hpp"
#include "metacomp/types.hpp"

namespace metacomp {
    enum struct ObservationKind : std::uint8_t {
        Bought,
        Sold,
        Sighted,
        Unsighted,
        ShopShown,
        ShopCleared,
    };

    constexpr auto to_string(ObservationKind kind) noexcept -> std::string_view {
        switch (kind) {
        case ObservationKind::Bought: return "bought";
        case ObservationKind::Sold: return "sold";
        case ObservationKind::Sighted: return "sighted";
        case ObservationKind::Unsighted: return "unsighted";
        case ObservationKind::ShopShown: return "shop_shown";
        case ObservationKind::ShopCleared: return "shop_cleared";
        }
        return "unknown";
    }

    // A resolved event from the recognition layer.
    struct Observation {
        ObservationKind kind{ObservationKind::Bought};
        UnitId unit_id;
        std::uint16_t count{1};
    };

    struct RejectedObservation {
        Observation observation;
        ErrorCode code;
        std::string message;
    };

    struct SessionView {
        PoolSnapshot snapshot;
        std::set<UnitId, std::less<>> owned;
    };

    // One player's game. Owns the pool ledger and serializes every write to it: either directly
    // under the mutex, or by posting to the queue from any thread and letting the owner drain it.
    class Session {
    public:
        explicit Session(std::shared_ptr<const UnitRegistry> registry_) : pool(std::move(registry_)) { }

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        void apply(const Observation& observation) {
            std::lock_guard lock(pool_mutex);
            apply_locked(observation);
        }

        void observe_owned(std::string_view id, std::uint16_t count, Holder holder = Holder::Self) {
            std::lock_guard lock(pool_mutex);
            pool.observe_owned(id, count, holder);
        }

        void release(std::string_view id, std::uint16_t count, Holder holder = Holder::Self) {
            std::lock_guard lock(pool_mutex);
            pool.release(id, count, holder);
        }

        void release_all(Holder holder) {
            std::lock_guard lock(pool_mutex);
            pool.release_all(holder);
        }

        // Safe from any thread. Order is kept per producing thread only.
        bool post(Observation observation) { return pending.enqueue(std::move(observation)); }

        // Applies everything posted so far. Observations the ledger refuses are handed back to the
        // caller untouched, the rest of the batch still applies.
        auto drain() -> std::vector<RejectedObservation> {
            std::vector<RejectedObservation> rejected;
            Observation observation;
            std::lock_guard lock(pool_mutex);
            while (pending.try_dequeue(observation)) {
                try {
                    apply_locked(observation);
                } catch (const Error& error) {
                    rejected.push_back({ observation, error.code(), error.what() });
                }
            }
            return rejected;
        }

        auto pending_approx() const noexcept -> std::size_t { return pending.size_approx(); }

        auto snapshot() const -> PoolSnapshot {
            std::lock_guard lock(pool_mutex);
            return pool.snapshot();
        }

        // Snapshot and owned set taken under one lock so they agree with each other.
        auto view() const -> SessionView {
            std::lock_guard lock(pool_mutex);
            return { pool.snapshot(), pool.owned_units() };
        }

        auto owned_units() const -> std::set<UnitId, std::less<>> {
            std::lock_guard lock(pool_mutex);
            return pool.owned_units();
        }

        auto remaining(std::string_view id) const -> std::uint16_t {
            std::lock_guard lock(pool_mutex);
            return pool.remaining(id);
        }

        auto held_by(std::string_view id, Holder holder) const -> std::uint16_t {
            std::lock_guard lock(pool_mutex);
            return pool.held_by(id, holder);
        }

    private:
        void apply_locked(const Observation& observation) {
            switch (observation.kind) {
            case ObservationKind::Bought:
                pool.observe_owned(observation.unit_id, observation.count, Holder::Self);
                break;
            case ObservationKind::Sold:
                pool.release(observation.unit_id, observation.count, Holder::Self);
                break;
            case ObservationKind::Sighted:
                pool.observe_owned(observation.unit_id, observation.count, Holder::Opponent);
                break;
            case ObservationKind::Unsighted:
                pool.release(observation.unit_id, observation.count, Holder::Opponent);
                break;
            case ObservationKind::ShopShown:
                pool.observe_owned(observation.unit_id, observation.count, Holder::Shop);
                break;
            case ObservationKind::ShopCleared:
                pool.release(observation.unit_id, observation.count, Holder::Shop);
                break;
            }
        }

        PoolState pool;
        mutable std::mutex pool_mutex;
        moodycamel::ConcurrentQueue<Observation> pending;
    };
}
#endif

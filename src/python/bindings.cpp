#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "metacomp/loader.hpp"
#include "metacomp/metacomp.hpp"
#include "metacomp/simulator.hpp"

namespace py = pybind11;

namespace {
    // pybind11 holders cannot be const, the catalogs are still never mutated after construction.
    template<typename T>
    auto mutable_holder(std::shared_ptr<const T> ptr) -> std::shared_ptr<T> {
        return std::const_pointer_cast<T>(std::move(ptr));
    }
}

PYBIND11_MODULE(metacomp, m) {
    using namespace pybind11::literals;
    using namespace metacomp;

    py::enum_<ErrorCode>(m, "ErrorCode")
        .value("UnknownUnit", ErrorCode::UnknownUnit)
        .value("InvalidRegistry", ErrorCode::InvalidRegistry)
        .value("InvalidOddsTable", ErrorCode::InvalidOddsTable)
        .value("InvalidDeck", ErrorCode::InvalidDeck)
        .value("InvalidLevel", ErrorCode::InvalidLevel)
        .value("PoolUnderflow", ErrorCode::PoolUnderflow)
        .value("PoolOverflow", ErrorCode::PoolOverflow)
        .value("EmptyCandidateSet", ErrorCode::EmptyCandidateSet)
        .value("InvalidData", ErrorCode::InvalidData)
        .value("InvalidConfig", ErrorCode::InvalidConfig);
    py::register_exception<Error>(m, "MetacompError", PyExc_ValueError);
    py::register_exception<ProbabilityInvariantError>(m, "ProbabilityInvariantError", PyExc_ArithmeticError);

    py::enum_<Holder>(m, "Holder")
        .value("Self", Holder::Self)
        .value("Opponent", Holder::Opponent)
        .value("Shop", Holder::Shop);
    py::enum_<ObservationKind>(m, "ObservationKind")
        .value("Bought", ObservationKind::Bought)
        .value("Sold", ObservationKind::Sold)
        .value("Sighted", ObservationKind::Sighted)
        .value("Unsighted", ObservationKind::Unsighted)
        .value("ShopShown", ObservationKind::ShopShown)
        .value("ShopCleared", ObservationKind::ShopCleared);
    py::enum_<DrawModelKind>(m, "DrawModelKind")
        .value("Independent", DrawModelKind::Independent)
        .value("Exact", DrawModelKind::Exact);

    py::class_<Unit>(m, "Unit")
        .def(py::init<>())
        .def_readwrite("id", &Unit::id)
        .def_readwrite("name", &Unit::name)
        .def_readwrite("localized_name", &Unit::localized_name)
        .def_readwrite("cost", &Unit::cost)
        .def_readwrite("total_copies", &Unit::total_copies)
        .def_readwrite("traits", &Unit::traits);
    py::class_<Trait>(m, "Trait")
        .def(py::init<>())
        .def_readwrite("id", &Trait::id)
        .def_readwrite("thresholds", &Trait::thresholds);
    py::class_<TraitTarget>(m, "TraitTarget")
        .def(py::init<>())
        .def_readwrite("trait", &TraitTarget::trait)
        .def_readwrite("level", &TraitTarget::level);
    py::class_<MetaDeck>(m, "MetaDeck")
        .def(py::init<>())
        .def_readwrite("id", &MetaDeck::id)
        .def_readwrite("name", &MetaDeck::name)
        .def_readwrite("core", &MetaDeck::core)
        .def_readwrite("flex", &MetaDeck::flex)
        .def_readwrite("trait_targets", &MetaDeck::trait_targets)
        .def_readwrite("tier", &MetaDeck::tier)
        .def_readwrite("win_rate", &MetaDeck::win_rate)
        .def_readwrite("pick_rate", &MetaDeck::pick_rate)
        .def_readwrite("core_items", &MetaDeck::core_items);
    py::class_<UnitOdds>(m, "UnitOdds")
        .def_readonly("unit_id", &UnitOdds::unit_id)
        .def_readonly("cost", &UnitOdds::cost)
        .def_readonly("remaining", &UnitOdds::remaining)
        .def_readonly("remaining_at_tier", &UnitOdds::remaining_at_tier)
        .def_readonly("copies_needed", &UnitOdds::copies_needed)
        .def_readonly("slot_probability", &UnitOdds::slot_probability)
        .def_readonly("refresh_probability", &UnitOdds::refresh_probability)
        .def_readonly("expected_refreshes", &UnitOdds::expected_refreshes)
        .def_readonly("completion_probability", &UnitOdds::completion_probability);
    py::class_<TraitProgress>(m, "TraitProgress")
        .def_readonly("trait", &TraitProgress::trait)
        .def_readonly("active_level", &TraitProgress::active_level)
        .def_readonly("target_level", &TraitProgress::target_level);
    py::class_<RecommendationResult>(m, "RecommendationResult")
        .def_readonly("deck_id", &RecommendationResult::deck_id)
        .def_readonly("deck_name", &RecommendationResult::deck_name)
        .def_readonly("tier", &RecommendationResult::tier)
        .def_readonly("win_rate", &RecommendationResult::win_rate)
        .def_readonly("pick_rate", &RecommendationResult::pick_rate)
        .def_readonly("match_ratio", &RecommendationResult::match_ratio)
        .def_readonly("flex_ratio", &RecommendationResult::flex_ratio)
        .def_readonly("completion_probability", &RecommendationResult::completion_probability)
        .def_readonly("expected_refreshes", &RecommendationResult::expected_refreshes)
        .def_readonly("acquisition_cost", &RecommendationResult::acquisition_cost)
        .def_readonly("score", &RecommendationResult::score)
        .def_readonly("owned_core", &RecommendationResult::owned_core)
        .def_readonly("missing", &RecommendationResult::missing)
        .def_readonly("traits", &RecommendationResult::traits);

    py::class_<UnitRegistry, std::shared_ptr<UnitRegistry>>(m, "UnitRegistry")
        .def(py::init<std::vector<Unit>, std::vector<Trait>>(), "units"_a, "traits"_a = std::vector<Trait>{})
        .def("lookup", &UnitRegistry::lookup, py::return_value_policy::copy)
        .def("__contains__", &UnitRegistry::contains)
        .def("__len__", &UnitRegistry::size)
        .def("units", &UnitRegistry::units, py::return_value_policy::copy)
        .def("active_traits", &UnitRegistry::active_traits);
    py::class_<ShopOddsTable, std::shared_ptr<ShopOddsTable>>(m, "ShopOddsTable")
        .def(py::init<const std::map<Level, std::vector<double>>&>(), "rows"_a)
        .def_static("standard", []() { return std::make_shared<ShopOddsTable>(ShopOddsTable::standard()); })
        .def("tier_distribution", &ShopOddsTable::tier_distribution, py::return_value_policy::copy)
        .def("tier_probability", &ShopOddsTable::tier_probability)
        .def("supports", &ShopOddsTable::supports);

    py::class_<RankWeights>(m, "RankWeights")
        .def(py::init<>())
        .def_readwrite("match", &RankWeights::match)
        .def_readwrite("flex", &RankWeights::flex)
        .def_readwrite("completion", &RankWeights::completion)
        .def_readwrite("cost", &RankWeights::cost);
    py::class_<EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("slots_per_refresh", &EngineConfig::slots_per_refresh)
        .def_readwrite("default_level", &EngineConfig::default_level)
        .def_readwrite("refresh_budget", &EngineConfig::refresh_budget)
        .def_readwrite("copies_per_unit", &EngineConfig::copies_per_unit)
        .def_readwrite("max_refresh_horizon", &EngineConfig::max_refresh_horizon)
        .def_readwrite("draw_model", &EngineConfig::draw_model)
        .def_readwrite("weights", &EngineConfig::weights)
        .def("validate", &EngineConfig::validate);
    py::class_<RankOptions>(m, "RankOptions")
        .def(py::init<>())
        .def_readwrite("level", &RankOptions::level)
        .def_readwrite("refresh_budget", &RankOptions::refresh_budget)
        .def_readwrite("copies_per_unit", &RankOptions::copies_per_unit)
        .def_readwrite("max_refresh_horizon", &RankOptions::max_refresh_horizon)
        .def_readwrite("weights", &RankOptions::weights)
        .def_readwrite("limit", &RankOptions::limit);

    py::class_<PoolSnapshot>(m, "PoolSnapshot")
        .def("remaining", &PoolSnapshot::remaining)
        .def("total_remaining_at_tier", &PoolSnapshot::total_remaining_at_tier)
        .def("pool_status", [](const PoolSnapshot& snapshot) {
            std::map<CostTier, std::vector<std::tuple<UnitId, std::uint16_t, std::uint16_t>>> result;
            for (const auto& [tier, entries] : snapshot.pool_status()) {
                for (const PoolEntry& entry : entries) result[tier].emplace_back(entry.unit_id, entry.remaining, entry.total);
            }
            return result;
        });
    py::class_<Session>(m, "Session")
        .def("observe_owned", &Session::observe_owned, "unit_id"_a, "count"_a = 1, "holder"_a = Holder::Self)
        .def("release", &Session::release, "unit_id"_a, "count"_a = 1, "holder"_a = Holder::Self)
        .def("release_all", &Session::release_all)
        .def("post", [](Session& session, ObservationKind kind, const UnitId& id, std::uint16_t count) {
            return session.post(Observation{ kind, id, count });
        }, "kind"_a, "unit_id"_a, "count"_a = 1)
        .def("drain", [](Session& session) {
            std::vector<std::tuple<ObservationKind, UnitId, ErrorCode, std::string>> result;
            for (RejectedObservation& rejected : session.drain()) {
                result.emplace_back(rejected.observation.kind, std::move(rejected.observation.unit_id), rejected.code,
                                    std::move(rejected.message));
            }
            return result;
        })
        .def("snapshot", &Session::snapshot)
        .def("owned_units", &Session::owned_units)
        .def("remaining", &Session::remaining)
        .def("held_by", &Session::held_by);

    py::class_<Advisor>(m, "Advisor")
        .def(py::init([](std::shared_ptr<UnitRegistry> registry, std::shared_ptr<ShopOddsTable> odds, EngineConfig config) {
            return std::make_unique<Advisor>(std::move(registry), std::move(odds), config);
        }), "registry"_a, "odds"_a, "config"_a = EngineConfig{})
        .def("new_session", &Advisor::new_session)
        .def("default_options", &Advisor::default_options)
        .def("recommend", py::overload_cast<const Session&, const std::vector<MetaDeck>&, const RankOptions&>(
            &Advisor::recommend, py::const_), "session"_a, "decks"_a, "options"_a)
        .def("recommend", py::overload_cast<const Session&, const std::vector<MetaDeck>&>(
            &Advisor::recommend, py::const_), "session"_a, "decks"_a)
        .def("unit_odds", &Advisor::unit_odds);

    m.def("load_registry", [](const std::string& path) { return mutable_holder(load_registry(path)); });
    m.def("load_odds", [](const std::string& path) { return mutable_holder(load_odds(path)); });
    m.def("load_meta_decks", &load_meta_decks);
    m.def("load_config", &load_config, "path"_a, "config"_a = EngineConfig{});
    m.def("simulate_completion", [](std::shared_ptr<ShopOddsTable> odds, const Session& session, Level level,
                                    const std::map<UnitId, std::uint8_t>& needs, std::uint32_t refresh_budget,
                                    std::size_t trials, std::uint64_t seed, std::uint8_t slots) {
        ShopSimulator simulator(std::move(odds), slots, seed);
        return simulator.simulate_completion(session.snapshot(), level, needs, refresh_budget, trials);
    }, "odds"_a, "session"_a, "level"_a, "needs"_a, "refresh_budget"_a, "trials"_a, "seed"_a = 0,
       "slots"_a = constants::DEFAULT_SLOTS_PER_REFRESH);
}

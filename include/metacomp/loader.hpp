#ifndef METACOMP_LOADER_HPP
#define METACOMP_LOADER_HPP

#include <charconv>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <simdjson.h>

#include "metacomp/config.hpp"
#include "metacomp/errors.hpp"
#include "metacomp/odds.hpp"
#include "metacomp/registry.hpp"
#include "metacomp/session.hpp"
#include "metacomp/types.hpp"
#include "metacomp/details/constants.hpp"

// Readers for the JSON files the data collaborator produces. Nothing in the engine itself touches files.
namespace metacomp {
    struct SessionState {
        Level level{constants::DEFAULT_LEVEL};
        std::uint32_t refresh_budget{constants::DEFAULT_REFRESH_BUDGET};
        std::vector<UnitId> owned;
        std::vector<std::vector<UnitId>> opponents;
        std::vector<UnitId> shop;
    };

    namespace details {
        [[noreturn]] inline void invalid_data(std::string_view source, std::string_view message) {
            throw Error(ErrorCode::InvalidData, fmt::format("{}: {}", source, message));
        }

        inline auto load_file(const std::string& path) -> simdjson::padded_string {
            simdjson::padded_string json;
            if (auto error = simdjson::padded_string::load(path).get(json)) {
                invalid_data(path, fmt::format("could not be read ({}).", simdjson::error_message(error)));
            }
            return json;
        }

        // False when the field is absent, throws when it is present with the wrong type.
        inline bool find_field(simdjson::ondemand::object& object, std::string_view key,
                               simdjson::ondemand::value& dest, std::string_view source) {
            auto error = object[key].get(dest);
            if (error == simdjson::NO_SUCH_FIELD) return false;
            if (error) invalid_data(source, fmt::format("field {} is malformed ({}).", key, simdjson::error_message(error)));
            return true;
        }

        template<typename Integral>
        void read_int(simdjson::ondemand::value& value, Integral& dest, std::string_view key, std::string_view source) {
            std::uint64_t result{0};
            if (value.get(result) || result > std::numeric_limits<Integral>::max()) {
                invalid_data(source, fmt::format("field {} must be an integer between 0 and {}.", key,
                                                 std::numeric_limits<Integral>::max()));
            }
            dest = static_cast<Integral>(result);
        }

        template<typename Integral>
        bool read_optional_int(simdjson::ondemand::object& object, std::string_view key, Integral& dest,
                               std::string_view source) {
            simdjson::ondemand::value value;
            if (!find_field(object, key, value, source)) return false;
            read_int(value, dest, key, source);
            return true;
        }

        template<typename Floating>
        bool read_optional_float(simdjson::ondemand::object& object, std::string_view key, Floating& dest,
                                 std::string_view source) {
            simdjson::ondemand::value value;
            if (!find_field(object, key, value, source)) return false;
            double result{0.0};
            if (value.get(result)) invalid_data(source, fmt::format("field {} must be a number.", key));
            dest = static_cast<Floating>(result);
            return true;
        }

        inline bool read_optional_string(simdjson::ondemand::object& object, std::string_view key, std::string& dest,
                                         std::string_view source) {
            simdjson::ondemand::value value;
            if (!find_field(object, key, value, source)) return false;
            std::string_view result;
            if (value.get(result)) invalid_data(source, fmt::format("field {} must be a string.", key));
            dest.assign(result);
            return true;
        }

        inline auto read_string_array(simdjson::ondemand::array& array, std::string_view key,
                                      std::string_view source) -> std::vector<std::string> {
            std::vector<std::string> result;
            for (auto element : array) {
                std::string_view entry;
                if (element.get_string().get(entry)) {
                    invalid_data(source, fmt::format("field {} must only contain strings.", key));
                }
                result.emplace_back(entry);
            }
            return result;
        }

        inline bool read_optional_string_array(simdjson::ondemand::object& object, std::string_view key,
                                               std::vector<std::string>& dest, std::string_view source) {
            simdjson::ondemand::value value;
            if (!find_field(object, key, value, source)) return false;
            simdjson::ondemand::array array;
            if (value.get_array().get(array)) invalid_data(source, fmt::format("field {} must be an array.", key));
            dest = read_string_array(array, key, source);
            return true;
        }

        // Documents may either be the bare array or an object holding it under `key`.
        inline auto top_level_array(simdjson::ondemand::document& document, std::string_view key,
                                    std::string_view source) -> simdjson::ondemand::array {
            simdjson::ondemand::json_type type;
            if (document.type().get(type)) invalid_data(source, "is not valid JSON.");
            simdjson::ondemand::array array;
            if (type == simdjson::ondemand::json_type::array) {
                if (document.get_array().get(array)) invalid_data(source, "is not a valid array.");
                return array;
            }
            simdjson::ondemand::object object;
            if (document.get_object().get(object)) invalid_data(source, "must be an array or an object.");
            simdjson::ondemand::value value;
            if (!find_field(object, key, value, source)) invalid_data(source, fmt::format("has no {} field.", key));
            if (value.get_array().get(array)) invalid_data(source, fmt::format("field {} must be an array.", key));
            return array;
        }

        inline auto parse_unit(simdjson::ondemand::object& object, std::string_view source) -> Unit {
            Unit unit;
            if (!read_optional_string(object, "name", unit.name, source)) invalid_data(source, "unit without a name.");
            if (!read_optional_string(object, "id", unit.id, source)) unit.id = unit.name;
            read_optional_string(object, "name_kr", unit.localized_name, source);
            if (!read_optional_int(object, "cost", unit.cost, source)) {
                invalid_data(source, fmt::format("unit {} has no cost.", unit.id));
            }
            read_optional_string_array(object, "traits", unit.traits, source);
            if (!read_optional_int(object, "copies", unit.total_copies, source)) {
                auto iter = constants::COPIES_PER_COST.find(unit.cost);
                if (iter == constants::COPIES_PER_COST.end()) {
                    invalid_data(source, fmt::format("unit {} has cost {} with no default pool size.", unit.id, unit.cost));
                }
                unit.total_copies = iter->second;
            }
            return unit;
        }

        inline auto parse_trait(simdjson::ondemand::object& object, std::string_view source) -> Trait {
            Trait trait;
            if (!read_optional_string(object, "id", trait.id, source)
                && !read_optional_string(object, "name", trait.id, source)) {
                invalid_data(source, "trait without a name.");
            }
            simdjson::ondemand::value value;
            if (find_field(object, "thresholds", value, source)) {
                simdjson::ondemand::array thresholds;
                if (value.get_array().get(thresholds)) invalid_data(source, "trait thresholds must be an array.");
                for (auto element : thresholds) {
                    std::uint64_t threshold{0};
                    if (element.get_uint64().get(threshold) || threshold > std::numeric_limits<std::uint8_t>::max()) {
                        invalid_data(source, fmt::format("trait {} has a malformed threshold.", trait.id));
                    }
                    trait.thresholds.push_back(static_cast<std::uint8_t>(threshold));
                }
            }
            return trait;
        }

        // Returns false (after saying why) for decks that should be skipped rather than fail the load.
        inline bool parse_deck(simdjson::ondemand::object& object, MetaDeck& deck, std::string_view source) {
            if (!read_optional_string(object, "name", deck.name, source)) {
                fmt::print(stderr, "{}: deck without a name was skipped.\n", source);
                return false;
            }
            if (!read_optional_string(object, "id", deck.id, source)) deck.id = deck.name;
            if (!read_optional_string_array(object, "core_champions", deck.core, source)) {
                fmt::print(stderr, "{}: deck {} has no core_champions and was skipped.\n", source, deck.id);
                return false;
            }
            read_optional_string_array(object, "flex_champions", deck.flex, source);
            read_optional_string(object, "tier", deck.tier, source);
            read_optional_float(object, "win_rate", deck.win_rate, source);
            read_optional_float(object, "pick_rate", deck.pick_rate, source);
            read_optional_string_array(object, "core_items", deck.core_items, source);
            simdjson::ondemand::value value;
            if (find_field(object, "synergies", value, source)) {
                simdjson::ondemand::array synergies;
                if (value.get_array().get(synergies)) invalid_data(source, "synergies must be an array.");
                for (auto element : synergies) {
                    TraitTarget target;
                    simdjson::ondemand::json_type type;
                    if (element.type().get(type)) invalid_data(source, "malformed synergy.");
                    std::string_view name;
                    simdjson::ondemand::object synergy_object;
                    if (type == simdjson::ondemand::json_type::string && !element.get_string().get(name)) {
                        target.trait.assign(name);
                    } else if (type == simdjson::ondemand::json_type::object
                               && !element.get_object().get(synergy_object)) {
                        if (!read_optional_string(synergy_object, "name", target.trait, source)) {
                            invalid_data(source, fmt::format("deck {} has a synergy without a name.", deck.id));
                        }
                        read_optional_int(synergy_object, "level", target.level, source);
                    } else {
                        invalid_data(source, fmt::format("deck {} has a synergy that is neither a name nor an object.",
                                                         deck.id));
                    }
                    deck.trait_targets.push_back(std::move(target));
                }
            }
            return true;
        }
    }

    inline auto parse_registry(const simdjson::padded_string& json, std::string_view source)
            -> std::shared_ptr<const UnitRegistry> {
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document document;
        if (parser.iterate(json).get(document)) details::invalid_data(source, "is not valid JSON.");
        std::vector<Unit> units;
        std::vector<Trait> traits;
        simdjson::ondemand::json_type type;
        if (document.type().get(type)) details::invalid_data(source, "is not valid JSON.");
        if (type == simdjson::ondemand::json_type::object) {
            simdjson::ondemand::object root;
            if (document.get_object().get(root)) details::invalid_data(source, "is not a valid object.");
            simdjson::ondemand::value value;
            if (details::find_field(root, "traits", value, source)) {
                simdjson::ondemand::array trait_array;
                if (value.get_array().get(trait_array)) details::invalid_data(source, "traits must be an array.");
                for (auto element : trait_array) {
                    simdjson::ondemand::object trait;
                    if (element.get_object().get(trait)) details::invalid_data(source, "traits must hold objects.");
                    traits.push_back(details::parse_trait(trait, source));
                }
            }
            if (!details::find_field(root, "champions", value, source)) details::invalid_data(source, "has no champions.");
            simdjson::ondemand::array unit_array;
            if (value.get_array().get(unit_array)) details::invalid_data(source, "champions must be an array.");
            for (auto element : unit_array) {
                simdjson::ondemand::object unit;
                if (element.get_object().get(unit)) details::invalid_data(source, "champions must hold objects.");
                units.push_back(details::parse_unit(unit, source));
            }
        } else {
            simdjson::ondemand::array unit_array = details::top_level_array(document, "champions", source);
            for (auto element : unit_array) {
                simdjson::ondemand::object unit;
                if (element.get_object().get(unit)) details::invalid_data(source, "champions must hold objects.");
                units.push_back(details::parse_unit(unit, source));
            }
        }
        return std::make_shared<const UnitRegistry>(std::move(units), std::move(traits));
    }

    inline auto load_registry(const std::string& path) -> std::shared_ptr<const UnitRegistry> {
        return parse_registry(details::load_file(path), path);
    }

    inline auto parse_meta_decks(const simdjson::padded_string& json, std::string_view source) -> std::vector<MetaDeck> {
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document document;
        if (parser.iterate(json).get(document)) details::invalid_data(source, "is not valid JSON.");
        std::vector<MetaDeck> decks;
        for (auto element : details::top_level_array(document, "decks", source)) {
            simdjson::ondemand::object deck_object;
            if (element.get_object().get(deck_object)) {
                fmt::print(stderr, "{}: deck entry is not an object and was skipped.\n", source);
                continue;
            }
            MetaDeck deck;
            try {
                if (details::parse_deck(deck_object, deck, source)) decks.push_back(std::move(deck));
            } catch (const Error& error) {
                if (error.code() != ErrorCode::InvalidData) throw;
                fmt::print(stderr, "{} Deck skipped.\n", error.what());
            }
        }
        return decks;
    }

    inline auto load_meta_decks(const std::string& path) -> std::vector<MetaDeck> {
        return parse_meta_decks(details::load_file(path), path);
    }

    inline auto parse_odds(const simdjson::padded_string& json, std::string_view source)
            -> std::shared_ptr<const ShopOddsTable> {
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document document;
        simdjson::ondemand::object root;
        if (parser.iterate(json).get(document) || document.get_object().get(root)) {
            details::invalid_data(source, "must be a JSON object.");
        }
        simdjson::ondemand::value value;
        simdjson::ondemand::object levels;
        if (!details::find_field(root, "levels", value, source) || value.get_object().get(levels)) {
            details::invalid_data(source, "levels must be an object keyed by level.");
        }
        std::map<Level, std::vector<double>> rows;
        for (auto field_result : levels) {
            std::string_view key;
            if (field_result.unescaped_key().get(key)) details::invalid_data(source, "malformed level.");
            unsigned int level{0};
            auto [end, parse_error] = std::from_chars(key.data(), key.data() + key.size(), level);
            if (parse_error != std::errc{} || end != key.data() + key.size() || level > std::numeric_limits<Level>::max()) {
                details::invalid_data(source, fmt::format("level {} is not a small integer.", key));
            }
            simdjson::ondemand::array row;
            if (field_result.value().get_array().get(row)) details::invalid_data(source, fmt::format("level {} must be an array.", level));
            std::vector<double>& odds = rows[static_cast<Level>(level)];
            for (auto entry : row) {
                double probability{0.0};
                if (entry.get_double().get(probability)) {
                    details::invalid_data(source, fmt::format("level {} has a non numeric entry.", level));
                }
                odds.push_back(probability);
            }
        }
        return std::make_shared<const ShopOddsTable>(rows);
    }

    inline auto load_odds(const std::string& path) -> std::shared_ptr<const ShopOddsTable> {
        return parse_odds(details::load_file(path), path);
    }

    inline auto parse_config(const simdjson::padded_string& json, std::string_view source, EngineConfig config = {})
            -> EngineConfig {
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document document;
        simdjson::ondemand::object root;
        if (parser.iterate(json).get(document) || document.get_object().get(root)) {
            details::invalid_data(source, "must be a JSON object.");
        }
        details::read_optional_int(root, "slots_per_refresh", config.slots_per_refresh, source);
        details::read_optional_int(root, "default_level", config.default_level, source);
        details::read_optional_int(root, "refresh_budget", config.refresh_budget, source);
        details::read_optional_int(root, "copies_per_unit", config.copies_per_unit, source);
        details::read_optional_int(root, "max_refresh_horizon", config.max_refresh_horizon, source);
        std::string model;
        if (details::read_optional_string(root, "draw_model", model, source)) config.draw_model = parse_draw_model(model);
        simdjson::ondemand::value value;
        if (details::find_field(root, "weights", value, source)) {
            simdjson::ondemand::object weights;
            if (value.get_object().get(weights)) details::invalid_data(source, "weights must be an object.");
            details::read_optional_float(weights, "match", config.weights.match, source);
            details::read_optional_float(weights, "flex", config.weights.flex, source);
            details::read_optional_float(weights, "completion", config.weights.completion, source);
            details::read_optional_float(weights, "cost", config.weights.cost, source);
        }
        config.validate();
        return config;
    }

    inline auto load_config(const std::string& path, EngineConfig config = {}) -> EngineConfig {
        return parse_config(details::load_file(path), path, config);
    }

    inline auto parse_session_state(const simdjson::padded_string& json, std::string_view source,
                                    const EngineConfig& config = {}) -> SessionState {
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document document;
        simdjson::ondemand::object root;
        if (parser.iterate(json).get(document) || document.get_object().get(root)) {
            details::invalid_data(source, "must be a JSON object.");
        }
        SessionState state;
        state.level = config.default_level;
        state.refresh_budget = config.refresh_budget;
        details::read_optional_int(root, "level", state.level, source);
        details::read_optional_int(root, "refresh_budget", state.refresh_budget, source);
        details::read_optional_string_array(root, "owned", state.owned, source);
        details::read_optional_string_array(root, "shop", state.shop, source);
        simdjson::ondemand::value value;
        if (details::find_field(root, "opponents", value, source)) {
            simdjson::ondemand::array boards;
            if (value.get_array().get(boards)) details::invalid_data(source, "opponents must be an array of boards.");
            for (auto element : boards) {
                simdjson::ondemand::array board;
                if (element.get_array().get(board)) details::invalid_data(source, "opponents must hold arrays of units.");
                state.opponents.push_back(details::read_string_array(board, "opponents", source));
            }
        }
        return state;
    }

    inline auto load_session_state(const std::string& path, const EngineConfig& config = {}) -> SessionState {
        return parse_session_state(details::load_file(path), path, config);
    }

    inline auto to_observations(const SessionState& state) -> std::vector<Observation> {
        std::vector<Observation> result;
        for (const UnitId& id : state.owned) result.push_back({ ObservationKind::Bought, id, 1 });
        for (const auto& board : state.opponents) {
            for (const UnitId& id : board) result.push_back({ ObservationKind::Sighted, id, 1 });
        }
        for (const UnitId& id : state.shop) result.push_back({ ObservationKind::ShopShown, id, 1 });
        return result;
    }
}
#endif

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "metacomp/loader.hpp"
#include "metacomp/metacomp.hpp"
#include "metacomp/simulator.hpp"

using namespace std::string_view_literals;

namespace {
    struct Arguments {
        std::string champions_path;
        std::string meta_path;
        std::string state_path;
        std::optional<std::string> config_path;
        std::optional<std::string> odds_path;
        std::optional<metacomp::Level> level;
        std::optional<std::uint32_t> budget;
        std::optional<std::string> model;
        std::size_t top{5};
        std::size_t simulate_trials{0};
        bool show_pool{false};
    };

    constexpr std::string_view USAGE =
        "usage: metacomp_recommend <champions.json> <meta.json> <state.json> [--level N] [--budget N] [--top N]\n"
        "                          [--model independent|exact] [--config file] [--odds file] [--simulate TRIALS] [--pool]\n";

    template<typename Integral>
    Integral parse_number(std::string_view flag, std::string_view text) {
        std::uint64_t value{0};
        auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (error != std::errc{} || end != text.data() + text.size() || value > std::numeric_limits<Integral>::max()) {
            throw metacomp::Error(metacomp::ErrorCode::InvalidConfig,
                                  fmt::format("{} expects an integer up to {}, got {}.", flag,
                                              std::numeric_limits<Integral>::max(), text));
        }
        return static_cast<Integral>(value);
    }

    std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
        Arguments arguments;
        std::vector<std::string_view> positional;
        for (int i = 1; i < argc; i++) {
            const std::string_view arg = argv[i];
            if (arg == "--pool"sv) {
                arguments.show_pool = true;
                continue;
            }
            if (arg == "--help"sv || arg == "-h"sv) return std::nullopt;
            if (arg.starts_with("--")) {
                if (i + 1 >= argc) {
                    throw metacomp::Error(metacomp::ErrorCode::InvalidConfig, fmt::format("{} needs a value.", arg));
                }
                const std::string_view value = argv[++i];
                if (arg == "--level"sv) arguments.level = parse_number<metacomp::Level>(arg, value);
                else if (arg == "--budget"sv) arguments.budget = parse_number<std::uint32_t>(arg, value);
                else if (arg == "--top"sv) arguments.top = parse_number<std::size_t>(arg, value);
                else if (arg == "--simulate"sv) arguments.simulate_trials = parse_number<std::size_t>(arg, value);
                else if (arg == "--model"sv) arguments.model = std::string(value);
                else if (arg == "--config"sv) arguments.config_path = std::string(value);
                else if (arg == "--odds"sv) arguments.odds_path = std::string(value);
                else throw metacomp::Error(metacomp::ErrorCode::InvalidConfig, fmt::format("Unknown option {}.", arg));
                continue;
            }
            positional.push_back(arg);
        }
        if (positional.size() != 3) return std::nullopt;
        arguments.champions_path = positional[0];
        arguments.meta_path = positional[1];
        arguments.state_path = positional[2];
        return arguments;
    }

    void print_pool(const metacomp::PoolSnapshot& snapshot) {
        for (const auto& [tier, entries] : snapshot.pool_status()) {
            fmt::print("cost {} ({} remaining)\n", tier, snapshot.total_remaining_at_tier(tier));
            for (const metacomp::PoolEntry& entry : entries) {
                fmt::print("  {:<20} {:>3}/{:<3}\n", entry.unit_id, entry.remaining, entry.total);
            }
        }
    }

    void print_result(std::size_t rank, const metacomp::RecommendationResult& result) {
        fmt::print("{}. {} [{}] score {:.3f}\n", rank, result.deck_name, result.tier.empty() ? "-" : result.tier,
                   result.score);
        fmt::print("   match {:.0f}%  flex {:.0f}%  complete {:.1f}%  expected refreshes {}  cost {}\n",
                   100 * result.match_ratio, 100 * result.flex_ratio, 100 * result.completion_probability,
                   std::isfinite(result.expected_refreshes) ? fmt::format("{:.1f}", result.expected_refreshes) : "never",
                   result.acquisition_cost);
        if (result.win_rate > 0.f || result.pick_rate > 0.f) {
            fmt::print("   win rate {:.1f}%  pick rate {:.1f}%\n", 100 * result.win_rate, 100 * result.pick_rate);
        }
        for (const metacomp::UnitOdds& odds : result.missing) {
            fmt::print("   need {:<20} cost {}  {:>2} left ({:>3} in tier)  per refresh {:.2f}%  in budget {:.1f}%\n",
                       odds.unit_id, odds.cost, odds.remaining, odds.remaining_at_tier,
                       100 * odds.refresh_probability, 100 * odds.completion_probability);
        }
        for (const metacomp::TraitProgress& trait : result.traits) {
            fmt::print("   trait {:<20} {}/{}\n", trait.trait, trait.active_level, trait.target_level);
        }
    }

    // Needs for the simulator: copies_per_unit of every missing core unit.
    auto missing_needs(const metacomp::RecommendationResult& result, std::uint8_t copies)
            -> std::map<metacomp::UnitId, std::uint8_t> {
        std::map<metacomp::UnitId, std::uint8_t> needs;
        for (const metacomp::UnitOdds& odds : result.missing) needs.emplace(odds.unit_id, copies);
        return needs;
    }
}

int main(int argc, char* argv[]) {
    try {
        const std::optional<Arguments> arguments = parse_arguments(argc, argv);
        if (!arguments) {
            fmt::print(stderr, "{}", USAGE);
            return 2;
        }

        metacomp::EngineConfig config;
        if (arguments->config_path) config = metacomp::load_config(*arguments->config_path);
        if (arguments->model) config.draw_model = metacomp::parse_draw_model(*arguments->model);

        const std::shared_ptr<const metacomp::UnitRegistry> registry = metacomp::load_registry(arguments->champions_path);
        const std::shared_ptr<const metacomp::ShopOddsTable> odds = arguments->odds_path
            ? metacomp::load_odds(*arguments->odds_path)
            : std::make_shared<const metacomp::ShopOddsTable>(metacomp::ShopOddsTable::standard());
        const std::vector<metacomp::MetaDeck> decks = metacomp::load_meta_decks(arguments->meta_path);
        const metacomp::SessionState state = metacomp::load_session_state(arguments->state_path, config);

        const metacomp::Advisor advisor(registry, odds, config);
        std::unique_ptr<metacomp::Session> session = advisor.new_session();

        // Observations arrive from a recognition thread in a live client.
        std::jthread producer([&]() {
            for (metacomp::Observation& observation : metacomp::to_observations(state)) {
                session->post(std::move(observation));
            }
        });
        producer.join();
        for (const metacomp::RejectedObservation& rejected : session->drain()) {
            fmt::print(stderr, "Ignored {} {}: {}\n", metacomp::to_string(rejected.observation.kind),
                       rejected.observation.unit_id, rejected.message);
        }

        metacomp::RankOptions options = advisor.default_options();
        options.level = arguments->level.value_or(state.level);
        options.refresh_budget = arguments->budget.value_or(state.refresh_budget);
        options.limit = arguments->top;

        const metacomp::SessionView view = session->view();
        if (arguments->show_pool) print_pool(view.snapshot);

        const std::vector<metacomp::RecommendationResult> results =
            advisor.recommend(view.owned, decks, view.snapshot, options);
        fmt::print("level {}, {} refreshes, {} model, {} owned units\n", options.level, options.refresh_budget,
                   advisor.calculator().model().name(), view.owned.size());
        metacomp::ShopSimulator simulator(odds, config.slots_per_refresh, 0x6d657461636f6d70ULL);
        for (std::size_t i = 0; i < results.size(); i++) {
            print_result(i + 1, results[i]);
            if (arguments->simulate_trials > 0) {
                const double simulated = simulator.simulate_completion(
                    view.snapshot, options.level, missing_needs(results[i], options.copies_per_unit),
                    options.refresh_budget, arguments->simulate_trials);
                fmt::print("   simulated completion {:.1f}% over {} trials\n", 100 * simulated,
                           arguments->simulate_trials);
            }
        }
        return 0;
    } catch (const metacomp::Error& error) {
        std::cerr << "error (" << metacomp::to_string(error.code()) << "): " << error.what() << std::endl;
        return 1;
    } catch (const metacomp::ProbabilityInvariantError& error) {
        std::cerr << "internal error: " << error.what() << std::endl;
        return 3;
    }
}

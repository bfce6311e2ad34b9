#include "combat/combat_service.hpp"
#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/rules_loader.hpp"
#include "sim/entity_registry.hpp"
#include "sim/squad.hpp"

#include <climits>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace {

struct Options {
    otc::fs::path rules_file;
    otc::fs::path log_file = "opentactics.log";
    otc::i32 squads = 3;
    otc::i32 rounds = 20;
    long seed = -1; // -1 = take it from the rules
};

void print_usage() {
    std::cout << "OpenTactics v0.1.0\n"
              << "Turn-based squad combat core, scripted skirmish driver\n\n"
              << "Usage:\n"
              << "  opentactics [options]\n\n"
              << "Options:\n"
              << "  --rules <path>     Lua rules script (default: built-in rules)\n"
              << "  --squads <n>       Squads per faction (default: 3)\n"
              << "  --rounds <n>       Round limit (default: 20)\n"
              << "  --seed <n>         Turn-order seed, overrides the rules\n"
              << "  --log <path>       Log file (default: opentactics.log)\n"
              << "  --help             Show this help message\n";
}

long parse_number(const char* flag, const char* text, long min, long max) {
    char* end = nullptr;
    long val = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || val < min || val > max) {
        std::cerr << "Invalid " << flag << " value: " << text << "\n";
        std::exit(1);
    }
    return val;
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--rules") == 0 && i + 1 < argc) {
            opts.rules_file = argv[++i];
        } else if (std::strcmp(argv[i], "--squads") == 0 && i + 1 < argc) {
            opts.squads = static_cast<otc::i32>(
                parse_number("--squads", argv[++i], 1, 64));
        } else if (std::strcmp(argv[i], "--rounds") == 0 && i + 1 < argc) {
            opts.rounds = static_cast<otc::i32>(
                parse_number("--rounds", argv[++i], 1, 10'000));
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            opts.seed = parse_number("--seed", argv[++i], 0, UINT_MAX);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            std::exit(1);
        }
    }
    return opts;
}

otc::EntityId spawn_squad(otc::sim::EntityRegistry& registry,
                          const std::string& name) {
    auto squad = std::make_unique<otc::sim::Squad>();
    squad->set_name(name);
    return registry.register_entity(std::move(squad));
}

/// Closest enemy squad by Chebyshev distance, or 0.
otc::EntityId nearest_enemy(otc::combat::CombatService& combat,
                            otc::EntityId squad, otc::EntityId faction) {
    auto from = combat.movement().squad_position(squad);
    if (!from) return 0;

    otc::EntityId best = 0;
    otc::i32 best_dist = INT_MAX;
    for (otc::EntityId other : combat.factions().faction_ids()) {
        if (other == faction) continue;
        for (otc::EntityId enemy : combat.factions().faction_squads(other)) {
            auto pos = combat.movement().squad_position(enemy);
            if (!pos) continue;
            otc::i32 dist =
                otc::grid::chebyshev_distance(from.value(), pos.value());
            if (dist < best_dist) {
                best_dist = dist;
                best = enemy;
            }
        }
    }
    return best;
}

/// Queue an attack on the nearest squad in range, if any.
bool try_attack(otc::combat::CombatService& combat, otc::EntityId squad) {
    auto targets = combat.actions().squads_in_range(squad);
    if (targets.empty()) return false;

    auto queued = combat.submit_attack(squad, targets.front());
    if (!queued) {
        spdlog::debug("Squad {} cannot attack: {}", squad,
                      queued.error().message);
        return false;
    }
    return true;
}

/// Queue a move to the reachable tile closest to the nearest enemy.
void advance(otc::combat::CombatService& combat, otc::EntityId squad,
             otc::EntityId faction) {
    otc::EntityId target = nearest_enemy(combat, squad, faction);
    if (target == 0) return;

    auto from = combat.movement().squad_position(squad);
    auto goal = combat.movement().squad_position(target);
    if (!from || !goal) return;

    otc::grid::GridPos best = from.value();
    otc::i32 best_dist = otc::grid::chebyshev_distance(best, goal.value());
    for (const auto& tile : combat.movement().valid_movement_tiles(squad)) {
        otc::i32 dist = otc::grid::chebyshev_distance(tile, goal.value());
        if (dist < best_dist) {
            best_dist = dist;
            best = tile;
        }
    }
    if (best == from.value()) return;

    auto queued = combat.submit_move(squad, best);
    if (!queued) {
        spdlog::debug("Squad {} cannot move: {}", squad,
                      queued.error().message);
    }
}

void play_turn(otc::combat::CombatService& combat) {
    otc::EntityId faction = combat.turns().current_faction();
    auto squads = combat.factions().faction_squads(faction);

    // Attack what is already in reach, close in with the rest
    for (otc::EntityId squad : squads) {
        if (!try_attack(combat, squad)) advance(combat, squad, faction);
    }
    combat.resolve_pending();

    // Squads that just moved into range still have their attack
    for (otc::EntityId squad : combat.factions().faction_squads(faction)) {
        if (combat.state().can_squad_act(squad)) try_attack(combat, squad);
    }
    combat.resolve_pending();
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    otc::log::init(opts.log_file);

    otc::combat::CombatRules rules;
    if (!opts.rules_file.empty()) {
        auto loaded = otc::lua::RulesLoader::load_file(opts.rules_file);
        if (!loaded) {
            spdlog::error("Rules loading failed: {}", loaded.error().message);
            otc::log::shutdown();
            return 1;
        }
        rules = loaded.value();
    }
    if (opts.seed >= 0) rules.seed = static_cast<otc::u32>(opts.seed);

    otc::sim::EntityRegistry registry;
    otc::combat::CombatService combat(registry, rules);

    otc::EntityId red = combat.create_faction("Red", true);
    otc::EntityId blue = combat.create_faction("Blue", false);

    // Two lines facing each other across the grid
    otc::i32 west = 1;
    otc::i32 east = rules.grid_width - 2;
    for (otc::i32 i = 0; i < opts.squads; ++i) {
        otc::i32 row = (i * 2) % rules.grid_height;
        otc::EntityId r =
            spawn_squad(registry, "Red " + std::to_string(i + 1));
        otc::EntityId b =
            spawn_squad(registry, "Blue " + std::to_string(i + 1));

        auto placed = combat.place_squad(red, r, {west, row});
        if (placed) placed = combat.place_squad(blue, b, {east, row});
        if (!placed) {
            spdlog::error("Setup failed: {}", placed.error().message);
            otc::log::shutdown();
            return 1;
        }
    }

    auto started = combat.start_combat();
    if (!started) {
        spdlog::error("Combat failed to start: {}", started.error().message);
        otc::log::shutdown();
        return 1;
    }

    try {
        while (combat.turns().phase() == otc::combat::CombatPhase::Active &&
               combat.turns().current_round() <= opts.rounds) {
            play_turn(combat);
            if (combat.check_victory().battle_over) break;

            auto ended = combat.end_turn();
            if (!ended) {
                spdlog::error("Turn failed: {}", ended.error().message);
                break;
            }
        }
    } catch (const std::invalid_argument& e) {
        spdlog::error("Simulation aborted: {}", e.what());
        otc::log::shutdown();
        return 1;
    }

    auto result = combat.check_victory();
    if (result.battle_over && result.victor != 0) {
        spdlog::info("{} wins after {} rounds", result.victor_name,
                     result.rounds_completed);
    } else if (result.battle_over) {
        spdlog::info("No faction left standing after {} rounds",
                     result.rounds_completed);
    } else {
        spdlog::info("Round limit reached after {} rounds, no victor",
                     result.rounds_completed);
    }

    size_t failed = 0;
    for (const auto& outcome : combat.outcomes()) {
        if (!outcome.ok) ++failed;
    }
    spdlog::info("{} actions executed, {} failed", combat.outcomes().size(),
                 failed);

    combat.teardown();
    otc::log::shutdown();
    return 0;
}

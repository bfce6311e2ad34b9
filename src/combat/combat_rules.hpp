#pragma once

#include "core/types.hpp"
#include "sim/action_queue.hpp"

#include <array>

namespace otc::combat {

/// Tunables for one combat session. Defaults match the stock rules script;
/// lua::RulesLoader overrides them from Lua.
struct CombatRules {
    i32 starting_action_points = 100;
    i32 action_point_regen = 50;

    // Indexed by sim::ActionKind
    std::array<i32, sim::ACTION_KIND_COUNT> action_costs = {10, 20, 20, 25, 5};

    i32 default_movement_speed = 3;
    i32 default_attack_range = 1;

    i32 grid_width = 32;
    i32 grid_height = 32;

    i32 attack_damage = 10;

    u32 seed = 0; // 0 = seed from std::random_device

    i32 cost_of(sim::ActionKind kind) const {
        return action_costs[static_cast<size_t>(kind)];
    }
    void set_cost(sim::ActionKind kind, i32 cost) {
        action_costs[static_cast<size_t>(kind)] = cost;
    }
};

} // namespace otc::combat

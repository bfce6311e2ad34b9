#pragma once

#include "core/types.hpp"
#include "grid/grid_pos.hpp"

#include <vector>

namespace otc::combat {

enum class CombatPhase : u8 {
    Inactive = 0,
    Active = 1,
    Resolving = 2,
};

/// One per active combat.
struct TurnState {
    bool combat_active = false;
    i32 current_round = 0;
    std::vector<EntityId> turn_order; // shuffled once at combat start
    size_t current_turn_index = 0;
};

/// Where a squad stands and which faction owns it.
struct MapPosition {
    EntityId squad_id = 0;
    EntityId faction_id = 0;
    grid::GridPos position;
};

/// Per-squad budget for the current faction turn.
struct ActionState {
    EntityId squad_id = 0;
    bool has_acted = false;
    bool has_moved = false;
    i32 movement_remaining = 0; // never negative
};

inline const char* combat_phase_name(CombatPhase phase) {
    switch (phase) {
        case CombatPhase::Inactive: return "Inactive";
        case CombatPhase::Active: return "Active";
        case CombatPhase::Resolving: return "Resolving";
    }
    return "Unknown";
}

} // namespace otc::combat

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "grid/grid_pos.hpp"

#include <vector>

namespace otc::grid {
class PositionIndex;
}

namespace otc::sim {
class EntityRegistry;
}

namespace otc::combat {

class CombatState;
struct CombatRules;

/// Squad movement on the combat grid. Movement costs the Chebyshev distance
/// travelled and is paid from the squad's per-turn movement budget.
class MovementSystem {
public:
    MovementSystem(const sim::EntityRegistry& registry, CombatState& state,
                   grid::PositionIndex& index, const CombatRules& rules);

    /// Tiles per turn. Falls back to the rules default when the squad has
    /// no speed of its own.
    i32 squad_movement_speed(EntityId squad) const;

    /// In bounds and either empty or held only by squads of the same faction.
    bool can_move_to(EntityId squad, grid::GridPos target) const;

    /// Move a squad, spending movement. Returns the movement cost paid.
    Result<i32> move_squad(EntityId squad, grid::GridPos target);

    /// Every reachable tile within the remaining movement budget.
    std::vector<grid::GridPos> valid_movement_tiles(EntityId squad) const;

    Result<grid::GridPos> squad_position(EntityId squad) const;

    bool in_bounds(grid::GridPos pos) const;

private:
    const sim::EntityRegistry& registry_;
    CombatState& state_;
    grid::PositionIndex& index_;
    const CombatRules& rules_;
};

} // namespace otc::combat

#include "combat/movement_system.hpp"
#include "combat/combat_rules.hpp"
#include "combat/combat_state.hpp"
#include "grid/position_index.hpp"
#include "sim/entity_registry.hpp"
#include "sim/squad.hpp"

#include <spdlog/spdlog.h>
#include <string>

namespace otc::combat {

MovementSystem::MovementSystem(const sim::EntityRegistry& registry,
                               CombatState& state, grid::PositionIndex& index,
                               const CombatRules& rules)
    : registry_(registry), state_(state), index_(index), rules_(rules) {}

i32 MovementSystem::squad_movement_speed(EntityId squad) const {
    auto* s = registry_.find_squad(squad);
    if (!s || s->movement_speed() <= 0) return rules_.default_movement_speed;
    return s->movement_speed();
}

bool MovementSystem::in_bounds(grid::GridPos pos) const {
    return pos.x >= 0 && pos.y >= 0 && pos.x < rules_.grid_width &&
           pos.y < rules_.grid_height;
}

bool MovementSystem::can_move_to(EntityId squad, grid::GridPos target) const {
    if (!in_bounds(target)) return false;

    EntityId own_faction = state_.faction_owner(squad);
    for (EntityId occupant : index_.all_entities_at(target)) {
        if (occupant == squad) continue;
        // Terrain features and items are not squads and always block
        if (!state_.is_on_map(occupant)) return false;
        // Friendly squads can share a tile, enemies cannot
        if (state_.faction_owner(occupant) != own_faction) return false;
    }
    return true;
}

Result<i32> MovementSystem::move_squad(EntityId squad, grid::GridPos target) {
    if (!state_.can_squad_move(squad)) {
        return Error(ErrorCode::InvalidState,
                     "squad " + std::to_string(squad) +
                         " has no movement remaining");
    }

    auto current = squad_position(squad);
    if (!current) {
        return Error(current.error().code,
                     "cannot get current position: " + current.error().message);
    }

    i32 cost = grid::chebyshev_distance(current.value(), target);

    const auto* action_state = state_.find_action_state(squad);
    if (!action_state) {
        return Error(ErrorCode::NotFound,
                     "no action state for squad " + std::to_string(squad));
    }
    if (action_state->movement_remaining < cost) {
        return Error(ErrorCode::OutOfRange,
                     "insufficient movement: need " + std::to_string(cost) +
                         ", have " +
                         std::to_string(action_state->movement_remaining));
    }

    if (!can_move_to(squad, target)) {
        return Error(ErrorCode::Blocked,
                     "cannot move to " + grid::to_string(target));
    }

    auto moved = index_.move_entity(squad, current.value(), target);
    if (!moved) {
        return Error(moved.error().code,
                     "failed to move squad: " + moved.error().message);
    }
    state_.find_map_position(squad)->position = target;

    auto spent = state_.decrement_movement_remaining(squad, cost);
    if (!spent) return spent.error();
    auto marked = state_.mark_squad_as_moved(squad);
    if (!marked) return marked.error();

    spdlog::debug("Squad {} moved {} -> {} (cost {})", squad,
                  grid::to_string(current.value()), grid::to_string(target),
                  cost);
    return cost;
}

std::vector<grid::GridPos> MovementSystem::valid_movement_tiles(
    EntityId squad) const {
    std::vector<grid::GridPos> tiles;

    auto current = squad_position(squad);
    if (!current) return tiles;

    const auto* action_state = state_.find_action_state(squad);
    if (!action_state) return tiles;

    i32 range = action_state->movement_remaining;
    if (range <= 0) return tiles;

    const auto& center = current.value();
    for (i32 x = center.x - range; x <= center.x + range; ++x) {
        for (i32 y = center.y - range; y <= center.y + range; ++y) {
            grid::GridPos pos{x, y};
            if (grid::chebyshev_distance(center, pos) > range) continue;
            if (can_move_to(squad, pos)) tiles.push_back(pos);
        }
    }
    return tiles;
}

Result<grid::GridPos> MovementSystem::squad_position(EntityId squad) const {
    const auto* record = state_.find_map_position(squad);
    if (!record) {
        return Error(ErrorCode::NotFound,
                     "squad " + std::to_string(squad) + " not on map");
    }
    return record->position;
}

} // namespace otc::combat

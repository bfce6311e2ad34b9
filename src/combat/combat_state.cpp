#include "combat/combat_state.hpp"

#include <string>

namespace otc::combat {

namespace {

Error missing_action_state(EntityId squad) {
    return Error(ErrorCode::NotFound,
                 "no action state for squad " + std::to_string(squad));
}

} // namespace

void CombatState::set_map_position(const MapPosition& record) {
    map_positions_[record.squad_id] = record;
}

MapPosition* CombatState::find_map_position(EntityId squad) {
    auto it = map_positions_.find(squad);
    return it != map_positions_.end() ? &it->second : nullptr;
}

const MapPosition* CombatState::find_map_position(EntityId squad) const {
    auto it = map_positions_.find(squad);
    return it != map_positions_.end() ? &it->second : nullptr;
}

Result<void> CombatState::remove_map_position(EntityId squad) {
    if (map_positions_.erase(squad) == 0) {
        return Error(ErrorCode::NotFound,
                     "squad " + std::to_string(squad) + " not on map");
    }
    return {};
}

std::vector<EntityId> CombatState::squads_for_faction(EntityId faction) const {
    std::vector<EntityId> result;
    for (const auto& [squad, record] : map_positions_) {
        if (record.faction_id == faction) result.push_back(squad);
    }
    return result;
}

EntityId CombatState::faction_owner(EntityId squad) const {
    const auto* record = find_map_position(squad);
    return record ? record->faction_id : 0;
}

EntityId CombatState::squad_at(grid::GridPos pos) const {
    for (const auto& [squad, record] : map_positions_) {
        if (record.position == pos) return squad;
    }
    return 0;
}

ActionState& CombatState::ensure_action_state(EntityId squad) {
    auto it = action_states_.find(squad);
    if (it == action_states_.end()) {
        ActionState fresh;
        fresh.squad_id = squad;
        it = action_states_.emplace(squad, fresh).first;
    }
    return it->second;
}

ActionState* CombatState::find_action_state(EntityId squad) {
    auto it = action_states_.find(squad);
    return it != action_states_.end() ? &it->second : nullptr;
}

const ActionState* CombatState::find_action_state(EntityId squad) const {
    auto it = action_states_.find(squad);
    return it != action_states_.end() ? &it->second : nullptr;
}

void CombatState::remove_action_state(EntityId squad) {
    action_states_.erase(squad);
}

bool CombatState::can_squad_act(EntityId squad) const {
    const auto* state = find_action_state(squad);
    return state && !state->has_acted;
}

bool CombatState::can_squad_move(EntityId squad) const {
    const auto* state = find_action_state(squad);
    return state && state->movement_remaining > 0;
}

Result<void> CombatState::mark_squad_as_acted(EntityId squad) {
    auto* state = find_action_state(squad);
    if (!state) return missing_action_state(squad);
    state->has_acted = true;
    return {};
}

Result<void> CombatState::mark_squad_as_moved(EntityId squad) {
    auto* state = find_action_state(squad);
    if (!state) return missing_action_state(squad);
    state->has_moved = true;
    return {};
}

Result<void> CombatState::decrement_movement_remaining(EntityId squad,
                                                       i32 amount) {
    auto* state = find_action_state(squad);
    if (!state) return missing_action_state(squad);
    state->movement_remaining -= amount;
    if (state->movement_remaining < 0) state->movement_remaining = 0;
    return {};
}

void CombatState::clear() {
    map_positions_.clear();
    action_states_.clear();
    turn_state_.reset();
}

} // namespace otc::combat

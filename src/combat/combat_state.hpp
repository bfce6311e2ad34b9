#pragma once

#include "combat/combat_records.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <vector>

namespace otc::combat {

/// Record store for the turn machine: map positions and action states keyed
/// by squad id, plus the single TurnState of the running combat.
///
/// Lookups that find nothing return nullptr/0/false. Mutators of a missing
/// record return a NotFound error naming the squad.
class CombatState {
public:
    // --- Map positions ---
    void set_map_position(const MapPosition& record);
    MapPosition* find_map_position(EntityId squad);
    const MapPosition* find_map_position(EntityId squad) const;
    Result<void> remove_map_position(EntityId squad);

    /// Squads whose map position names this faction, ascending by id.
    std::vector<EntityId> squads_for_faction(EntityId faction) const;

    /// Owning faction of a squad, or 0 if it is not on the map.
    EntityId faction_owner(EntityId squad) const;

    /// First squad recorded at a cell, or 0.
    EntityId squad_at(grid::GridPos pos) const;

    bool is_on_map(EntityId squad) const {
        return map_positions_.count(squad) != 0;
    }

    // --- Action states ---

    /// Create a fresh record if the squad has none. Returns the record.
    ActionState& ensure_action_state(EntityId squad);
    ActionState* find_action_state(EntityId squad);
    const ActionState* find_action_state(EntityId squad) const;
    void remove_action_state(EntityId squad);

    /// False if the squad has already acted or has no record.
    bool can_squad_act(EntityId squad) const;

    /// False if no movement is left or the squad has no record.
    bool can_squad_move(EntityId squad) const;

    Result<void> mark_squad_as_acted(EntityId squad);
    Result<void> mark_squad_as_moved(EntityId squad);

    /// Subtract from movement_remaining, flooring at zero.
    Result<void> decrement_movement_remaining(EntityId squad, i32 amount);

    // --- Turn state ---
    TurnState* turn_state() { return turn_state_ ? &*turn_state_ : nullptr; }
    const TurnState* turn_state() const {
        return turn_state_ ? &*turn_state_ : nullptr;
    }
    void set_turn_state(TurnState state) { turn_state_ = std::move(state); }
    void clear_turn_state() { turn_state_.reset(); }

    bool combat_active() const {
        return turn_state_ && turn_state_->combat_active;
    }

    void clear();

private:
    // Ordered so per-faction scans are deterministic
    std::map<EntityId, MapPosition> map_positions_;
    std::map<EntityId, ActionState> action_states_;
    std::optional<TurnState> turn_state_;
};

} // namespace otc::combat

#pragma once

#include "combat/combat_records.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <random>
#include <vector>

namespace otc::combat {

class CombatState;
class FactionManager;
class MovementSystem;

/// Faction-level turn machine:
///
///   Inactive --initialize_combat--> Active --end_turn (last faction,
///   fewer than two factions with squads)--> Resolving
///   --finish_resolution--> Inactive
///
/// While Active exactly one faction is current. Turn order is a uniform
/// shuffle of the faction ids, drawn once per combat.
class TurnManager {
public:
    TurnManager(CombatState& state, const FactionManager& factions,
                const MovementSystem& movement, u32 seed);

    /// Start a combat between the given factions.
    Result<void> initialize_combat(const std::vector<EntityId>& faction_ids);

    CombatPhase phase() const { return phase_; }

    /// Faction whose turn it is, or 0 when no combat is running.
    EntityId current_faction() const;

    /// 1-based round counter, 0 when no combat is running.
    i32 current_round() const;

    const std::vector<EntityId>& turn_order() const;

    /// Clear acted/moved flags and refill movement for a faction's squads.
    Result<void> reset_squad_actions(EntityId faction);

    /// Current faction's squad with its combat action still unused.
    bool is_squad_activatable(EntityId squad) const;

    /// Acted and no movement left. Squads without a record count as spent.
    bool is_squad_exhausted(EntityId squad) const;

    /// Every squad of the faction is exhausted (true for an empty faction).
    bool is_faction_exhausted(EntityId faction) const;

    /// Pass control to the next faction. After the last faction either a
    /// new round starts or, once fewer than two factions have squads left,
    /// the combat moves to Resolving.
    Result<void> end_turn();

    /// end_turn() if the current faction is exhausted. Returns true if the
    /// turn advanced.
    bool advance_if_exhausted();

    /// Resolving -> Inactive.
    Result<void> finish_resolution();

    /// Abort: any running combat goes straight to Inactive.
    Result<void> end_combat();

private:
    void shuffle_faction_order(std::vector<EntityId>& ids);
    size_t factions_with_squads() const;

    CombatState& state_;
    const FactionManager& factions_;
    const MovementSystem& movement_;
    std::mt19937 rng_;
    CombatPhase phase_ = CombatPhase::Inactive;
};

} // namespace otc::combat

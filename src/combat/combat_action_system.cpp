#include "combat/combat_action_system.hpp"
#include "combat/combat_state.hpp"
#include "combat/faction_manager.hpp"
#include "grid/position_index.hpp"
#include "sim/entity_registry.hpp"
#include "sim/squad.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace otc::combat {

CombatActionSystem::CombatActionSystem(sim::EntityRegistry& registry,
                                       CombatState& state,
                                       FactionManager& factions,
                                       grid::PositionIndex& index,
                                       i32 default_attack_range)
    : registry_(registry),
      state_(state),
      factions_(factions),
      index_(index),
      default_attack_range_(default_attack_range) {}

i32 CombatActionSystem::squad_attack_range(EntityId squad) const {
    auto* s = registry_.find_squad(squad);
    if (!s) return default_attack_range_;
    return std::max(default_attack_range_, s->attack_range());
}

AttackCheck CombatActionSystem::can_squad_attack(EntityId attacker,
                                                 EntityId defender) const {
    if (!state_.can_squad_act(attacker))
        return {false, "Squad has already acted this turn"};

    const auto* attacker_pos = state_.find_map_position(attacker);
    if (!attacker_pos) return {false, "Attacker squad not found on map"};

    const auto* defender_pos = state_.find_map_position(defender);
    if (!defender_pos) return {false, "Target squad not found on map"};

    if (attacker_pos->faction_id == 0 || defender_pos->faction_id == 0)
        return {false, "One or both squads have no faction"};

    if (attacker_pos->faction_id == defender_pos->faction_id)
        return {false, "Cannot attack your own faction"};

    i32 distance = grid::chebyshev_distance(attacker_pos->position,
                                            defender_pos->position);
    i32 max_range = squad_attack_range(attacker);
    if (distance > max_range) {
        return {false, "Target out of range: " + std::to_string(distance) +
                           " tiles away (max range " +
                           std::to_string(max_range) + ")"};
    }

    return {true, "Attack valid"};
}

Result<CombatResult> CombatActionSystem::execute_attack(EntityId attacker,
                                                        EntityId defender) {
    auto check = can_squad_attack(attacker, defender);
    if (!check.allowed) {
        ErrorCode code = ErrorCode::InvalidState;
        if (!state_.is_on_map(attacker) || !state_.is_on_map(defender))
            code = ErrorCode::NotFound;
        return Error(code, check.reason);
    }
    if (!resolver_) {
        return Error(ErrorCode::InvalidState, "no attack resolver installed");
    }

    CombatResult result = resolver_(attacker, defender);

    auto marked = state_.mark_squad_as_acted(attacker);
    if (!marked) return marked.error();

    auto* target = registry_.find_squad(defender);
    if (target && target->is_dead()) result.target_destroyed = true;
    if (result.target_destroyed &&
        std::find(result.squads_killed.begin(), result.squads_killed.end(),
                  defender) == result.squads_killed.end())
        result.squads_killed.push_back(defender);

    // The resolver may report kills beyond the defender (splash damage)
    for (EntityId killed : result.squads_killed) {
        if (auto* squad = registry_.find_squad(killed)) squad->mark_destroyed();
        if (!state_.is_on_map(killed)) continue;

        auto removed = factions_.remove_squad_from_map(killed);
        if (!removed) return removed.error();
    }

    spdlog::info("Combat result: {} damage, {} kills", result.total_damage,
                 result.squads_killed.size());
    return result;
}

std::vector<EntityId> CombatActionSystem::squads_in_range(
    EntityId squad) const {
    std::vector<EntityId> result;
    const auto* own = state_.find_map_position(squad);
    if (!own) return result;

    for (EntityId other :
         index_.entities_in_radius(own->position, squad_attack_range(squad))) {
        if (other == squad) continue;
        EntityId owner = state_.faction_owner(other);
        if (owner == 0 || owner == own->faction_id) continue;
        auto* s = registry_.find_squad(other);
        if (s && !s->is_dead()) result.push_back(other);
    }
    return result;
}

} // namespace otc::combat

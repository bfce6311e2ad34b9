#pragma once

#include "combat/combat_action_system.hpp"
#include "combat/combat_rules.hpp"
#include "combat/combat_state.hpp"
#include "combat/faction_manager.hpp"
#include "combat/movement_system.hpp"
#include "combat/turn_manager.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "grid/position_index.hpp"
#include "sim/action_controller.hpp"

#include <string>
#include <vector>

namespace otc::sim {
class EntityRegistry;
}

namespace otc::combat {

/// What happened when a queued action finally ran.
struct ActionOutcome {
    EntityId squad = 0;
    sim::ActionKind kind = sim::ActionKind::Movement;
    bool ok = false;
    std::string message;
};

struct VictoryCheck {
    bool battle_over = false;
    EntityId victor = 0; // 0 = draw or still running
    std::string victor_name;
    std::vector<EntityId> defeated;
    i32 rounds_completed = 0;
};

/// One combat session: the action controller, position index, record store
/// and the systems that operate on them. Squads and factions live in the
/// caller's EntityRegistry.
///
/// Commands go through submit_*(), which only queues them. Nothing touches
/// the map until step() or resolve_pending() runs the controller.
class CombatService {
public:
    CombatService(sim::EntityRegistry& registry, const CombatRules& rules);
    ~CombatService();

    CombatService(const CombatService&) = delete;
    CombatService& operator=(const CombatService&) = delete;

    // --- Setup ---
    EntityId create_faction(const std::string& name, bool is_player);
    Result<void> place_squad(EntityId faction, EntityId squad,
                             grid::GridPos position);

    /// Start combat between every faction created so far.
    Result<void> start_combat();
    Result<void> start_combat(const std::vector<EntityId>& faction_ids);

    // --- Commands ---
    Result<sim::AddActionResult> submit_move(EntityId squad,
                                             grid::GridPos destination);
    Result<sim::AddActionResult> submit_attack(
        EntityId attacker, EntityId defender,
        sim::ActionKind kind = sim::ActionKind::Attack);
    Result<sim::AddActionResult> submit_player_action(
        EntityId squad, grid::GridPos target, i32 param, sim::ActionKind kind,
        sim::PlayerActionFn behavior);

    // --- Resolution ---

    /// Run one action of the highest priority queue.
    sim::QueueHandle step();

    /// Run queued actions until none are left. Returns the number of steps.
    size_t resolve_pending();

    /// Resolve what is still queued, then hand the turn to the next
    /// faction and restore its squads' action points.
    Result<void> end_turn();
    bool advance_turn_if_exhausted();

    VictoryCheck check_victory() const;

    /// Resolving -> Inactive, then drop the session state.
    void teardown();

    void set_attack_resolver(AttackResolver resolver);

    const std::vector<ActionOutcome>& outcomes() const { return outcomes_; }
    void clear_outcomes() { outcomes_.clear(); }

    // --- Accessors ---
    const CombatRules& rules() const { return rules_; }
    sim::ActionController& controller() { return controller_; }
    const sim::ActionController& controller() const { return controller_; }
    grid::PositionIndex& index() { return index_; }
    const grid::PositionIndex& index() const { return index_; }
    CombatState& state() { return state_; }
    const CombatState& state() const { return state_; }
    FactionManager& factions() { return factions_; }
    const FactionManager& factions() const { return factions_; }
    MovementSystem& movement() { return movement_; }
    CombatActionSystem& actions() { return actions_; }
    TurnManager& turns() { return turns_; }
    const TurnManager& turns() const { return turns_; }

private:
    enum class Need { Act, Move };

    Result<void> check_submission(EntityId squad, Need need) const;
    Result<sim::QueueHandle> queue_for(EntityId squad);
    Result<sim::AddActionResult> enqueue(EntityId squad, sim::Action action,
                                         sim::ActionKind kind);
    void record(EntityId squad, sim::ActionKind kind, bool ok,
                std::string message);
    void flush_removals();
    CombatResult flat_damage(EntityId attacker, EntityId defender);

    sim::EntityRegistry& registry_;
    CombatRules rules_;

    sim::ActionController controller_;
    grid::PositionIndex index_;
    CombatState state_;
    FactionManager factions_;
    MovementSystem movement_;
    CombatActionSystem actions_;
    TurnManager turns_;

    std::vector<ActionOutcome> outcomes_;
    // Queues of squads killed mid-step; destroyed once the step returns
    std::vector<EntityId> pending_removals_;
    i32 last_round_ = 0;
};

} // namespace otc::combat

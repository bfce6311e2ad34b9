#include "combat/combat_service.hpp"
#include "sim/entity_registry.hpp"
#include "sim/squad.hpp"

#include <spdlog/spdlog.h>

namespace otc::combat {

CombatService::CombatService(sim::EntityRegistry& registry,
                             const CombatRules& rules)
    : registry_(registry),
      rules_(rules),
      factions_(registry_, state_, index_),
      movement_(registry_, state_, index_, rules_),
      actions_(registry_, state_, factions_, index_,
               rules_.default_attack_range),
      turns_(state_, factions_, movement_, rules_.seed) {
    actions_.set_resolver([this](EntityId attacker, EntityId defender) {
        return flat_damage(attacker, defender);
    });
}

CombatService::~CombatService() = default;

EntityId CombatService::create_faction(const std::string& name,
                                       bool is_player) {
    return factions_.create_faction(name, is_player);
}

Result<void> CombatService::place_squad(EntityId faction, EntityId squad,
                                        grid::GridPos position) {
    if (!movement_.in_bounds(position)) {
        return Error(ErrorCode::OutOfRange,
                     "squad " + std::to_string(squad) + " placed outside grid at " +
                         grid::to_string(position));
    }
    return factions_.add_squad_to_faction(faction, squad, position);
}

Result<void> CombatService::start_combat() {
    return start_combat(factions_.faction_ids());
}

Result<void> CombatService::start_combat(
    const std::vector<EntityId>& faction_ids) {
    auto started = turns_.initialize_combat(faction_ids);
    if (!started) return started;
    last_round_ = turns_.current_round();
    outcomes_.clear();
    return {};
}

// --- Commands ---

Result<void> CombatService::check_submission(EntityId squad, Need need) const {
    if (turns_.phase() != CombatPhase::Active) {
        return Error(ErrorCode::InvalidState,
                     std::string("combat is ") +
                         combat_phase_name(turns_.phase()));
    }
    EntityId owner = state_.faction_owner(squad);
    if (owner == 0) {
        return Error(ErrorCode::NotFound,
                     "squad " + std::to_string(squad) + " is not on the map");
    }
    if (owner != turns_.current_faction()) {
        return Error(ErrorCode::NotPermitted,
                     "not the turn of squad " + std::to_string(squad) +
                         "'s faction");
    }
    if (need == Need::Act && !state_.can_squad_act(squad)) {
        return Error(ErrorCode::InvalidState,
                     "squad " + std::to_string(squad) + " has already acted");
    }
    if (need == Need::Move && !state_.can_squad_move(squad)) {
        return Error(ErrorCode::InvalidState,
                     "squad " + std::to_string(squad) + " cannot move");
    }

    auto handle = controller_.find_queue_for_entity(squad);
    if (const auto* queue = controller_.get(handle)) {
        if (queue->total_action_points() <= 0) {
            return Error(ErrorCode::NotPermitted,
                         "squad " + std::to_string(squad) +
                             " has no action points left");
        }
    }
    return {};
}

Result<sim::QueueHandle> CombatService::queue_for(EntityId squad) {
    auto handle = controller_.find_queue_for_entity(squad);
    if (!handle.valid())
        handle = controller_.create_queue(squad, rules_.starting_action_points);
    if (!handle.valid()) {
        return Error(ErrorCode::Generic,
                     "failed to create action queue for squad " +
                         std::to_string(squad));
    }
    return handle;
}

Result<sim::AddActionResult> CombatService::enqueue(EntityId squad,
                                                    sim::Action action,
                                                    sim::ActionKind kind) {
    auto handle = queue_for(squad);
    if (!handle) return handle.error();

    auto* queue = controller_.get(handle.value());
    auto added = queue->add_action(std::move(action), rules_.cost_of(kind),
                                   kind);
    controller_.add_action_queue(handle.value());

    if (added == sim::AddActionResult::Deduplicated) {
        spdlog::debug("Squad {} already has a pending {} action", squad,
                      sim::action_kind_name(kind));
    }
    return added;
}

Result<sim::AddActionResult> CombatService::submit_move(
    EntityId squad, grid::GridPos destination) {
    auto gate = check_submission(squad, Need::Move);
    if (!gate) return gate.error();

    auto action = sim::Action::move(
        squad, destination, [this](EntityId actor, grid::GridPos dest) {
            auto moved = movement_.move_squad(actor, dest);
            if (moved) {
                record(actor, sim::ActionKind::Movement, true,
                       "moved to " + grid::to_string(dest));
            } else {
                record(actor, sim::ActionKind::Movement, false,
                       moved.error().message);
            }
        });
    return enqueue(squad, std::move(action), sim::ActionKind::Movement);
}

Result<sim::AddActionResult> CombatService::submit_attack(EntityId attacker,
                                                          EntityId defender,
                                                          sim::ActionKind kind) {
    auto gate = check_submission(attacker, Need::Act);
    if (!gate) return gate.error();

    auto action = sim::Action::attack(
        attacker, defender, [this, kind](EntityId a, EntityId d) {
            auto result = actions_.execute_attack(a, d);
            if (!result) {
                record(a, kind, false, result.error().message);
                return;
            }
            for (EntityId killed : result.value().squads_killed)
                pending_removals_.push_back(killed);
            record(a, kind, true,
                   std::to_string(result.value().total_damage) +
                       " damage to squad " + std::to_string(d));
        });
    return enqueue(attacker, std::move(action), kind);
}

Result<sim::AddActionResult> CombatService::submit_player_action(
    EntityId squad, grid::GridPos target, i32 param, sim::ActionKind kind,
    sim::PlayerActionFn behavior) {
    auto gate = check_submission(squad, Need::Act);
    if (!gate) return gate.error();

    auto action = sim::Action::player(
        squad, target, param,
        [this, kind, fn = std::move(behavior)](EntityId actor,
                                               grid::GridPos pos, i32 p) {
            if (fn) fn(actor, pos, p);
            auto marked = state_.mark_squad_as_acted(actor);
            record(actor, kind, marked.ok(),
                   marked ? std::string(sim::action_kind_name(kind)) + " at " +
                                grid::to_string(pos)
                          : marked.error().message);
        });
    return enqueue(squad, std::move(action), kind);
}

// --- Resolution ---

sim::QueueHandle CombatService::step() {
    auto handle = controller_.execute_first();
    flush_removals();
    return handle;
}

size_t CombatService::resolve_pending() {
    size_t steps = 0;
    controller_.clean_controller();
    while (controller_.registered_count() > 0) {
        step();
        ++steps;
        controller_.clean_controller();
    }
    return steps;
}

Result<void> CombatService::end_turn() {
    resolve_pending();

    auto ended = turns_.end_turn();
    if (!ended) return ended;
    if (turns_.current_round() > 0) last_round_ = turns_.current_round();

    EntityId next = turns_.current_faction();
    if (turns_.phase() != CombatPhase::Active || next == 0) return {};

    for (EntityId squad : factions_.faction_squads(next)) {
        auto handle = controller_.find_queue_for_entity(squad);
        if (handle.valid())
            controller_.restore_action_points(handle, rules_.action_point_regen);
    }
    spdlog::debug("Turn passes to {} (round {})", factions_.faction_name(next),
                  turns_.current_round());
    return {};
}

bool CombatService::advance_turn_if_exhausted() {
    EntityId faction = turns_.current_faction();
    if (faction == 0 || !turns_.is_faction_exhausted(faction)) return false;
    return end_turn().ok();
}

VictoryCheck CombatService::check_victory() const {
    VictoryCheck check;
    check.rounds_completed = last_round_;

    std::vector<EntityId> factions = turns_.turn_order();
    if (factions.empty()) factions = factions_.faction_ids();

    std::vector<EntityId> alive;
    for (EntityId faction : factions) {
        if (factions_.faction_has_squads(faction))
            alive.push_back(faction);
        else
            check.defeated.push_back(faction);
    }

    if (alive.size() > 1) {
        check.defeated.clear();
        return check;
    }

    check.battle_over = true;
    if (alive.size() == 1) {
        check.victor = alive.front();
        check.victor_name = factions_.faction_name(check.victor);
    }
    return check;
}

void CombatService::teardown() {
    if (turns_.phase() != CombatPhase::Inactive) {
        auto ended = turns_.end_combat();
        if (!ended) spdlog::warn("Combat teardown: {}", ended.error().message);
    }
    controller_.clear();
    index_.clear();
    state_.clear();
    pending_removals_.clear();
}

void CombatService::set_attack_resolver(AttackResolver resolver) {
    actions_.set_resolver(std::move(resolver));
}

void CombatService::record(EntityId squad, sim::ActionKind kind, bool ok,
                           std::string message) {
    if (ok)
        spdlog::debug("Squad {} {}: {}", squad, sim::action_kind_name(kind),
                      message);
    else
        spdlog::info("Squad {} {} failed: {}", squad,
                     sim::action_kind_name(kind), message);
    outcomes_.push_back({squad, kind, ok, std::move(message)});
}

void CombatService::flush_removals() {
    for (EntityId squad : pending_removals_)
        controller_.remove_action_queue_for_entity(squad);
    pending_removals_.clear();
}

CombatResult CombatService::flat_damage(EntityId attacker, EntityId defender) {
    CombatResult result;
    auto* target = registry_.find_squad(defender);
    if (!target) return result;

    result.total_damage = target->apply_damage(rules_.attack_damage);
    if (target->is_dead()) {
        result.target_destroyed = true;
        result.squads_killed.push_back(defender);
    }
    spdlog::debug("Squad {} hits squad {} for {}", attacker, defender,
                  result.total_damage);
    return result;
}

} // namespace otc::combat

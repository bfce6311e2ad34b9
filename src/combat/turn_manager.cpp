#include "combat/turn_manager.hpp"
#include "combat/combat_state.hpp"
#include "combat/faction_manager.hpp"
#include "combat/movement_system.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace otc::combat {

namespace {
const std::vector<EntityId> kNoTurnOrder;
}

TurnManager::TurnManager(CombatState& state, const FactionManager& factions,
                         const MovementSystem& movement, u32 seed)
    : state_(state),
      factions_(factions),
      movement_(movement),
      rng_(seed != 0 ? seed : std::random_device{}()) {}

Result<void> TurnManager::initialize_combat(
    const std::vector<EntityId>& faction_ids) {
    if (phase_ != CombatPhase::Inactive) {
        return Error(ErrorCode::InvalidState,
                     std::string("combat already ") +
                         combat_phase_name(phase_));
    }
    if (faction_ids.empty()) {
        return Error(ErrorCode::InvalidState, "no factions to fight");
    }

    TurnState turn;
    turn.combat_active = true;
    turn.current_round = 1;
    turn.turn_order = faction_ids;
    turn.current_turn_index = 0;
    shuffle_faction_order(turn.turn_order);

    for (EntityId faction : faction_ids) {
        for (EntityId squad : state_.squads_for_faction(faction))
            state_.ensure_action_state(squad);
    }

    EntityId first = turn.turn_order.front();
    state_.set_turn_state(std::move(turn));
    phase_ = CombatPhase::Active;

    spdlog::info("Combat started with {} factions, {} goes first",
                 faction_ids.size(), factions_.faction_name(first));
    return reset_squad_actions(first);
}

EntityId TurnManager::current_faction() const {
    const auto* turn = state_.turn_state();
    if (!turn || phase_ == CombatPhase::Inactive) return 0;
    if (turn->current_turn_index >= turn->turn_order.size()) return 0;
    return turn->turn_order[turn->current_turn_index];
}

i32 TurnManager::current_round() const {
    const auto* turn = state_.turn_state();
    return turn ? turn->current_round : 0;
}

const std::vector<EntityId>& TurnManager::turn_order() const {
    const auto* turn = state_.turn_state();
    return turn ? turn->turn_order : kNoTurnOrder;
}

Result<void> TurnManager::reset_squad_actions(EntityId faction) {
    for (EntityId squad : state_.squads_for_faction(faction)) {
        auto* action_state = state_.find_action_state(squad);
        if (!action_state) continue;

        action_state->has_acted = false;
        action_state->has_moved = false;
        action_state->movement_remaining = movement_.squad_movement_speed(squad);
    }
    return {};
}

bool TurnManager::is_squad_activatable(EntityId squad) const {
    EntityId faction = current_faction();
    if (faction == 0 || phase_ != CombatPhase::Active) return false;
    if (state_.faction_owner(squad) != faction) return false;
    return state_.can_squad_act(squad);
}

bool TurnManager::is_squad_exhausted(EntityId squad) const {
    const auto* action_state = state_.find_action_state(squad);
    if (!action_state) return true;
    return action_state->has_acted && action_state->movement_remaining == 0;
}

bool TurnManager::is_faction_exhausted(EntityId faction) const {
    for (EntityId squad : factions_.faction_squads(faction)) {
        if (!is_squad_exhausted(squad)) return false;
    }
    return true;
}

Result<void> TurnManager::end_turn() {
    auto* turn = state_.turn_state();
    if (!turn || phase_ != CombatPhase::Active) {
        return Error(ErrorCode::InvalidState, "no active combat");
    }

    turn->current_turn_index++;

    if (turn->current_turn_index >= turn->turn_order.size()) {
        if (factions_with_squads() < 2) {
            turn->current_turn_index = 0;
            turn->combat_active = false;
            phase_ = CombatPhase::Resolving;
            spdlog::info("Combat resolving after round {}",
                         turn->current_round);
            return {};
        }
        turn->current_turn_index = 0;
        turn->current_round++;
        spdlog::debug("Round {} begins", turn->current_round);
    }

    EntityId next = turn->turn_order[turn->current_turn_index];
    auto reset = reset_squad_actions(next);
    if (!reset) {
        return Error(reset.error().code, "failed to reset squad actions: " +
                                             reset.error().message);
    }
    return {};
}

bool TurnManager::advance_if_exhausted() {
    EntityId faction = current_faction();
    if (faction == 0 || phase_ != CombatPhase::Active) return false;
    if (!is_faction_exhausted(faction)) return false;
    return end_turn().ok();
}

Result<void> TurnManager::finish_resolution() {
    if (phase_ != CombatPhase::Resolving) {
        return Error(ErrorCode::InvalidState,
                     std::string("cannot finish resolution while ") +
                         combat_phase_name(phase_));
    }
    phase_ = CombatPhase::Inactive;
    state_.clear_turn_state();
    return {};
}

Result<void> TurnManager::end_combat() {
    if (phase_ == CombatPhase::Inactive) {
        return Error(ErrorCode::InvalidState, "no active combat to end");
    }
    if (auto* turn = state_.turn_state()) turn->combat_active = false;
    phase_ = CombatPhase::Inactive;
    state_.clear_turn_state();
    return {};
}

void TurnManager::shuffle_faction_order(std::vector<EntityId>& ids) {
    // Fisher-Yates
    for (size_t i = ids.size(); i > 1; --i) {
        std::uniform_int_distribution<size_t> dist(0, i - 1);
        size_t j = dist(rng_);
        std::swap(ids[i - 1], ids[j]);
    }
}

size_t TurnManager::factions_with_squads() const {
    size_t count = 0;
    for (EntityId faction : turn_order()) {
        if (factions_.faction_has_squads(faction)) ++count;
    }
    return count;
}

} // namespace otc::combat

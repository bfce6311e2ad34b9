#include "sim/action.hpp"

#include <spdlog/spdlog.h>

namespace otc::sim {

const char* action_type_name(ActionType type) {
    switch (type) {
        case ActionType::Movement: return "Movement";
        case ActionType::SingleTargetAttack: return "SingleTargetAttack";
        case ActionType::PlayerAction: return "PlayerAction";
    }
    return "Unknown";
}

Action Action::move(EntityId actor, grid::GridPos destination,
                    MoveFn behavior) {
    return Action(MoveAction{actor, destination, std::move(behavior)});
}

Action Action::attack(EntityId attacker, EntityId defender,
                      AttackFn behavior) {
    return Action(AttackAction{attacker, defender, std::move(behavior)});
}

Action Action::player(EntityId actor, grid::GridPos target, i32 param,
                      PlayerActionFn behavior) {
    return Action(PlayerAction{actor, target, param, std::move(behavior)});
}

EntityId Action::actor() const {
    switch (type()) {
        case ActionType::Movement: return std::get<MoveAction>(data_).actor;
        case ActionType::SingleTargetAttack:
            return std::get<AttackAction>(data_).attacker;
        case ActionType::PlayerAction:
            return std::get<PlayerAction>(data_).actor;
    }
    return 0;
}

void Action::execute() const {
    switch (type()) {
        case ActionType::Movement: {
            const auto& a = std::get<MoveAction>(data_);
            if (!a.behavior) break;
            a.behavior(a.actor, a.destination);
            return;
        }
        case ActionType::SingleTargetAttack: {
            const auto& a = std::get<AttackAction>(data_);
            if (!a.behavior) break;
            a.behavior(a.attacker, a.defender);
            return;
        }
        case ActionType::PlayerAction: {
            const auto& a = std::get<PlayerAction>(data_);
            if (!a.behavior) break;
            a.behavior(a.actor, a.target, a.param);
            return;
        }
    }
    spdlog::warn("{} action for entity {} has no behavior, skipping",
                 action_type_name(type()), actor());
}

} // namespace otc::sim

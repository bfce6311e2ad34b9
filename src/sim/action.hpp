#pragma once

#include "core/types.hpp"
#include "grid/grid_pos.hpp"

#include <functional>
#include <variant>

namespace otc::sim {

enum class ActionType : u8 {
    Movement = 0,
    SingleTargetAttack = 1,
    PlayerAction = 2,
};

const char* action_type_name(ActionType type);

using MoveFn = std::function<void(EntityId actor, grid::GridPos destination)>;
using AttackFn = std::function<void(EntityId attacker, EntityId defender)>;
using PlayerActionFn =
    std::function<void(EntityId actor, grid::GridPos target, i32 param)>;

struct MoveAction {
    EntityId actor = 0;
    grid::GridPos destination;
    MoveFn behavior;
};

struct AttackAction {
    EntityId attacker = 0;
    EntityId defender = 0;
    AttackFn behavior;
};

/// Item pickups, abilities and other player-issued commands that need a
/// target cell plus one free parameter (item slot, ability index, ...).
struct PlayerAction {
    EntityId actor = 0;
    grid::GridPos target;
    i32 param = 0;
    PlayerActionFn behavior;
};

/// One pending command. Built once, executed at most once by the queue that
/// owns it, then dropped.
class Action {
public:
    static Action move(EntityId actor, grid::GridPos destination,
                       MoveFn behavior);
    static Action attack(EntityId attacker, EntityId defender,
                         AttackFn behavior);
    static Action player(EntityId actor, grid::GridPos target, i32 param,
                         PlayerActionFn behavior);

    ActionType type() const { return static_cast<ActionType>(data_.index()); }

    /// Entity the action is performed by.
    EntityId actor() const;

    /// Invoke the embedded behavior with the embedded arguments.
    /// A missing behavior logs a warning and does nothing.
    void execute() const;

    const MoveAction* as_move() const { return std::get_if<MoveAction>(&data_); }
    const AttackAction* as_attack() const {
        return std::get_if<AttackAction>(&data_);
    }
    const PlayerAction* as_player() const {
        return std::get_if<PlayerAction>(&data_);
    }

private:
    // Alternative order must match ActionType
    using Data = std::variant<MoveAction, AttackAction, PlayerAction>;

    explicit Action(Data data) : data_(std::move(data)) {}

    Data data_;
};

} // namespace otc::sim

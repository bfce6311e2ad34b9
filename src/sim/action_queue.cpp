#include "sim/action_queue.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace otc::sim {

const char* action_kind_name(ActionKind kind) {
    switch (kind) {
        case ActionKind::Movement: return "Movement";
        case ActionKind::Attack: return "Attack";
        case ActionKind::MeleeAttack: return "MeleeAttack";
        case ActionKind::RangedAttack: return "RangedAttack";
        case ActionKind::PickupItem: return "PickupItem";
    }
    return "Unknown";
}

ActionQueue::ActionQueue(EntityId owner, i32 action_points)
    : owner_(owner), total_action_points_(action_points) {}

AddActionResult ActionQueue::add_action(Action action, i32 cost,
                                        ActionKind kind) {
    if (cost <= 0) {
        spdlog::error("ActionQueue {}: rejected {} action with cost {}",
                      owner_, action_kind_name(kind), cost);
        throw std::invalid_argument("action cost must be positive, got " +
                                    std::to_string(cost));
    }

    if (has_kind(kind)) return AddActionResult::Deduplicated;

    entries_.push_back(QueuedAction{std::move(action), cost, kind});
    return AddActionResult::Accepted;
}

void ActionQueue::execute_action() {
    if (entries_.empty()) return;

    // deque keeps element addresses stable if the behavior queues more work
    const QueuedAction& head = entries_.front();
    total_action_points_ -= head.cost;
    head.action.execute();
    pop();
}

void ActionQueue::pop() {
    if (!entries_.empty()) entries_.pop_front();
}

bool ActionQueue::has_kind(ActionKind kind) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [kind](const QueuedAction& e) { return e.kind == kind; });
}

} // namespace otc::sim

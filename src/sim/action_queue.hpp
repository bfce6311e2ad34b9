#pragma once

#include "core/types.hpp"
#include "sim/action.hpp"

#include <deque>

namespace otc::sim {

/// Category tag used to keep at most one pending action of each sort.
enum class ActionKind : u8 {
    Movement = 0,
    Attack = 1,
    MeleeAttack = 2,
    RangedAttack = 3,
    PickupItem = 4,
};

constexpr size_t ACTION_KIND_COUNT = 5;

const char* action_kind_name(ActionKind kind);

enum class AddActionResult : u8 {
    Accepted,
    Deduplicated, // same kind already pending; the new action was dropped
};

struct QueuedAction {
    Action action;
    i32 cost;
    ActionKind kind;
};

/// Pending actions for one actor plus its action-point ledger.
///
/// Points are deducted when an action executes, not when it is queued, and
/// are allowed to go negative: an actor in debt simply sorts behind everyone
/// else until points are restored.
class ActionQueue {
public:
    explicit ActionQueue(EntityId owner = 0, i32 action_points = 0);

    EntityId owner() const { return owner_; }

    i32 total_action_points() const { return total_action_points_; }
    void set_total_action_points(i32 points) { total_action_points_ = points; }
    void restore_action_points(i32 amount) { total_action_points_ += amount; }

    /// Append an action. A kind that is already pending is dropped and
    /// Deduplicated is returned.
    /// Throws std::invalid_argument if cost <= 0; the queue is left untouched.
    AddActionResult add_action(Action action, i32 cost, ActionKind kind);

    /// Deduct the head's cost, run it, then pop it. No-op when empty.
    /// A behavior must not pop its own queue.
    void execute_action();

    /// Drop the head entry. No-op when empty.
    void pop();

    /// Drop every pending entry; the point total is kept.
    void reset_queue() { entries_.clear(); }

    size_t num_actions() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    bool has_kind(ActionKind kind) const;

    /// Head entry, or nullptr when empty.
    const QueuedAction* front() const {
        return entries_.empty() ? nullptr : &entries_.front();
    }

private:
    EntityId owner_;
    i32 total_action_points_;
    std::deque<QueuedAction> entries_;
};

} // namespace otc::sim

#pragma once

#include "core/types.hpp"
#include "sim/action_queue.hpp"

#include <memory>
#include <vector>

namespace otc::sim {

/// Stable reference to a queue owned by an ActionController.
/// A handle goes stale when its queue is destroyed; stale handles never
/// resolve to a different queue that later reuses the slot.
struct QueueHandle {
    u32 index = 0;
    u32 generation = 0; // 0 = invalid

    bool valid() const { return generation != 0; }
    bool operator==(const QueueHandle& o) const {
        return index == o.index && generation == o.generation;
    }
    bool operator!=(const QueueHandle& o) const { return !(*this == o); }
};

/// Schedules actors by banked action points.
///
/// Owns every ActionQueue of one combat. Registered queues are kept sorted
/// by total action points, highest first. Equal totals go to the queue with
/// the larger index in the order as it stood before the sort, so a fresh
/// registration (appended last) wins its tie and repeated ties alternate.
/// The order is recomputed after every registration, every executed step
/// and every point restore.
///
/// Cleanup contract: clean_controller() only unregisters queues, it never
/// destroys them, so a queue dropped while empty keeps its handle and can be
/// registered again when new actions arrive.
class ActionController {
public:
    ActionController();
    ~ActionController();

    ActionController(const ActionController&) = delete;
    ActionController& operator=(const ActionController&) = delete;

    // --- Queue ownership ---
    QueueHandle create_queue(EntityId owner, i32 action_points);

    /// Unregister and free a queue. Returns false for stale handles.
    bool destroy_queue(QueueHandle handle);

    /// Resolve a handle. Returns nullptr if stale.
    ActionQueue* get(QueueHandle handle);
    const ActionQueue* get(QueueHandle handle) const;

    /// Handle of the live queue owned by an entity, or an invalid handle.
    QueueHandle find_queue_for_entity(EntityId owner) const;

    // --- Scheduling ---

    /// Register a queue if it is not registered yet, then re-sort.
    /// Returns false for stale or already registered handles.
    bool add_action_queue(QueueHandle handle);

    /// Unregister every queue with no pending actions. Relative order of
    /// the remaining queues is preserved.
    void clean_controller();

    /// Run the head action of the highest priority queue (nothing happens
    /// if that queue is empty) and re-sort. Returns the queue that was
    /// stepped, or an invalid handle if nothing is registered.
    QueueHandle execute_first();

    /// Unregister and destroy the queue owned by an entity (death/despawn).
    void remove_action_queue_for_entity(EntityId owner);

    /// Give every registered queue `amount` more points, then re-sort.
    void restore_action_points(i32 amount);

    /// Give one queue `amount` more points, then re-sort. Works whether or
    /// not the queue is registered.
    bool restore_action_points(QueueHandle handle, i32 amount);

    /// Drop pending actions from every registered queue.
    void reset_action_manager();

    bool is_registered(QueueHandle handle) const;
    size_t registered_count() const { return order_.size(); }
    size_t queue_count() const { return live_count_; }

    /// Registered queues in execution order.
    const std::vector<QueueHandle>& order() const { return order_; }

    /// Any registered queue with pending actions?
    bool has_pending_actions() const;

    /// Destroy every queue (combat teardown). All handles go stale.
    void clear();

    void debug_output() const;

private:
    struct Slot {
        std::unique_ptr<ActionQueue> queue;
        u32 generation = 1;
        bool registered = false;
    };

    Slot* slot_for(QueueHandle handle);
    const Slot* slot_for(QueueHandle handle) const;
    void reorder_actions();
    void unregister(QueueHandle handle);

    std::vector<Slot> slots_;
    std::vector<u32> free_slots_;
    std::vector<QueueHandle> order_;
    size_t live_count_ = 0;
};

} // namespace otc::sim

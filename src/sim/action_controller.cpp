#include "sim/action_controller.hpp"

#include <algorithm>
#include <numeric>
#include <spdlog/spdlog.h>

namespace otc::sim {

ActionController::ActionController() = default;
ActionController::~ActionController() = default;

QueueHandle ActionController::create_queue(EntityId owner, i32 action_points) {
    u32 index;
    if (!free_slots_.empty()) {
        index = free_slots_.back();
        free_slots_.pop_back();
    } else {
        index = static_cast<u32>(slots_.size());
        slots_.emplace_back();
    }

    auto& slot = slots_[index];
    slot.queue = std::make_unique<ActionQueue>(owner, action_points);
    slot.registered = false;
    ++live_count_;
    return QueueHandle{index, slot.generation};
}

bool ActionController::destroy_queue(QueueHandle handle) {
    auto* slot = slot_for(handle);
    if (!slot) return false;

    unregister(handle);
    slot->queue.reset();
    slot->registered = false;
    // Skip 0 on wrap so a recycled slot never looks invalid
    if (++slot->generation == 0) slot->generation = 1;
    free_slots_.push_back(handle.index);
    --live_count_;
    return true;
}

ActionController::Slot* ActionController::slot_for(QueueHandle handle) {
    if (!handle.valid() || handle.index >= slots_.size()) return nullptr;
    auto& slot = slots_[handle.index];
    if (slot.generation != handle.generation || !slot.queue) return nullptr;
    return &slot;
}

const ActionController::Slot* ActionController::slot_for(
    QueueHandle handle) const {
    if (!handle.valid() || handle.index >= slots_.size()) return nullptr;
    const auto& slot = slots_[handle.index];
    if (slot.generation != handle.generation || !slot.queue) return nullptr;
    return &slot;
}

ActionQueue* ActionController::get(QueueHandle handle) {
    auto* slot = slot_for(handle);
    return slot ? slot->queue.get() : nullptr;
}

const ActionQueue* ActionController::get(QueueHandle handle) const {
    const auto* slot = slot_for(handle);
    return slot ? slot->queue.get() : nullptr;
}

QueueHandle ActionController::find_queue_for_entity(EntityId owner) const {
    for (u32 i = 0; i < slots_.size(); ++i) {
        const auto& slot = slots_[i];
        if (slot.queue && slot.queue->owner() == owner)
            return QueueHandle{i, slot.generation};
    }
    return {};
}

bool ActionController::add_action_queue(QueueHandle handle) {
    auto* slot = slot_for(handle);
    if (!slot || slot->registered) return false;

    slot->registered = true;
    order_.push_back(handle);
    reorder_actions();
    return true;
}

void ActionController::clean_controller() {
    std::vector<QueueHandle> remaining;
    remaining.reserve(order_.size());
    for (const auto& handle : order_) {
        auto* slot = slot_for(handle);
        if (slot && slot->queue->num_actions() > 0) {
            remaining.push_back(handle);
        } else if (slot) {
            slot->registered = false;
        }
    }
    order_ = std::move(remaining);
}

QueueHandle ActionController::execute_first() {
    if (order_.empty()) return {};

    QueueHandle head = order_.front();
    if (auto* queue = get(head)) queue->execute_action();
    reorder_actions();
    return head;
}

void ActionController::remove_action_queue_for_entity(EntityId owner) {
    auto handle = find_queue_for_entity(owner);
    if (handle.valid()) destroy_queue(handle);
}

void ActionController::restore_action_points(i32 amount) {
    for (const auto& handle : order_) {
        if (auto* queue = get(handle)) queue->restore_action_points(amount);
    }
    reorder_actions();
}

bool ActionController::restore_action_points(QueueHandle handle, i32 amount) {
    auto* queue = get(handle);
    if (!queue) return false;
    queue->restore_action_points(amount);
    reorder_actions();
    return true;
}

void ActionController::reset_action_manager() {
    for (const auto& handle : order_) {
        if (auto* queue = get(handle)) queue->reset_queue();
    }
}

bool ActionController::is_registered(QueueHandle handle) const {
    const auto* slot = slot_for(handle);
    return slot && slot->registered;
}

bool ActionController::has_pending_actions() const {
    return std::any_of(order_.begin(), order_.end(),
                       [this](const QueueHandle& h) {
                           const auto* q = get(h);
                           return q && q->num_actions() > 0;
                       });
}

void ActionController::clear() {
    order_.clear();
    free_slots_.clear();
    for (u32 i = 0; i < slots_.size(); ++i) {
        auto& slot = slots_[i];
        if (slot.queue) {
            slot.queue.reset();
            if (++slot.generation == 0) slot.generation = 1;
        }
        slot.registered = false;
        free_slots_.push_back(i);
    }
    live_count_ = 0;
}

void ActionController::debug_output() const {
    for (size_t i = 0; i < order_.size(); ++i) {
        const auto* queue = get(order_[i]);
        if (!queue) continue;
        spdlog::debug("ActionController[{}]: owner={} points={} pending={}", i,
                      queue->owner(), queue->total_action_points(),
                      queue->num_actions());
    }
}

void ActionController::unregister(QueueHandle handle) {
    order_.erase(std::remove(order_.begin(), order_.end(), handle),
                 order_.end());
    if (auto* slot = slot_for(handle)) slot->registered = false;
}

void ActionController::reorder_actions() {
    // Ties: the later position in the pre-sort order goes first
    std::vector<size_t> positions(order_.size());
    std::iota(positions.begin(), positions.end(), size_t{0});
    std::sort(positions.begin(), positions.end(),
              [this](size_t a, size_t b) {
                  i32 pa = slots_[order_[a].index].queue->total_action_points();
                  i32 pb = slots_[order_[b].index].queue->total_action_points();
                  if (pa != pb) return pa > pb;
                  return a > b;
              });

    std::vector<QueueHandle> sorted;
    sorted.reserve(order_.size());
    for (size_t pos : positions)
        sorted.push_back(order_[pos]);
    order_ = std::move(sorted);
}

} // namespace otc::sim

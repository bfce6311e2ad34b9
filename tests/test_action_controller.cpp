#include <catch2/catch_test_macros.hpp>
#include "sim/action_controller.hpp"

#include <string>
#include <vector>

using namespace otc;
using namespace otc::sim;

namespace {

/// Queue an action that logs "<owner>:<tag>" when it runs.
void queue_logged(ActionController& controller, QueueHandle handle,
                  ActionKind kind, i32 cost, std::vector<std::string>& log,
                  const std::string& tag) {
    auto* queue = controller.get(handle);
    REQUIRE(queue != nullptr);
    EntityId owner = queue->owner();
    queue->add_action(Action::attack(owner, 0,
                                     [&log, tag](EntityId, EntityId) {
                                         log.push_back(tag);
                                     }),
                      cost, kind);
}

} // namespace

TEST_CASE("ActionController orders by points, newest first on ties",
          "[controller]") {
    ActionController controller;
    std::vector<std::string> log;

    auto a = controller.create_queue(1, 10);
    auto b = controller.create_queue(2, 10);
    auto c = controller.create_queue(3, 5);
    queue_logged(controller, a, ActionKind::Attack, 1, log, "a");
    queue_logged(controller, b, ActionKind::Attack, 1, log, "b");
    queue_logged(controller, c, ActionKind::Attack, 1, log, "c");

    REQUIRE(controller.add_action_queue(a));
    REQUIRE(controller.add_action_queue(b));
    REQUIRE(controller.add_action_queue(c));

    auto order = controller.order();
    REQUIRE(order.size() == 3);
    CHECK(order[0] == b);
    CHECK(order[1] == a);
    CHECK(order[2] == c);

    CHECK(controller.execute_first() == b);
    REQUIRE(log.size() == 1);
    CHECK(log[0] == "b");
}

TEST_CASE("ActionController registers a queue only once", "[controller]") {
    ActionController controller;
    auto a = controller.create_queue(1, 10);

    CHECK(controller.add_action_queue(a));
    CHECK_FALSE(controller.add_action_queue(a));
    CHECK(controller.registered_count() == 1);
    CHECK(controller.is_registered(a));
}

TEST_CASE("ActionController higher points run first, then tie-break",
          "[controller]") {
    ActionController controller;
    std::vector<std::string> log;

    auto a = controller.create_queue(1, 20);
    auto b = controller.create_queue(2, 15);
    queue_logged(controller, a, ActionKind::Movement, 5, log, "a-move");
    queue_logged(controller, b, ActionKind::Attack, 8, log, "b-attack");
    controller.add_action_queue(a);
    controller.add_action_queue(b);

    CHECK(controller.execute_first() == a);
    CHECK(controller.get(a)->total_action_points() == 15);
    CHECK(controller.get(a)->empty());
    CHECK(controller.get(b)->num_actions() == 1);

    // 15 == 15: b registered later, so it goes first
    CHECK(controller.execute_first() == b);
    CHECK(controller.get(b)->total_action_points() == 7);

    REQUIRE(log.size() == 2);
    CHECK(log[0] == "a-move");
    CHECK(log[1] == "b-attack");
}

TEST_CASE("ActionController head queue empty is a no-op step",
          "[controller]") {
    ActionController controller;
    auto a = controller.create_queue(1, 50);
    controller.add_action_queue(a);

    CHECK(controller.execute_first() == a);
    CHECK(controller.get(a)->total_action_points() == 50);

    ActionController empty;
    CHECK_FALSE(empty.execute_first().valid());
}

TEST_CASE("ActionController clean drops only empty queues", "[controller]") {
    ActionController controller;
    std::vector<std::string> log;

    auto a = controller.create_queue(1, 40);
    auto b = controller.create_queue(2, 30);
    auto c = controller.create_queue(3, 20);
    auto d = controller.create_queue(4, 10);
    queue_logged(controller, a, ActionKind::Attack, 1, log, "a");
    queue_logged(controller, c, ActionKind::Attack, 1, log, "c");
    for (auto h : {a, b, c, d})
        controller.add_action_queue(h);

    controller.clean_controller();

    auto order = controller.order();
    REQUIRE(order.size() == 2);
    CHECK(order[0] == a);
    CHECK(order[1] == c);

    // Unregistered queues stay alive and can come back
    CHECK_FALSE(controller.is_registered(b));
    REQUIRE(controller.get(b) != nullptr);
    queue_logged(controller, b, ActionKind::Attack, 1, log, "b");
    CHECK(controller.add_action_queue(b));
    CHECK(controller.registered_count() == 3);
    CHECK(controller.queue_count() == 4);
}

TEST_CASE("ActionController stale handles resolve to nothing",
          "[controller]") {
    ActionController controller;
    auto a = controller.create_queue(1, 10);
    controller.add_action_queue(a);

    REQUIRE(controller.destroy_queue(a));
    CHECK(controller.get(a) == nullptr);
    CHECK_FALSE(controller.is_registered(a));
    CHECK(controller.registered_count() == 0);
    CHECK_FALSE(controller.destroy_queue(a));
    CHECK_FALSE(controller.add_action_queue(a));

    // The slot is reused under a new generation
    auto b = controller.create_queue(2, 10);
    CHECK(b.index == a.index);
    CHECK(b != a);
    CHECK(controller.get(a) == nullptr);
    REQUIRE(controller.get(b) != nullptr);
    CHECK(controller.get(b)->owner() == 2);
}

TEST_CASE("ActionController per-entity and bulk operations",
          "[controller]") {
    ActionController controller;
    std::vector<std::string> log;

    auto a = controller.create_queue(1, 10);
    auto b = controller.create_queue(2, 20);
    queue_logged(controller, a, ActionKind::Attack, 1, log, "a");
    queue_logged(controller, b, ActionKind::Attack, 1, log, "b");
    controller.add_action_queue(a);
    controller.add_action_queue(b);

    CHECK(controller.find_queue_for_entity(2) == b);
    CHECK_FALSE(controller.find_queue_for_entity(99).valid());

    controller.restore_action_points(5);
    CHECK(controller.get(a)->total_action_points() == 15);
    CHECK(controller.get(b)->total_action_points() == 25);

    // Lift a above b
    REQUIRE(controller.restore_action_points(a, 20));
    CHECK(controller.order().front() == a);

    CHECK(controller.has_pending_actions());
    controller.reset_action_manager();
    CHECK_FALSE(controller.has_pending_actions());

    controller.remove_action_queue_for_entity(1);
    CHECK(controller.get(a) == nullptr);
    CHECK(controller.registered_count() == 1);

    controller.clear();
    CHECK(controller.get(b) == nullptr);
    CHECK(controller.queue_count() == 0);
    CHECK(controller.registered_count() == 0);
    CHECK(log.empty());
}

TEST_CASE("ActionController ties follow the previous order, later first",
          "[controller]") {
    ActionController controller;

    auto a = controller.create_queue(1, 10);
    auto b = controller.create_queue(2, 10);
    auto d = controller.create_queue(4, 30);

    controller.add_action_queue(a);
    controller.add_action_queue(b);
    REQUIRE(controller.order().size() == 2);
    CHECK(controller.order()[0] == b);
    CHECK(controller.order()[1] == a);

    // Before this sort the order is [b, a, d]; the tied pair flips
    controller.add_action_queue(d);
    auto order = controller.order();
    REQUIRE(order.size() == 3);
    CHECK(order[0] == d);
    CHECK(order[1] == a);
    CHECK(order[2] == b);

    // An empty head step re-sorts again and the tie flips back
    CHECK(controller.execute_first() == d);
    order = controller.order();
    CHECK(order[0] == d);
    CHECK(order[1] == b);
    CHECK(order[2] == a);
}

#include <catch2/catch_test_macros.hpp>
#include "sim/entity_registry.hpp"
#include "sim/faction.hpp"
#include "sim/squad.hpp"

#include <memory>

using namespace otc;
using namespace otc::sim;

TEST_CASE("EntityRegistry hands out unique ids", "[sim]") {
    EntityRegistry registry;

    auto squad = std::make_unique<Squad>();
    squad->set_name("Alpha");
    EntityId a = registry.register_entity(std::move(squad));
    EntityId f = registry.register_entity(std::make_unique<Faction>());

    CHECK(a != 0);
    CHECK(f != a);
    CHECK(registry.count() == 2);

    REQUIRE(registry.find_squad(a) != nullptr);
    CHECK(registry.find_squad(a)->name() == "Alpha");
    CHECK(registry.find_squad(a)->entity_id() == a);
    CHECK(registry.find_faction(a) == nullptr);
    CHECK(registry.find_faction(f) != nullptr);
    CHECK(registry.find_squad(f) == nullptr);

    registry.unregister_entity(a);
    CHECK(registry.find(a) == nullptr);

    // Ids are not reused
    EntityId b = registry.register_entity(std::make_unique<Squad>());
    CHECK(b != a);
}

TEST_CASE("EntityRegistry lists live squads only", "[sim]") {
    EntityRegistry registry;
    EntityId a = registry.register_entity(std::make_unique<Squad>());
    EntityId b = registry.register_entity(std::make_unique<Squad>());
    registry.register_entity(std::make_unique<Faction>());

    registry.find_squad(a)->mark_destroyed();
    auto ids = registry.squad_ids();
    REQUIRE(ids.size() == 1);
    CHECK(ids[0] == b);

    int squads = 0;
    registry.for_each([&](const Entity& e) {
        if (e.is_squad()) ++squads;
    });
    CHECK(squads == 2);
}

TEST_CASE("Squad damage clamps at zero health", "[sim]") {
    Squad squad;
    CHECK(squad.health() == 100);
    CHECK(squad.apply_damage(30) == 30);
    CHECK(squad.health() == 70);
    CHECK(squad.apply_damage(-5) == 0);
    CHECK(squad.apply_damage(500) == 70);
    CHECK(squad.health() == 0);
    CHECK(squad.is_dead());
    CHECK(squad.apply_damage(10) == 0);
}

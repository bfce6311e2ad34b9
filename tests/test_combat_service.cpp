#include <catch2/catch_test_macros.hpp>
#include "combat/combat_service.hpp"
#include "sim/entity_registry.hpp"
#include "sim/squad.hpp"

#include <memory>

using namespace otc;
using namespace otc::combat;

namespace {

struct Skirmish {
    sim::EntityRegistry registry;
    CombatRules rules;
    std::unique_ptr<CombatService> combat;
    EntityId red = 0;
    EntityId blue = 0;

    Skirmish() {
        rules.seed = 99;
        rules.grid_width = 10;
        rules.grid_height = 10;
        combat = std::make_unique<CombatService>(registry, rules);
        red = combat->create_faction("Red", true);
        blue = combat->create_faction("Blue", false);
    }

    EntityId squad(EntityId faction, grid::GridPos pos, i32 health = 100) {
        auto s = std::make_unique<sim::Squad>();
        s->set_health(health);
        EntityId id = registry.register_entity(std::move(s));
        REQUIRE(combat->place_squad(faction, id, pos).ok());
        return id;
    }

    EntityId current() const { return combat->turns().current_faction(); }
};

} // namespace

TEST_CASE("CombatService refuses commands outside an active combat",
          "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {0, 0});

    auto queued = s.combat->submit_move(r, {1, 1});
    REQUIRE_FALSE(queued.ok());
    CHECK(queued.error().code == ErrorCode::InvalidState);
    CHECK(s.combat->controller().queue_count() == 0);
}

TEST_CASE("CombatService only accepts the current faction's squads",
          "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {0, 0});
    EntityId b = s.squad(s.blue, {9, 9});
    REQUIRE(s.combat->start_combat().ok());

    EntityId mine = s.current() == s.red ? r : b;
    EntityId theirs = mine == r ? b : r;

    auto refused = s.combat->submit_move(theirs, {5, 5});
    REQUIRE_FALSE(refused.ok());
    CHECK(refused.error().code == ErrorCode::NotPermitted);

    auto accepted = s.combat->submit_attack(mine, theirs);
    REQUIRE(accepted.ok());
    CHECK(accepted.value() == sim::AddActionResult::Accepted);

    auto duplicate = s.combat->submit_attack(mine, theirs);
    REQUIRE(duplicate.ok());
    CHECK(duplicate.value() == sim::AddActionResult::Deduplicated);

    auto handle = s.combat->controller().find_queue_for_entity(mine);
    REQUIRE(handle.valid());
    CHECK(s.combat->controller().is_registered(handle));
    CHECK(s.combat->controller().get(handle)->num_actions() == 1);
    CHECK(s.combat->controller().get(handle)->total_action_points() ==
          s.rules.starting_action_points);

    auto unknown = s.combat->submit_move(999, {1, 1});
    REQUIRE_FALSE(unknown.ok());
    CHECK(unknown.error().code == ErrorCode::NotFound);
}

TEST_CASE("CombatService moves squads when the queue resolves", "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {0, 0});
    EntityId b = s.squad(s.blue, {9, 9});
    REQUIRE(s.combat->start_combat().ok());

    EntityId mine = s.current() == s.red ? r : b;
    grid::GridPos from = s.combat->movement().squad_position(mine).value();
    grid::GridPos to{from.x == 0 ? 2 : 7, from.y == 0 ? 2 : 7};

    REQUIRE(s.combat->submit_move(mine, to).ok());
    // Nothing moves until the controller runs
    CHECK(s.combat->index().entity_at(from) == mine);

    CHECK(s.combat->resolve_pending() == 1);
    CHECK(s.combat->index().entity_at(from) == 0);
    CHECK(s.combat->index().entity_at(to) == mine);

    const auto* record = s.combat->state().find_action_state(mine);
    REQUIRE(record != nullptr);
    CHECK(record->has_moved);
    CHECK(record->movement_remaining == 1);

    auto handle = s.combat->controller().find_queue_for_entity(mine);
    CHECK(s.combat->controller().get(handle)->total_action_points() ==
          s.rules.starting_action_points -
              s.rules.cost_of(sim::ActionKind::Movement));
    CHECK_FALSE(s.combat->controller().is_registered(handle));

    REQUIRE(s.combat->outcomes().size() == 1);
    CHECK(s.combat->outcomes()[0].ok);
    CHECK(s.combat->outcomes()[0].kind == sim::ActionKind::Movement);

    SECTION("a move beyond the remaining budget fails when it runs") {
        grid::GridPos far{to.x == 2 ? 6 : 3, to.y};
        REQUIRE(s.combat->submit_move(mine, far).ok());
        s.combat->resolve_pending();
        REQUIRE(s.combat->outcomes().size() == 2);
        CHECK_FALSE(s.combat->outcomes()[1].ok);
        CHECK(s.combat->index().entity_at(to) == mine);
    }
}

TEST_CASE("CombatService attack kills and clears the target", "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {4, 4}, 10);
    EntityId b = s.squad(s.blue, {5, 5}, 10);
    REQUIRE(s.combat->start_combat().ok());

    EntityId mine = s.current() == s.red ? r : b;
    EntityId theirs = mine == r ? b : r;

    // Give the target a queue so its removal can be observed
    s.combat->controller().create_queue(theirs, 10);

    REQUIRE(s.combat->submit_attack(mine, theirs).ok());
    s.combat->resolve_pending();

    CHECK(s.registry.find_squad(theirs)->is_dead());
    CHECK_FALSE(s.combat->state().is_on_map(theirs));
    CHECK(s.combat->index().entity_at(mine == r ? grid::GridPos{5, 5}
                                                : grid::GridPos{4, 4}) == 0);
    CHECK_FALSE(s.combat->controller().find_queue_for_entity(theirs).valid());
    CHECK_FALSE(s.combat->state().can_squad_act(mine));

    auto again = s.combat->submit_attack(mine, theirs);
    REQUIRE_FALSE(again.ok());
    CHECK(again.error().code == ErrorCode::InvalidState);

    auto victory = s.combat->check_victory();
    CHECK(victory.battle_over);
    CHECK(victory.victor == s.current());
    CHECK(victory.victor_name == (mine == r ? "Red" : "Blue"));
    REQUIRE(victory.defeated.size() == 1);
    CHECK(victory.defeated[0] == (mine == r ? s.blue : s.red));
}

TEST_CASE("CombatService attack out of range is reported", "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {0, 0});
    EntityId b = s.squad(s.blue, {9, 9});
    REQUIRE(s.combat->start_combat().ok());

    EntityId mine = s.current() == s.red ? r : b;
    EntityId theirs = mine == r ? b : r;

    REQUIRE(s.combat->submit_attack(mine, theirs).ok());
    s.combat->resolve_pending();

    REQUIRE(s.combat->outcomes().size() == 1);
    CHECK_FALSE(s.combat->outcomes()[0].ok);
    CHECK(s.registry.find_squad(theirs)->health() == 100);
    CHECK(s.combat->state().can_squad_act(mine));
    CHECK_FALSE(s.combat->check_victory().battle_over);
}

TEST_CASE("CombatService custom resolver and player actions", "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {4, 4});
    EntityId b = s.squad(s.blue, {4, 5});
    REQUIRE(s.combat->start_combat().ok());

    EntityId mine = s.current() == s.red ? r : b;
    EntityId theirs = mine == r ? b : r;

    i32 resolved = 0;
    s.combat->set_attack_resolver([&](EntityId, EntityId) {
        ++resolved;
        CombatResult result;
        result.total_damage = 3;
        return result;
    });

    i32 picked_slot = -1;
    REQUIRE(s.combat
                ->submit_player_action(
                    mine, {4, 4}, 2, sim::ActionKind::PickupItem,
                    [&](EntityId, grid::GridPos, i32 slot) {
                        picked_slot = slot;
                    })
                .ok());
    REQUIRE(s.combat->submit_attack(mine, theirs).ok());
    s.combat->resolve_pending();

    CHECK(picked_slot == 2);
    // The pickup used the squad's action, so the attack was refused
    CHECK(resolved == 0);
    REQUIRE(s.combat->outcomes().size() == 2);
    CHECK(s.combat->outcomes()[0].ok);
    CHECK_FALSE(s.combat->outcomes()[1].ok);
}

TEST_CASE("CombatService end_turn restores the next faction's points",
          "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {0, 0});
    EntityId b = s.squad(s.blue, {9, 9});
    REQUIRE(s.combat->start_combat().ok());

    EntityId first = s.current();
    EntityId mine = first == s.red ? r : b;

    REQUIRE(s.combat->submit_move(mine, first == s.red ? grid::GridPos{1, 1}
                                                       : grid::GridPos{8, 8})
                .ok());
    REQUIRE(s.combat->end_turn().ok());
    CHECK(s.current() != first);
    CHECK_FALSE(s.combat->controller().has_pending_actions());

    i32 spent = s.rules.starting_action_points -
                s.rules.cost_of(sim::ActionKind::Movement);
    auto handle = s.combat->controller().find_queue_for_entity(mine);
    CHECK(s.combat->controller().get(handle)->total_action_points() == spent);

    REQUIRE(s.combat->end_turn().ok());
    CHECK(s.current() == first);
    CHECK(s.combat->turns().current_round() == 2);
    CHECK(s.combat->controller().get(handle)->total_action_points() ==
          spent + s.rules.action_point_regen);
}

TEST_CASE("CombatService refuses squads without action points",
          "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {0, 0});
    EntityId b = s.squad(s.blue, {9, 9});
    REQUIRE(s.combat->start_combat().ok());

    EntityId mine = s.current() == s.red ? r : b;
    auto handle = s.combat->controller().create_queue(mine, 0);
    REQUIRE(handle.valid());

    auto queued = s.combat->submit_move(mine, {5, 5});
    REQUIRE_FALSE(queued.ok());
    CHECK(queued.error().code == ErrorCode::NotPermitted);
}

TEST_CASE("CombatService teardown discards the session", "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {0, 0});
    s.squad(s.blue, {9, 9});
    REQUIRE(s.combat->start_combat().ok());
    s.combat->controller().create_queue(r, 10);

    s.combat->teardown();
    CHECK(s.combat->turns().phase() == CombatPhase::Inactive);
    CHECK(s.combat->controller().queue_count() == 0);
    CHECK(s.combat->index().entity_count() == 0);
    CHECK_FALSE(s.combat->state().is_on_map(r));
}

TEST_CASE("CombatService rejects placement outside the grid", "[combat]") {
    Skirmish s;
    auto squad = std::make_unique<sim::Squad>();
    EntityId id = s.registry.register_entity(std::move(squad));

    auto placed = s.combat->place_squad(s.red, id, {10, 0});
    REQUIRE_FALSE(placed.ok());
    CHECK(placed.error().code == ErrorCode::OutOfRange);
}

TEST_CASE("CombatService clears every squad an attack kills", "[combat]") {
    Skirmish s;
    EntityId r = s.squad(s.red, {4, 4});
    EntityId b = s.squad(s.blue, {4, 5});
    EntityId r2 = s.squad(s.red, {3, 3});
    EntityId b2 = s.squad(s.blue, {6, 6});
    REQUIRE(s.combat->start_combat().ok());

    EntityId mine = s.current() == s.red ? r : b;
    EntityId theirs = mine == r ? b : r;
    EntityId splashed = mine == r ? b2 : r2;
    grid::GridPos splashed_at = mine == r ? grid::GridPos{6, 6}
                                          : grid::GridPos{3, 3};

    s.combat->controller().create_queue(splashed, 10);
    s.combat->set_attack_resolver([&](EntityId, EntityId defender) {
        CombatResult result;
        result.total_damage = 50;
        result.target_destroyed = true;
        result.squads_killed = {defender, splashed};
        return result;
    });

    REQUIRE(s.combat->submit_attack(mine, theirs).ok());
    s.combat->resolve_pending();

    for (EntityId killed : {theirs, splashed}) {
        CHECK(s.registry.find_squad(killed)->destroyed());
        CHECK_FALSE(s.combat->state().is_on_map(killed));
        CHECK(s.combat->state().find_action_state(killed) == nullptr);
        CHECK_FALSE(
            s.combat->controller().find_queue_for_entity(killed).valid());
    }
    CHECK(s.combat->index().entity_at(splashed_at) == 0);
    CHECK(s.combat->index().entity_count() == 2);
}

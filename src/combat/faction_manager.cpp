#include "combat/faction_manager.hpp"
#include "combat/combat_state.hpp"
#include "grid/position_index.hpp"
#include "sim/entity_registry.hpp"
#include "sim/faction.hpp"
#include "sim/squad.hpp"

#include <memory>
#include <spdlog/spdlog.h>

namespace otc::combat {

FactionManager::FactionManager(sim::EntityRegistry& registry,
                               CombatState& state, grid::PositionIndex& index)
    : registry_(registry), state_(state), index_(index) {}

EntityId FactionManager::create_faction(const std::string& name,
                                        bool is_player) {
    auto faction = std::make_unique<sim::Faction>();
    faction->set_name(name);
    faction->set_player_controlled(is_player);
    EntityId id = registry_.register_entity(std::move(faction));
    faction_ids_.push_back(id);
    spdlog::debug("Created faction {} '{}'{}", id, name,
                  is_player ? " (player)" : "");
    return id;
}

Result<void> FactionManager::add_squad_to_faction(EntityId faction,
                                                  EntityId squad,
                                                  grid::GridPos position) {
    if (!registry_.find_faction(faction)) {
        return Error(ErrorCode::NotFound,
                     "faction " + std::to_string(faction) + " not found");
    }
    if (!registry_.find_squad(squad)) {
        return Error(ErrorCode::NotFound,
                     "squad " + std::to_string(squad) + " not found");
    }

    if (auto* existing = state_.find_map_position(squad)) {
        auto moved = index_.move_entity(squad, existing->position, position);
        if (!moved) {
            return Error(moved.error().code,
                         "failed to update squad position: " +
                             moved.error().message);
        }
        existing->position = position;
        existing->faction_id = faction;
    } else {
        auto added = index_.add_entity(squad, position);
        if (!added) return added;
        state_.set_map_position(MapPosition{squad, faction, position});
    }

    state_.ensure_action_state(squad);
    return {};
}

Result<void> FactionManager::remove_squad_from_faction(EntityId faction,
                                                       EntityId squad) {
    const auto* record = state_.find_map_position(squad);
    if (!record) {
        return Error(ErrorCode::NotFound,
                     "squad " + std::to_string(squad) + " is not in combat");
    }
    if (record->faction_id != faction) {
        return Error(ErrorCode::InvalidState,
                     "squad " + std::to_string(squad) +
                         " does not belong to faction " +
                         std::to_string(faction));
    }
    return remove_squad_from_map(squad);
}

Result<void> FactionManager::remove_squad_from_map(EntityId squad) {
    const auto* record = state_.find_map_position(squad);
    if (!record) {
        return Error(ErrorCode::NotFound,
                     "squad " + std::to_string(squad) + " not on map");
    }

    grid::GridPos position = record->position;
    auto removed = index_.remove_entity(squad, position);
    if (!removed) {
        // Record and index disagree; still drop the record so the squad
        // stops taking turns
        spdlog::warn("Squad {} missing from position index at {}: {}", squad,
                     grid::to_string(position), removed.error().message);
    }

    state_.remove_action_state(squad);
    return state_.remove_map_position(squad);
}

std::vector<EntityId> FactionManager::faction_squads(EntityId faction) const {
    std::vector<EntityId> result;
    for (EntityId squad : state_.squads_for_faction(faction)) {
        auto* s = registry_.find_squad(squad);
        if (s && !s->is_dead()) result.push_back(squad);
    }
    return result;
}

bool FactionManager::faction_has_squads(EntityId faction) const {
    return !faction_squads(faction).empty();
}

std::string FactionManager::faction_name(EntityId faction) const {
    auto* f = registry_.find_faction(faction);
    return f ? f->name() : "Unknown";
}

} // namespace otc::combat

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "grid/grid_pos.hpp"

#include <string>
#include <vector>

namespace otc::grid {
class PositionIndex;
}

namespace otc::sim {
class EntityRegistry;
}

namespace otc::combat {

class CombatState;

/// Creates factions and places squads on (or takes them off) the combat map.
/// Keeps the map-position records and the position index in step.
class FactionManager {
public:
    FactionManager(sim::EntityRegistry& registry, CombatState& state,
                   grid::PositionIndex& index);

    /// Register a new faction in the entity store. Returns its id.
    EntityId create_faction(const std::string& name, bool is_player);

    /// Put a squad on the map for a faction at `position`. A squad that is
    /// already on the map is moved there and re-owned.
    Result<void> add_squad_to_faction(EntityId faction, EntityId squad,
                                      grid::GridPos position);

    /// Take a squad out of combat. Fails if it is not owned by `faction`.
    Result<void> remove_squad_from_faction(EntityId faction, EntityId squad);

    /// Drop a destroyed or despawned squad from the map.
    Result<void> remove_squad_from_map(EntityId squad);

    /// Squads on the map for a faction that are still alive.
    std::vector<EntityId> faction_squads(EntityId faction) const;
    bool faction_has_squads(EntityId faction) const;

    /// Faction name, or "Unknown".
    std::string faction_name(EntityId faction) const;

    /// Ids of every faction that has been created, ascending.
    const std::vector<EntityId>& faction_ids() const { return faction_ids_; }

private:
    sim::EntityRegistry& registry_;
    CombatState& state_;
    grid::PositionIndex& index_;
    std::vector<EntityId> faction_ids_;
};

} // namespace otc::combat

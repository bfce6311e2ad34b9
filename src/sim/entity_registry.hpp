#pragma once

#include "core/types.hpp"

#include <map>
#include <memory>
#include <vector>

namespace otc::sim {

class Entity;
class Squad;
class Faction;

/// Owns every squad and faction record and hands out their ids.
/// Ids are never reused within one registry.
class EntityRegistry {
public:
    EntityRegistry();
    ~EntityRegistry();

    /// Register an entity and assign it a unique ID. Returns the ID.
    EntityId register_entity(std::unique_ptr<Entity> entity);

    /// Remove an entity by ID.
    void unregister_entity(EntityId id);

    /// Look up an entity by ID. Returns nullptr if not found.
    Entity* find(EntityId id) const;

    /// Typed lookups. Return nullptr if the id is unknown or of another kind.
    Squad* find_squad(EntityId id) const;
    Faction* find_faction(EntityId id) const;

    /// Number of active entities.
    size_t count() const { return entities_.size(); }

    /// Ids of all live squads, ascending.
    std::vector<EntityId> squad_ids() const;

    /// Iterate all entities in id order.
    template <typename F>
    void for_each(F&& fn) const {
        for (const auto& [id, e] : entities_)
            fn(*e);
    }

private:
    std::map<EntityId, std::unique_ptr<Entity>> entities_;
    EntityId next_id_ = 1;
};

} // namespace otc::sim

#include "sim/entity_registry.hpp"
#include "sim/entity.hpp"
#include "sim/faction.hpp"
#include "sim/squad.hpp"

namespace otc::sim {

EntityRegistry::EntityRegistry() = default;
EntityRegistry::~EntityRegistry() = default;

EntityId EntityRegistry::register_entity(std::unique_ptr<Entity> entity) {
    EntityId id = next_id_++;
    entity->set_entity_id(id);
    entities_[id] = std::move(entity);
    return id;
}

void EntityRegistry::unregister_entity(EntityId id) {
    entities_.erase(id);
}

Entity* EntityRegistry::find(EntityId id) const {
    auto it = entities_.find(id);
    return it != entities_.end() ? it->second.get() : nullptr;
}

Squad* EntityRegistry::find_squad(EntityId id) const {
    auto* e = find(id);
    if (!e || !e->is_squad()) return nullptr;
    return static_cast<Squad*>(e);
}

Faction* EntityRegistry::find_faction(EntityId id) const {
    auto* e = find(id);
    if (!e || !e->is_faction()) return nullptr;
    return static_cast<Faction*>(e);
}

std::vector<EntityId> EntityRegistry::squad_ids() const {
    std::vector<EntityId> result;
    for (const auto& [id, e] : entities_) {
        if (e->is_squad() && !e->destroyed())
            result.push_back(id);
    }
    return result;
}

} // namespace otc::sim

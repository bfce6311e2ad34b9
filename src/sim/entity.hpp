#pragma once

#include "core/types.hpp"

#include <string>

namespace otc::sim {

/// Base record for everything the entity store hands out an id for.
class Entity {
public:
    Entity() = default;
    virtual ~Entity() = default;

    EntityId entity_id() const { return entity_id_; }
    void set_entity_id(EntityId id) { entity_id_ = id; }

    const std::string& name() const { return name_; }
    void set_name(const std::string& n) { name_ = n; }

    bool destroyed() const { return destroyed_; }
    void mark_destroyed() { destroyed_ = true; }

    virtual bool is_squad() const { return false; }
    virtual bool is_faction() const { return false; }

private:
    EntityId entity_id_ = 0;
    std::string name_;
    bool destroyed_ = false;
};

} // namespace otc::sim

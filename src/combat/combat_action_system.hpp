#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
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
class FactionManager;

/// Outcome of one squad-vs-squad attack, reported back as plain values.
struct CombatResult {
    i32 total_damage = 0;
    std::vector<EntityId> squads_killed;
    bool target_destroyed = false;
};

/// Damage resolution is owned by the caller; the combat core only decides
/// whether an attack may happen and what to do with the result.
using AttackResolver =
    std::function<CombatResult(EntityId attacker, EntityId defender)>;

struct AttackCheck {
    bool allowed = false;
    std::string reason;
};

class CombatActionSystem {
public:
    CombatActionSystem(sim::EntityRegistry& registry, CombatState& state,
                       FactionManager& factions, grid::PositionIndex& index,
                       i32 default_attack_range);

    void set_resolver(AttackResolver resolver) {
        resolver_ = std::move(resolver);
    }

    /// Squad attack range; never below the default melee range.
    i32 squad_attack_range(EntityId squad) const;

    /// Validate an attack without performing it.
    AttackCheck can_squad_attack(EntityId attacker, EntityId defender) const;

    /// Validate, resolve and apply an attack. Every squad the resolver
    /// reports killed, and a defender left at zero health, is marked
    /// destroyed and taken off the map.
    Result<CombatResult> execute_attack(EntityId attacker, EntityId defender);

    /// Enemy squads within this squad's attack range.
    std::vector<EntityId> squads_in_range(EntityId squad) const;

private:
    sim::EntityRegistry& registry_;
    CombatState& state_;
    FactionManager& factions_;
    grid::PositionIndex& index_;
    i32 default_attack_range_;
    AttackResolver resolver_;
};

} // namespace otc::combat

#pragma once

#include "combat/combat_rules.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>

struct lua_State;

namespace otc::lua {

class LuaState;

/// Reads combat tunables from a Lua script that defines a global table:
///
///   Rules = {
///       StartingActionPoints = 100,
///       ActionPointRegen = 50,
///       ActionCosts = { Movement = 10, Attack = 20, MeleeAttack = 20,
///                       RangedAttack = 25, PickupItem = 5 },
///       DefaultMovementSpeed = 3,
///       DefaultAttackRange = 1,
///       GridWidth = 32,
///       GridHeight = 32,
///       AttackDamage = 10,
///       Seed = 0,
///   }
///
/// Keys that are absent keep their default. The script can call LOG, WARN,
/// SPEW and ALERT.
class RulesLoader {
public:
    static Result<combat::CombatRules> load_file(const fs::path& path);
    static Result<combat::CombatRules> load_string(std::string_view code);

    /// Read the `Rules` global of a state that already ran a rules script.
    static Result<combat::CombatRules> read_rules(lua_State* L);

private:
    static void register_bindings(LuaState& state);
};

} // namespace otc::lua

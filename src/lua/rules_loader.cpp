#include "lua/rules_loader.hpp"
#include "lua/lua_state.hpp"
#include "core/log.hpp"

#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>
#include <string>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace otc::lua {

namespace {

/// Read an optional integral field of the table at the top of the stack
/// and check it against [min, max]. Leaves `out` untouched when the field
/// is nil. `prefix` names the table in error messages.
Result<void> read_integer(lua_State* L, const char* prefix, const char* key,
                          i64 min, i64 max, i64& out) {
    lua_pushstring(L, key);
    lua_gettable(L, -2);
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return {};
    }
    if (!lua_isnumber(L, -1)) {
        lua_pop(L, 1);
        return Error(ErrorCode::InvalidState,
                     std::string(prefix) + key + " must be a number");
    }
    f64 value = static_cast<f64>(lua_tonumber(L, -1));
    lua_pop(L, 1);

    // NaN fails the first test, infinities the range test
    if (std::floor(value) != value) {
        return Error(ErrorCode::OutOfRange,
                     std::string(prefix) + key + " must be an integer");
    }
    if (value < static_cast<f64>(min) || value > static_cast<f64>(max)) {
        return Error(ErrorCode::OutOfRange,
                     std::string(prefix) + key + " must be between " +
                         std::to_string(min) + " and " + std::to_string(max));
    }
    out = static_cast<i64>(value);
    return {};
}

Result<void> read_int(lua_State* L, const char* prefix, const char* key,
                      i32& out) {
    i64 value = out;
    auto read = read_integer(L, prefix, key,
                             std::numeric_limits<i32>::min(),
                             std::numeric_limits<i32>::max(), value);
    if (read) out = static_cast<i32>(value);
    return read;
}

Result<void> require_positive(const char* key, i32 value) {
    if (value <= 0) {
        return Error(ErrorCode::OutOfRange,
                     std::string("Rules.") + key + " must be positive, got " +
                         std::to_string(value));
    }
    return {};
}

const char* const kCostKeys[sim::ACTION_KIND_COUNT] = {
    "Movement", "Attack", "MeleeAttack", "RangedAttack", "PickupItem",
};

Result<void> read_costs(lua_State* L, combat::CombatRules& rules) {
    lua_pushstring(L, "ActionCosts");
    lua_gettable(L, -2);
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return {};
    }
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error(ErrorCode::InvalidState,
                     "Rules.ActionCosts must be a table");
    }

    for (size_t i = 0; i < sim::ACTION_KIND_COUNT; ++i) {
        i32 cost = rules.action_costs[i];
        auto read = read_int(L, "Rules.ActionCosts.", kCostKeys[i], cost);
        if (!read) {
            lua_pop(L, 1);
            return read;
        }
        if (cost <= 0) {
            lua_pop(L, 1);
            return Error(ErrorCode::OutOfRange,
                         std::string("Rules.ActionCosts.") + kCostKeys[i] +
                             " must be positive, got " + std::to_string(cost));
        }
        rules.action_costs[i] = cost;
    }
    lua_pop(L, 1);
    return {};
}

} // namespace

void RulesLoader::register_bindings(LuaState& state) {
    state.register_function("LOG", log::l_LOG);
    state.register_function("WARN", log::l_WARN);
    state.register_function("SPEW", log::l_SPEW);
    state.register_function("ALERT", log::l_ALERT);
}

Result<combat::CombatRules> RulesLoader::load_file(const fs::path& path) {
    LuaState state;
    register_bindings(state);

    spdlog::info("Loading rules: {}", path.string());
    auto result = state.do_file(path);
    if (!result) {
        return Error(result.error().code,
                     "Failed to execute rules file: " + result.error().message);
    }
    return read_rules(state.raw());
}

Result<combat::CombatRules> RulesLoader::load_string(std::string_view code) {
    LuaState state;
    register_bindings(state);

    auto result = state.do_string(code);
    if (!result) {
        return Error(result.error().code,
                     "Failed to execute rules: " + result.error().message);
    }
    return read_rules(state.raw());
}

Result<combat::CombatRules> RulesLoader::read_rules(lua_State* L) {
    lua_getglobal(L, "Rules");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error(ErrorCode::NotFound, "'Rules' global is not a table");
    }

    combat::CombatRules rules;

    struct Field {
        const char* key;
        i32* value;
        bool positive;
    };
    const Field fields[] = {
        {"StartingActionPoints", &rules.starting_action_points, false},
        {"ActionPointRegen", &rules.action_point_regen, false},
        {"DefaultMovementSpeed", &rules.default_movement_speed, true},
        {"DefaultAttackRange", &rules.default_attack_range, true},
        {"GridWidth", &rules.grid_width, true},
        {"GridHeight", &rules.grid_height, true},
        {"AttackDamage", &rules.attack_damage, false},
    };

    for (const auto& field : fields) {
        auto read = read_int(L, "Rules.", field.key, *field.value);
        if (read && field.positive)
            read = require_positive(field.key, *field.value);
        if (!read) {
            lua_pop(L, 1);
            return read.error();
        }
    }

    i64 seed = rules.seed;
    auto seed_read = read_integer(L, "Rules.", "Seed", 0,
                                  std::numeric_limits<u32>::max(), seed);
    if (!seed_read) {
        lua_pop(L, 1);
        return seed_read.error();
    }
    rules.seed = static_cast<u32>(seed);

    auto costs = read_costs(L, rules);
    lua_pop(L, 1); // Rules
    if (!costs) return costs.error();

    if (rules.action_point_regen < 0) {
        return Error(ErrorCode::OutOfRange,
                     "Rules.ActionPointRegen must not be negative");
    }

    spdlog::debug("Rules: {} starting points, {} regen, {}x{} grid",
                  rules.starting_action_points, rules.action_point_regen,
                  rules.grid_width, rules.grid_height);
    return rules;
}

} // namespace otc::lua

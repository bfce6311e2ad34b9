#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

struct lua_State;

namespace otc::lua {

/// RAII wrapper around a Lua state with the standard libraries opened.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Register a C function inside a table (e.g., "Rules.Cost").
    void register_table_function(const char* table_name,
                                 const char* func_name,
                                 int (*fn)(lua_State*));

    void set_global_string(const char* name, const char* value);
    void set_global_bool(const char* name, bool value);
    void set_global_number(const char* name, f64 value);

    /// Set a global to an empty table.
    void set_global_table(const char* name);

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

private:
    Result<void> load_and_call(const char* buf, size_t len, const char* name);

    lua_State* L_ = nullptr;
};

} // namespace otc::lua

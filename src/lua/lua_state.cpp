#include "lua/lua_state.hpp"

#include <fstream>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace otc::lua {

LuaState::LuaState() {
    L_ = luaL_newstate();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }
    luaL_openlibs(L_);
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::register_table_function(const char* table_name,
                                       const char* func_name,
                                       int (*fn)(lua_State*)) {
    lua_getglobal(L_, table_name);
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        lua_newtable(L_);
        lua_setglobal(L_, table_name);
        lua_getglobal(L_, table_name);
    }
    lua_pushstring(L_, func_name);
    lua_pushcfunction(L_, fn);
    lua_settable(L_, -3);
    lua_pop(L_, 1);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_bool(const char* name, bool value) {
    lua_pushboolean(L_, value ? 1 : 0);
    lua_setglobal(L_, name);
}

void LuaState::set_global_number(const char* name, f64 value) {
    lua_pushnumber(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_table(const char* name) {
    lua_newtable(L_);
    lua_setglobal(L_, name);
}

Result<void> LuaState::do_string(std::string_view code) {
    return load_and_call(code.data(), code.size(), "=string");
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error(ErrorCode::NotFound,
                     "Failed to open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (size > 0 && !file.read(buffer.data(), size)) {
        return Error("Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }
    return load_and_call(buf, len, name);
}

Result<void> LuaState::load_and_call(const char* buf, size_t len,
                                     const char* name) {
    if (!L_) return Error(ErrorCode::InvalidState, "Lua state not created");

    int status = luaL_loadbuffer(L_, buf, len, name);
    if (status == 0) status = lua_pcall(L_, 0, 0, 0);
    if (status != 0) {
        const char* msg = lua_tostring(L_, -1);
        std::string err = msg ? msg : "unknown Lua error";
        lua_pop(L_, 1);
        return Error(std::move(err));
    }
    return {};
}

} // namespace otc::lua

#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace otc::log {

/// Initialize logging with console + file sinks.
void init(const std::filesystem::path& log_file = "opentactics.log");

/// Flush and shutdown logging.
void shutdown();

// Globals exposed to rules scripts (see RulesLoader::register_bindings).
// Each joins its arguments into one line, prefixed "[rules]", and logs it
// through the default logger: LOG at info, WARN at warn, SPEW at debug and
// ALERT at error.
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);
int l_ALERT(lua_State* L);

} // namespace otc::log

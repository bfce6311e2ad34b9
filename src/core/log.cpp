#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace otc::log {

void init(const std::filesystem::path& log_file) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        log_file.string(), true);

    auto logger = std::make_shared<spdlog::logger>(
        "otc", spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::info("OpenTactics v0.1.0");
}

void shutdown() {
    spdlog::shutdown();
}

/// Join the call's arguments into one line so a rules script can
/// LOG("cost ", n, " too high") without calling tostring itself.
/// Tables and functions print as their type name.
static std::string join_script_args(lua_State* L) {
    std::string line;
    int n = lua_gettop(L);
    for (int i = 1; i <= n; i++) {
        switch (lua_type(L, i)) {
        case LUA_TNIL:
            line += "nil";
            break;
        case LUA_TBOOLEAN:
            line += lua_toboolean(L, i) ? "true" : "false";
            break;
        case LUA_TNUMBER:
        case LUA_TSTRING:
            line += lua_tostring(L, i);
            break;
        default:
            line += lua_typename(L, lua_type(L, i));
            break;
        }
    }
    return line;
}

static int log_from_script(lua_State* L, spdlog::level::level_enum level) {
    spdlog::log(level, "[rules] {}", join_script_args(L));
    return 0;
}

int l_LOG(lua_State* L) { return log_from_script(L, spdlog::level::info); }
int l_WARN(lua_State* L) { return log_from_script(L, spdlog::level::warn); }
int l_SPEW(lua_State* L) { return log_from_script(L, spdlog::level::debug); }
int l_ALERT(lua_State* L) { return log_from_script(L, spdlog::level::err); }

} // namespace otc::log

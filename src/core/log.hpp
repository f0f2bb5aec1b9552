#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace airpath::log {

/// Initialize logging with console + file sinks.
void init(const std::filesystem::path& log_file = "airpath.log");

/// Flush and shutdown logging.
void shutdown();

// Logging functions exposed to configuration scripts
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);
int l_ALERT(lua_State* L);

} // namespace airpath::log

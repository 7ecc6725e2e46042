// src/env/lua_environment.hpp
#pragma once

#include "env/environment_query.hpp"
#include <mutex>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace env {

/**
 * LuaEnvironment - Environment fields scripted in Lua
 *
 * The script defines any of these globals:
 *   field_value(name, x, y, z, t)       -> number | nil
 *   field_vector(name, x, y, z, t)      -> {x, y, z} | nil
 *   nearby_sources(x, y, z, radius, t)  -> { {x=, y=, z=, frequency_hz=, strength=}, ... }
 *
 * A missing global means the environment has no such data. A script
 * error raises EnvironmentQueryMiss for that query. t is the scenario
 * time in seconds, set by the driver before each timestep.
 *
 * One lua_State is shared, so queries are serialized.
 */
class LuaEnvironment : public EnvironmentQuery {
public:
    LuaEnvironment() = default;
    ~LuaEnvironment() override;

    LuaEnvironment(const LuaEnvironment&) = delete;
    LuaEnvironment& operator=(const LuaEnvironment&) = delete;

    bool init(const std::string& lua_script_path);

    void set_time_s(double t_s);

    std::optional<double> get_field_value(const std::string& field_name,
                                          const utils::Vec3& position) const override;

    std::optional<utils::Vec3> get_field_vector(const std::string& field_name,
                                                const utils::Vec3& position) const override;

    std::vector<InterferenceSource> get_nearby_sources(const utils::Vec3& position,
                                                       double radius_m) const override;

private:
    lua_State* L_{nullptr};
    double t_s_ = 0.0;

    mutable std::mutex mutex_;

    // Pushes the global onto the stack; false (stack unchanged) if not a function
    bool push_function_(const char* fn) const;
    // Error value on top of the stack as text
    std::string error_message_() const;
    void call_(const char* fn, int nargs) const;
    double get_num_(int idx, const char* key, double def) const;
};

} // namespace env

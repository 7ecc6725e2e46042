// src/env/lua_environment.cpp
#include "env/lua_environment.hpp"
#include "utils/logging.hpp"

namespace env {

LuaEnvironment::~LuaEnvironment() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaEnvironment::init(const std::string& lua_script_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load environment script: %s", error_message_().c_str());
        lua_pop(L_, 1);
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    for (const char* fn : {"field_value", "field_vector", "nearby_sources"}) {
        lua_getglobal(L_, fn);
        if (!lua_isfunction(L_, -1)) {
            LOG_DEBUG("[Lua] %s() not defined by %s", fn, lua_script_path.c_str());
        }
        lua_pop(L_, 1);
    }

    LOG_INFO("[Lua] Environment script loaded: %s", lua_script_path.c_str());
    return true;
}

void LuaEnvironment::set_time_s(double t_s) {
    std::lock_guard<std::mutex> lock(mutex_);
    t_s_ = t_s;
}

bool LuaEnvironment::push_function_(const char* fn) const {
    if (!L_) return false;

    lua_getglobal(L_, fn);
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return false;
    }
    return true;
}

std::string LuaEnvironment::error_message_() const {
    // error() may raise any value; tables and nil have no string form
    const char* msg = lua_tostring(L_, -1);
    if (msg) return msg;
    return std::string("(non-string error: ") + luaL_typename(L_, -1) + ")";
}

void LuaEnvironment::call_(const char* fn, int nargs) const {
    if (lua_pcall(L_, nargs, 1, 0) != LUA_OK) {
        std::string err = std::string("[Lua] ") + fn + " failed: " + error_message_();
        lua_pop(L_, 1);
        throw EnvironmentQueryMiss(err);
    }
}

double LuaEnvironment::get_num_(int idx, const char* key, double def) const {
    lua_getfield(L_, idx, key);
    double v = def;
    if (lua_isnumber(L_, -1)) v = lua_tonumber(L_, -1);
    lua_pop(L_, 1);
    return v;
}

std::optional<double> LuaEnvironment::get_field_value(const std::string& field_name,
                                                      const utils::Vec3& position) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!push_function_("field_value")) return std::nullopt;

    lua_pushstring(L_, field_name.c_str());
    lua_pushnumber(L_, position.x);
    lua_pushnumber(L_, position.y);
    lua_pushnumber(L_, position.z);
    lua_pushnumber(L_, t_s_);
    call_("field_value", 5);

    std::optional<double> out;
    if (lua_isnumber(L_, -1)) {
        out = lua_tonumber(L_, -1);
    }
    lua_pop(L_, 1);
    return out;
}

std::optional<utils::Vec3> LuaEnvironment::get_field_vector(const std::string& field_name,
                                                            const utils::Vec3& position) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!push_function_("field_vector")) return std::nullopt;

    lua_pushstring(L_, field_name.c_str());
    lua_pushnumber(L_, position.x);
    lua_pushnumber(L_, position.y);
    lua_pushnumber(L_, position.z);
    lua_pushnumber(L_, t_s_);
    call_("field_vector", 5);

    std::optional<utils::Vec3> out;
    if (lua_istable(L_, -1)) {
        double v[3] = {0.0, 0.0, 0.0};
        for (int i = 0; i < 3; ++i) {
            lua_rawgeti(L_, -1, i + 1);
            if (lua_isnumber(L_, -1)) v[i] = lua_tonumber(L_, -1);
            lua_pop(L_, 1);
        }
        out = utils::Vec3{v[0], v[1], v[2]};
    }
    lua_pop(L_, 1);
    return out;
}

std::vector<InterferenceSource> LuaEnvironment::get_nearby_sources(const utils::Vec3& position,
                                                                   double radius_m) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InterferenceSource> sources;
    if (!push_function_("nearby_sources")) return sources;

    lua_pushnumber(L_, position.x);
    lua_pushnumber(L_, position.y);
    lua_pushnumber(L_, position.z);
    lua_pushnumber(L_, radius_m);
    lua_pushnumber(L_, t_s_);
    call_("nearby_sources", 5);

    if (lua_istable(L_, -1)) {
        const int tbl = lua_gettop(L_);
        const size_t n = static_cast<size_t>(lua_rawlen(L_, tbl));
        for (size_t i = 1; i <= n; ++i) {
            lua_rawgeti(L_, tbl, static_cast<lua_Integer>(i));
            if (lua_istable(L_, -1)) {
                const int entry = lua_gettop(L_);
                InterferenceSource src;
                src.position = {get_num_(entry, "x", 0.0),
                                get_num_(entry, "y", 0.0),
                                get_num_(entry, "z", 0.0)};
                src.frequency_hz = get_num_(entry, "frequency_hz", 1000.0);
                src.strength = get_num_(entry, "strength", 1.0);
                sources.push_back(src);
            }
            lua_pop(L_, 1);
        }
    }
    lua_pop(L_, 1);
    return sources;
}

} // namespace env

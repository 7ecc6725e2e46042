// src/config/config_error.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace config {

/**
 * ConfigError - Invalid or missing required parameter
 *
 * Raised while a sensor or scenario is being built, before any sample
 * is produced.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace config

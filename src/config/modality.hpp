// src/config/modality.hpp
#pragma once

#include <string>

namespace config {

enum class Modality : int {
    Emf = 0,
    Acoustic,
    Particulate,
    Thermal,
    Chemical
};

const char* to_string(Modality m);

/**
 * Parse a modality name ("emf", "acoustic", "particulate", "thermal", "chemical")
 * @return false if the name is unknown
 */
bool parse_modality(const std::string& name, Modality& out);

} // namespace config

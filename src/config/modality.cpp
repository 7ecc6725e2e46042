// src/config/modality.cpp
#include "config/modality.hpp"

namespace config {

const char* to_string(Modality m) {
    switch (m) {
        case Modality::Emf:         return "emf";
        case Modality::Acoustic:    return "acoustic";
        case Modality::Particulate: return "particulate";
        case Modality::Thermal:     return "thermal";
        case Modality::Chemical:    return "chemical";
    }
    return "unknown";
}

bool parse_modality(const std::string& name, Modality& out) {
    for (Modality m : {Modality::Emf, Modality::Acoustic, Modality::Particulate,
                       Modality::Thermal, Modality::Chemical}) {
        if (name == to_string(m)) {
            out = m;
            return true;
        }
    }
    return false;
}

} // namespace config

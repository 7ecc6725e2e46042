// src/sensors/modality_profile.cpp
#include "sensors/modality_profile.hpp"
#include <limits>

namespace sensors {

namespace {

constexpr double kUnbounded = std::numeric_limits<double>::infinity();

// Flags: analysis, response, misalignment, directional, interference, cross sensitivity
const ModalityProfile kEmf{
    "ac_field_strength_v_per_m", "ac_field_strength", "ac_field_vector", "emf_dominant_frequency_hz",
    true, true, true, true, true, false,
    0.0, kUnbounded};

const ModalityProfile kAcoustic{
    "spl_dba", "sound_pressure_level_db", nullptr, "acoustic_dominant_frequency_hz",
    true, true, true, true, false, false,
    0.0, 194.0};

const ModalityProfile kParticulate{
    "pm2_5_ug_m3", "pm2_5", nullptr, nullptr,
    false, false, false, false, false, false,
    0.0, kUnbounded};

const ModalityProfile kThermal{
    "temperature_c", "temperature_celsius", nullptr, nullptr,
    false, false, false, false, false, false,
    -273.15, kUnbounded};

const ModalityProfile kChemical{
    "concentration_ppb", nullptr, nullptr, nullptr,
    false, false, false, false, false, true,
    0.0, kUnbounded};

} // namespace

const ModalityProfile& profile_for(config::Modality m) {
    switch (m) {
        case config::Modality::Emf:         return kEmf;
        case config::Modality::Acoustic:    return kAcoustic;
        case config::Modality::Particulate: return kParticulate;
        case config::Modality::Thermal:     return kThermal;
        case config::Modality::Chemical:    return kChemical;
    }
    return kEmf;
}

} // namespace sensors

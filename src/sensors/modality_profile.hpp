// src/sensors/modality_profile.hpp
#pragma once

#include "config/modality.hpp"

namespace sensors {

/**
 * ModalityProfile - What a modality measures and which stages it uses
 *
 * Stage flags only select; execution order is always the stage rank.
 */
struct ModalityProfile {
    const char* quantity;             // observed quantity name
    const char* ideal_field;          // scalar field read as the ideal value (nullptr = target_chemical)
    const char* vector_field;         // optional field direction
    const char* frequency_field;      // optional dominant frequency

    bool frequency_analysis;
    bool frequency_response;
    bool axis_misalignment;           // still gated by axis_misalignment_effect_on_spectrum
    bool directional_sensitivity;
    bool interference_coupling;
    bool cross_sensitivity;
    // calibration drift, general drift and noise apply to every modality

    double min_value;                 // physical output limits
    double max_value;
};

const ModalityProfile& profile_for(config::Modality m);

} // namespace sensors

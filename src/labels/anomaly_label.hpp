// src/labels/anomaly_label.hpp
#pragma once

#include <string>

namespace labels {

/**
 * AnomalyLabel - One ground-truth condition attached to a sample
 *
 * severity >= 0, confidence in [0, 1].
 */
struct AnomalyLabel {
    std::string anomaly_type;
    double severity = 0.0;
    double confidence = 1.0;

    bool operator==(const AnomalyLabel& rhs) const {
        return anomaly_type == rhs.anomaly_type &&
               severity == rhs.severity &&
               confidence == rhs.confidence;
    }
    bool operator!=(const AnomalyLabel& rhs) const { return !(*this == rhs); }
};

} // namespace labels

// src/labels/ground_truth_evaluator.cpp
#include "labels/ground_truth_evaluator.hpp"
#include <cmath>

namespace labels {

std::vector<AnomalyLabel> GroundTruthEvaluator::evaluate(const env::EnvironmentQuery& env,
                                                         const utils::Vec3& position,
                                                         std::optional<double> observed) const {
    std::vector<AnomalyLabel> out;

    for (const auto& rule : conditions_) {
        const auto raw = env::try_field_value(env, rule.field, position);
        if (!raw || *raw == 0.0) {
            continue;
        }
        out.push_back({rule.anomaly_type, std::abs(*raw) * rule.severity_scale, rule.confidence});
    }

    if (observed && std::isfinite(*observed)) {
        for (const auto& rule : thresholds_) {
            if (*observed > rule.threshold) {
                out.push_back({rule.anomaly_type, rule.severity_scale, rule.confidence});
            }
        }
    }

    return out;
}

} // namespace labels

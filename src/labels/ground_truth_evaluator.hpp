// src/labels/ground_truth_evaluator.hpp
#pragma once

#include "config/sensor_config.hpp"
#include "env/environment_query.hpp"
#include "labels/anomaly_label.hpp"
#include <optional>
#include <vector>

namespace labels {

/**
 * GroundTruthEvaluator - Derives anomaly labels for one sensor
 *
 * Condition rules read the environment directly:
 *   field present, finite and non-zero -> {type, |value| * severity_scale, confidence}
 * Threshold rules read the observed (post-pipeline) value:
 *   observed > threshold               -> {type, severity_scale, confidence}
 *
 * Every matching rule yields its own label. A field the environment
 * cannot resolve means "condition absent"; evaluate() never throws
 * on environment misses.
 */
class GroundTruthEvaluator {
public:
    GroundTruthEvaluator() = default;
    GroundTruthEvaluator(std::vector<config::ConditionRule> conditions,
                         std::vector<config::ThresholdRule> thresholds)
        : conditions_(std::move(conditions)), thresholds_(std::move(thresholds)) {}

    /**
     * @param observed Final observed primary, or nullopt before the first sample
     */
    std::vector<AnomalyLabel> evaluate(const env::EnvironmentQuery& env,
                                       const utils::Vec3& position,
                                       std::optional<double> observed) const;

    size_t rule_count() const { return conditions_.size() + thresholds_.size(); }

private:
    std::vector<config::ConditionRule> conditions_;
    std::vector<config::ThresholdRule> thresholds_;
};

} // namespace labels

// test/test_ground_truth.cpp
/**
 * Unit Test: GroundTruthEvaluator
 *
 * Test Coverage:
 *   1. Condition label from an environment field
 *   2. Threshold label from the observed value
 *   3. Absent, zero and unresolvable fields raise nothing
 *   4. Several rules match at once
 *   5. Re-evaluation is idempotent
 *   6. Labels are recomputed when the environment changes
 */

#include "labels/ground_truth_evaluator.hpp"
#include "env/static_environment.hpp"
#include <iostream>
#include <cmath>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// Environment that cannot resolve anything
class UnreachableEnvironment : public env::EnvironmentQuery {
public:
    std::optional<double> get_field_value(const std::string& field_name,
                                          const utils::Vec3& position) const override {
        (void)position;
        throw env::EnvironmentQueryMiss("no data for " + field_name);
    }

    std::vector<env::InterferenceSource> get_nearby_sources(const utils::Vec3& position,
                                                            double radius_m) const override {
        (void)position; (void)radius_m;
        throw env::EnvironmentQueryMiss("no source data");
    }
};

const labels::AnomalyLabel* find_label(const std::vector<labels::AnomalyLabel>& labels,
                                       const std::string& type) {
    for (const auto& l : labels) {
        if (l.anomaly_type == type) return &l;
    }
    return nullptr;
}

labels::GroundTruthEvaluator emf_evaluator() {
    return labels::GroundTruthEvaluator(
        {
            {"corona", "corona_discharge", "corona_discharge", 100.0, 0.9},
            {"arcing", "arcing", "arcing_intensity", 50.0, 0.85},
        },
        {
            {"overload", "overload", 500.0, 50.0, 0.95},
        });
}

// Test 1: Condition label
void test_condition_label(TestResult& result) {
    std::cout << "\n=== Test 1: Condition Label ===\n";

    env::StaticEnvironment environment;
    environment.add_region("corona_discharge", {0, 0, 10}, 1.0, 0.8);

    auto labels = emf_evaluator().evaluate(environment, {0, 0, 10}, std::nullopt);
    const auto* corona = find_label(labels, "corona_discharge");

    if (corona && std::abs(corona->severity - 80.0) < 1e-9 && corona->confidence == 0.9) {
        result.pass("corona_discharge=0.8 -> severity 80.0, confidence 0.9");
    } else {
        result.fail("corona label missing or wrong");
    }

    if (labels.size() == 1) {
        result.pass("Only the active condition is labeled");
    } else {
        result.fail("Unexpected label count: " + std::to_string(labels.size()));
    }

    environment.set_uniform("arcing_intensity", -0.4);
    labels = emf_evaluator().evaluate(environment, {0, 0, 10}, std::nullopt);
    const auto* arcing = find_label(labels, "arcing");
    if (arcing && std::abs(arcing->severity - 20.0) < 1e-9) {
        result.pass("Negative field magnitude gives a non-negative severity");
    } else {
        result.fail("arcing severity should be |-0.4| * 50");
    }
}

// Test 2: Threshold label
void test_threshold_label(TestResult& result) {
    std::cout << "\n=== Test 2: Threshold Label ===\n";

    env::StaticEnvironment environment;
    auto evaluator = emf_evaluator();

    auto above = evaluator.evaluate(environment, {0, 0, 0}, 600.0);
    const auto* overload = find_label(above, "overload");
    if (overload && overload->severity == 50.0 && overload->confidence == 0.95) {
        result.pass("observed 600 > 500 -> overload {50.0, 0.95}");
    } else {
        result.fail("overload label missing or wrong at 600");
    }

    auto below = evaluator.evaluate(environment, {0, 0, 0}, 499.9);
    if (!find_label(below, "overload")) {
        result.pass("observed 499.9 -> no overload");
    } else {
        result.fail("overload raised below threshold");
    }

    auto equal = evaluator.evaluate(environment, {0, 0, 0}, 500.0);
    if (!find_label(equal, "overload")) {
        result.pass("observed == threshold -> no overload (strictly greater)");
    } else {
        result.fail("overload raised at exactly the threshold");
    }

    auto before_first = evaluator.evaluate(environment, {0, 0, 0}, std::nullopt);
    if (before_first.empty()) {
        result.pass("No observed value yet -> no threshold labels");
    } else {
        result.fail("Threshold label without an observed value");
    }
}

// Test 3: Absent conditions
void test_absent_conditions(TestResult& result) {
    std::cout << "\n=== Test 3: Absent Conditions ===\n";

    auto evaluator = emf_evaluator();

    env::StaticEnvironment empty;
    if (evaluator.evaluate(empty, {0, 0, 0}, 10.0).empty()) {
        result.pass("Unknown fields raise nothing");
    } else {
        result.fail("Label raised for unknown field");
    }

    env::StaticEnvironment zero;
    zero.set_uniform("corona_discharge", 0.0);
    if (evaluator.evaluate(zero, {0, 0, 0}, 10.0).empty()) {
        result.pass("Zero-valued field raises nothing");
    } else {
        result.fail("Label raised for zero field");
    }

    env::StaticEnvironment nan_env;
    nan_env.set_uniform("corona_discharge", std::nan(""));
    if (evaluator.evaluate(nan_env, {0, 0, 0}, 10.0).empty()) {
        result.pass("Non-finite field raises nothing");
    } else {
        result.fail("Label raised for NaN field");
    }

    UnreachableEnvironment unreachable;
    try {
        auto labels = evaluator.evaluate(unreachable, {0, 0, 0}, 600.0);
        if (labels.size() == 1 && labels[0].anomaly_type == "overload") {
            result.pass("Environment misses are absent conditions; threshold still evaluated");
        } else {
            result.fail("Unexpected labels from an unreachable environment");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("evaluate() propagated: ") + e.what());
    }

    env::StaticEnvironment bounded;
    bounded.set_uniform("corona_discharge", 1.0);
    bounded.set_bounds({-1, -1, -1}, {1, 1, 1});
    try {
        if (evaluator.evaluate(bounded, {5, 5, 5}, std::nullopt).empty()) {
            result.pass("Position outside environment bounds raises nothing");
        } else {
            result.fail("Label raised outside bounds");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Out-of-bounds evaluate() propagated: ") + e.what());
    }
}

// Test 4: Multiple labels
void test_multiple_labels(TestResult& result) {
    std::cout << "\n=== Test 4: Multiple Labels ===\n";

    env::StaticEnvironment environment;
    environment.set_uniform("corona_discharge", 0.5);
    environment.set_uniform("arcing_intensity", 1.0);

    auto labels = emf_evaluator().evaluate(environment, {0, 0, 0}, 700.0);

    if (labels.size() == 3 &&
        find_label(labels, "corona_discharge") &&
        find_label(labels, "arcing") &&
        find_label(labels, "overload")) {
        result.pass("Corona, arcing and overload each produce their own label");
    } else {
        result.fail("Expected 3 labels, got " + std::to_string(labels.size()));
    }

    bool bounded = true;
    for (const auto& l : labels) {
        if (l.severity < 0.0 || l.confidence < 0.0 || l.confidence > 1.0) bounded = false;
    }
    if (bounded) {
        result.pass("Severity >= 0 and confidence in [0, 1]");
    } else {
        result.fail("Label value out of range");
    }
}

// Test 5: Idempotence
void test_idempotent(TestResult& result) {
    std::cout << "\n=== Test 5: Idempotent Evaluation ===\n";

    env::StaticEnvironment environment;
    environment.set_uniform("corona_discharge", 0.3);

    auto evaluator = emf_evaluator();
    auto first = evaluator.evaluate(environment, {1, 2, 3}, 550.0);
    auto second = evaluator.evaluate(environment, {1, 2, 3}, 550.0);

    if (first == second && !first.empty()) {
        result.pass("Same inputs give identical labels");
    } else {
        result.fail("Repeated evaluation differs");
    }

    if (evaluator.rule_count() == 3) {
        result.pass("rule_count() = 3");
    } else {
        result.fail("rule_count() mismatch");
    }
}

// Test 6: Labels follow the current environment
void test_environment_change(TestResult& result) {
    std::cout << "\n=== Test 6: Environment Change Between Evaluations ===\n";

    env::StaticEnvironment environment;
    environment.set_uniform("corona_discharge", 0.3);

    auto evaluator = emf_evaluator();
    auto before = evaluator.evaluate(environment, {0, 0, 0}, std::nullopt);
    const auto* corona = find_label(before, "corona_discharge");

    if (corona && std::abs(corona->severity - 30.0) < 1e-9) {
        result.pass("corona_discharge=0.3 -> severity 30.0");
    } else {
        result.fail("corona label missing before the change");
    }

    environment.set_uniform("corona_discharge", 0.0);
    auto after = evaluator.evaluate(environment, {0, 0, 0}, std::nullopt);

    if (find_label(after, "corona_discharge") == nullptr && after.empty()) {
        result.pass("Cleared condition is no longer labeled");
    } else {
        result.fail("Stale corona label after the field went to zero");
    }

    environment.set_uniform("corona_discharge", 0.6);
    auto again = evaluator.evaluate(environment, {0, 0, 0}, std::nullopt);
    corona = find_label(again, "corona_discharge");

    if (corona && std::abs(corona->severity - 60.0) < 1e-9) {
        result.pass("Severity tracks the new field value");
    } else {
        result.fail("Severity not recomputed from the new value");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            GroundTruthEvaluator Unit Tests                  ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_condition_label(result);
    test_threshold_label(result);
    test_absent_conditions(result);
    test_multiple_labels(result);
    test_idempotent(result);
    test_environment_change(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}

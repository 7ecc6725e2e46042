// test/test_static_environment.cpp
/**
 * Unit Test: StaticEnvironment
 *
 * Test Coverage:
 *   1. Uniform values and region overrides
 *   2. Vector fields
 *   3. Interference sources by radius
 *   4. Bounds and miss folding
 *   5. CSV table loading
 *   6. Malformed / missing tables
 */

#include "env/static_environment.hpp"
#include <iostream>
#include <fstream>
#include <cmath>
#include <cstdio>

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

    void check(bool ok, const std::string& msg) {
        if (ok) pass(msg); else fail(msg);
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

// Test 1: Scalars
void test_scalar_fields(TestResult& result) {
    std::cout << "\n=== Test 1: Scalar Fields ===\n";

    env::StaticEnvironment e;
    e.set_uniform("temperature_celsius", 25.0);
    e.add_region("temperature_celsius", {0, 0, 0}, 2.0, 60.0);
    e.add_region("temperature_celsius", {1, 0, 0}, 0.5, 90.0);
    e.add_region("corona_discharge", {10, 0, 0}, 1.0, 0.7);

    result.check(e.get_field_value("temperature_celsius", {50, 50, 50}) == 25.0, "Uniform background away from regions");
    result.check(e.get_field_value("temperature_celsius", {-1, 0, 0}) == 60.0, "Region overrides background");
    result.check(e.get_field_value("temperature_celsius", {1, 0, 0}) == 90.0, "Last matching region wins");
    result.check(e.get_field_value("corona_discharge", {10, 0, 0.5}) == 0.7, "Region-only field inside its sphere");
    result.check(!e.get_field_value("corona_discharge", {0, 0, 0}), "Region-only field absent outside");
    result.check(!e.get_field_value("unknown", {0, 0, 0}), "Unknown field absent");
    result.check(e.field_count() == 2, "field_count() = 2");
}

// Test 2: Vectors
void test_vector_fields(TestResult& result) {
    std::cout << "\n=== Test 2: Vector Fields ===\n";

    env::StaticEnvironment e;
    e.set_uniform_vector("ac_field_vector", {0, 0, 100});
    e.add_vector_region("ac_field_vector", {0, 0, 10}, 1.0, {50, 0, 0});

    auto bg = e.get_field_vector("ac_field_vector", {20, 0, 0});
    auto near = e.get_field_vector("ac_field_vector", {0, 0, 10});

    result.check(bg && *bg == utils::Vec3(0, 0, 100), "Uniform vector");
    result.check(near && *near == utils::Vec3(50, 0, 0), "Vector region override");
    result.check(!e.get_field_vector("other", {0, 0, 0}), "Unknown vector absent");
}

// Test 3: Sources
void test_sources(TestResult& result) {
    std::cout << "\n=== Test 3: Interference Sources ===\n";

    env::StaticEnvironment e;
    e.add_source({{3, 0, 0}, 180.0, 2.0});
    e.add_source({{30, 0, 0}, 1500.0, 0.5});

    result.check(e.get_nearby_sources({0, 0, 0}, 5.0).size() == 1, "One source within 5 m");
    result.check(e.get_nearby_sources({0, 0, 0}, 50.0).size() == 2, "Both sources within 50 m");
    result.check(e.get_nearby_sources({0, 0, 0}, 1.0).empty(), "No source within 1 m");
    result.check(e.source_count() == 2, "source_count() = 2");
}

// Test 4: Bounds
void test_bounds(TestResult& result) {
    std::cout << "\n=== Test 4: Bounds ===\n";

    env::StaticEnvironment e;
    e.set_uniform("pm2_5", 12.0);
    e.set_bounds({-10, -10, 0}, {10, 10, 10});

    result.check(e.get_field_value("pm2_5", {0, 0, 5}) == 12.0, "Inside bounds resolves");

    bool thrown = false;
    try {
        (void)e.get_field_value("pm2_5", {20, 0, 5});
    } catch (const env::EnvironmentQueryMiss&) {
        thrown = true;
    }
    result.check(thrown, "Outside bounds raises EnvironmentQueryMiss");

    result.check(!env::try_field_value(e, "pm2_5", {20, 0, 5}), "try_field_value folds the miss into absent");
    result.check(env::try_nearby_sources(e, {20, 0, 5}, 10.0).empty(), "try_nearby_sources folds the miss");
}

// Test 5: CSV loading
void test_load_csv(TestResult& result) {
    std::cout << "\n=== Test 5: CSV Table Loading ===\n";

    const char* path = "/tmp/test_twinsense_env.csv";
    {
        std::ofstream f(path);
        f << "kind,name,x,y,z,radius,value,vx,vy,vz,frequency_hz\n";
        f << "# background\n";
        f << "uniform,temperature_celsius,0,0,0,,25,,,,\n";
        f << "region,corona_discharge,0,0,10,2,0.8,,,,\n";
        f << "vector,ac_field_vector,0,0,0,,,0,0,120,\n";
        f << "source,,5,0,10,,2.0,,,,180\n";
        f << "\n";
        f << "mystery,ignored,0,0,0,,1,,,,\n";
        f << "bounds_min,,-50,-50,-50,,,,,,\n";
        f << "bounds_max,,50,50,50,,,,,,\n";
    }

    try {
        auto e = env::StaticEnvironment::load_csv(path);
        result.check(e.get_field_value("temperature_celsius", {0, 0, 0}) == 25.0, "Uniform row loaded");
        result.check(e.get_field_value("corona_discharge", {0, 0, 10}) == 0.8, "Region row loaded");
        auto v = e.get_field_vector("ac_field_vector", {0, 0, 0});
        result.check(v && v->z == 120.0, "Vector row loaded");
        auto src = e.get_nearby_sources({0, 0, 10}, 10.0);
        result.check(src.size() == 1 && src[0].frequency_hz == 180.0 && src[0].strength == 2.0,
                     "Source row loaded (value = strength)");
        result.check(!env::try_field_value(e, "temperature_celsius", {100, 0, 0}), "Bounds rows loaded");
        result.check(e.field_count() == 3, "Unknown kind skipped");
    } catch (const std::exception& ex) {
        result.fail(std::string("load_csv threw: ") + ex.what());
    }

    std::remove(path);
}

// Test 6: Bad tables
void test_bad_tables(TestResult& result) {
    std::cout << "\n=== Test 6: Malformed Tables ===\n";

    bool missing_thrown = false;
    try {
        (void)env::StaticEnvironment::load_csv("/tmp/nonexistent_twinsense_env.csv");
    } catch (const std::runtime_error&) {
        missing_thrown = true;
    }
    result.check(missing_thrown, "Missing file raises runtime_error");

    const char* bad_number = "/tmp/test_twinsense_env_bad.csv";
    {
        std::ofstream f(bad_number);
        f << "kind,name,x,y,z,radius,value\n";
        f << "uniform,pm2_5,0,0,0,,lots\n";
    }
    bool bad_thrown = false;
    try {
        (void)env::StaticEnvironment::load_csv(bad_number);
    } catch (const std::runtime_error&) {
        bad_thrown = true;
    }
    result.check(bad_thrown, "Malformed number raises runtime_error");
    std::remove(bad_number);

    const char* no_kind = "/tmp/test_twinsense_env_nokind.csv";
    {
        std::ofstream f(no_kind);
        f << "name,x,y,z,value\n";
        f << "pm2_5,0,0,0,3\n";
    }
    bool col_thrown = false;
    try {
        (void)env::StaticEnvironment::load_csv(no_kind);
    } catch (const std::runtime_error&) {
        col_thrown = true;
    }
    result.check(col_thrown, "Missing 'kind' column raises runtime_error");
    std::remove(no_kind);
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            StaticEnvironment Unit Tests                     ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_scalar_fields(result);
    test_vector_fields(result);
    test_sources(result);
    test_bounds(result);
    test_load_csv(result);
    test_bad_tables(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}

// src/sim/sim_main.cpp
#include "sim/scenario_runner.hpp"
#include "config/scenario_config.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options] [scenario.yaml]\n", prog_name);
    printf("\nOptions:\n");
    printf("  --threads N           Worker threads per timestep (default: from YAML)\n");
    printf("  --dt SEC              Timestep in seconds (default: from YAML)\n");
    printf("  --duration SEC        Scenario duration in seconds (default: from YAML)\n");
    printf("  --seed N              Global random seed, 0 = nondeterministic (default: from YAML)\n");
    printf("  --csv PATH            Output CSV path (default: from YAML)\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off (default: info)\n");
    printf("  --log-file PATH       Also write log lines to PATH\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # Built-in substation scenario:\n");
    printf("  %s config/scenarios/substation.yaml\n\n", prog_name);
    printf("  # Scripted environment, 4 workers, reproducible:\n");
    printf("  %s --threads 4 --seed 7 config/scenarios/substation_lua.yaml\n\n", prog_name);
}

int main(int argc, char** argv) {
    std::string scenario_path = "config/scenarios/substation.yaml";
    sim::RunnerOptions opts;

    // Command-line overrides, applied after the YAML is loaded
    int threads = -1;
    double dt_s = -1.0;
    double duration_s = -1.0;
    long long seed = -1;
    std::string csv_out;
    utils::LogLevel level = utils::LogLevel::Info;

    // ========================================================================
    // Command-line parsing
    // ========================================================================
    static struct option long_options[] = {
        {"threads",   required_argument, 0, 'j'},
        {"dt",        required_argument, 0, 'd'},
        {"duration",  required_argument, 0, 'D'},
        {"seed",      required_argument, 0, 's'},
        {"csv",       required_argument, 0, 'o'},
        {"log-level", required_argument, 0, 'l'},
        {"log-file",  required_argument, 0, 'L'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'j':
                threads = std::atoi(optarg);
                if (threads <= 0) {
                    fprintf(stderr, "Error: Invalid thread count: %s\n", optarg);
                    return 1;
                }
                break;
            case 'd':
                dt_s = std::atof(optarg);
                if (dt_s <= 0) {
                    fprintf(stderr, "Error: Invalid timestep: %s (must be > 0)\n", optarg);
                    return 1;
                }
                break;
            case 'D':
                duration_s = std::atof(optarg);
                if (duration_s < 0) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return 1;
                }
                break;
            case 's':
                seed = std::atoll(optarg);
                if (seed < 0) {
                    fprintf(stderr, "Error: Invalid seed: %s\n", optarg);
                    return 1;
                }
                break;
            case 'o':
                csv_out = optarg;
                break;
            case 'l':
                if (!utils::parse_level(optarg, level)) {
                    fprintf(stderr, "Error: Unknown log level: %s\n", optarg);
                    return 1;
                }
                break;
            case 'L':
                opts.debug_log_path = optarg;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (optind < argc) {
        scenario_path = argv[optind];
    }

    utils::set_level(level);

    // ========================================================================
    // Load scenario, run
    // ========================================================================
    try {
        config::ScenarioConfig scenario = config::ScenarioConfig::load(scenario_path);

        if (threads > 0) scenario.threads = static_cast<unsigned>(threads);
        if (dt_s > 0) scenario.dt_s = dt_s;
        if (duration_s >= 0) scenario.duration_s = duration_s;
        if (seed >= 0) scenario.seed = static_cast<uint64_t>(seed);
        if (!csv_out.empty()) scenario.csv_out = csv_out;

        scenario.validate();
        scenario.print_summary();

        LOG_INFO("========================================");
        LOG_INFO("Digital-Twin Sensor Simulation");
        LOG_INFO("Scenario: %s", scenario_path.c_str());
        LOG_INFO("========================================");

        sim::ScenarioRunner runner(scenario, opts);
        return runner.run();

    } catch (const config::ConfigError& e) {
        LOG_ERROR("Configuration error: %s", e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Simulation failed: %s", e.what());
        return 1;
    }
}

// src/sensors/sensor_bank.cpp
#include "sensors/sensor_bank.hpp"
#include "sensors/sensor_registry.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <exception>
#include <thread>

namespace sensors {

void SensorBank::build(const std::vector<config::SensorSpec>& specs) {
    // Propagate global seed to individual sensors
    uint64_t seed_offset = 1;

    for (const auto& spec : specs) {
        config::SensorSpec s = spec;
        if (s.seed == 0 && cfg_.random_seed != 0) {
            s.seed = cfg_.random_seed + seed_offset;
        }
        ++seed_offset;
        add_sensor(make_sensor(s));
    }

    LOG_INFO("[SensorBank] %zu sensors (%zu enabled), %u worker threads",
             sensor_count(), enabled_count(), cfg_.threads);
}

void SensorBank::add_sensor(std::unique_ptr<SensorBase> sensor) {
    if (!sensor) {
        LOG_WARN("[SensorBank] Attempted to add null sensor");
        return;
    }
    sensors_.push_back(std::move(sensor));
}

std::vector<LabeledSample> SensorBank::sample_all(const env::EnvironmentQuery& env,
                                                  uint64_t timestamp_usec,
                                                  double elapsed_hours) {
    std::vector<SensorBase*> active;
    for (auto& sensor : sensors_) {
        if (sensor->enabled()) {
            active.push_back(sensor.get());
        }
    }

    std::vector<LabeledSample> samples(active.size());
    const SampleContext ctx{env, timestamp_usec, elapsed_hours};

    const size_t workers = std::min<size_t>(std::max(1u, cfg_.threads), active.size());
    if (workers <= 1) {
        for (size_t i = 0; i < active.size(); ++i) {
            samples[i] = active[i]->sample(ctx);
        }
        return samples;
    }

    // Worker w samples indices w, w + workers, ...; each slot has one writer
    std::vector<std::exception_ptr> errors(workers);
    std::vector<std::thread> pool;
    pool.reserve(workers);

    for (size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&, w]() {
            try {
                for (size_t i = w; i < active.size(); i += workers) {
                    samples[i] = active[i]->sample(ctx);
                }
            } catch (...) {
                // rethrown below once every worker has joined
                errors[w] = std::current_exception();
            }
        });
    }

    for (auto& t : pool) {
        t.join();
    }

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    return samples;
}

void SensorBank::reset() {
    for (auto& sensor : sensors_) {
        sensor->reset();
    }
}

SensorBase* SensorBank::get_sensor(const std::string& id) {
    for (auto& sensor : sensors_) {
        if (sensor->id() == id) {
            return sensor.get();
        }
    }
    return nullptr;
}

std::vector<SensorMetadata> SensorBank::metadata() const {
    std::vector<SensorMetadata> out;
    out.reserve(sensors_.size());
    for (const auto& sensor : sensors_) {
        out.push_back(sensor->metadata());
    }
    return out;
}

size_t SensorBank::enabled_count() const {
    size_t count = 0;
    for (const auto& sensor : sensors_) {
        if (sensor->enabled()) {
            ++count;
        }
    }
    return count;
}

} // namespace sensors

// utils/noise.hpp
#pragma once

#include <cmath>
#include <cstdint>
#include <random>

namespace utils {

/**
 * mix_seed - splitmix64 finalizer over (stream, counter)
 *
 * Derives an independent, reproducible seed for one sample of one sensor
 * stream. Never returns 0 (0 means "non-deterministic" to NoiseGenerator).
 */
inline uint64_t mix_seed(uint64_t stream, uint64_t counter) {
    uint64_t z = stream + 0x9E3779B97F4A7C15ULL * (counter + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    z = z ^ (z >> 31);
    return z == 0 ? 1 : z;
}

/**
 * NoiseGenerator - Random source for sensor imperfections
 *
 * Not shared between threads: every sample creates its own generator
 * from a derived seed, so parallel runs stay reproducible.
 */
class NoiseGenerator {
public:
    explicit NoiseGenerator(uint64_t seed = 0)
        : gen_(seed == 0 ? std::random_device{}() : seed),
          normal_(0.0, 1.0)
    {}

    /**
     * Gaussian white noise: N(0, stddev)
     */
    double gaussian(double stddev) {
        if (stddev <= 0.0) return 0.0;
        return normal_(gen_) * stddev;
    }

    /**
     * Gaussian with mean: N(mean, stddev)
     */
    double gaussian(double mean, double stddev) {
        return mean + gaussian(stddev);
    }

private:
    std::mt19937_64 gen_;
    std::normal_distribution<double> normal_;
};

/**
 * Quantizer - Simulates ADC quantization
 */
class Quantizer {
public:
    explicit Quantizer(double resolution = 0.0)
        : resolution_(resolution)
    {}

    double quantize(double value) const {
        if (resolution_ <= 0.0) return value;

        // Round to nearest quantum
        return std::round(value / resolution_) * resolution_;
    }

private:
    double resolution_;
};

} // namespace utils

// src/sensors/sensor_base.hpp
#pragma once

#include "env/environment_query.hpp"
#include "sensors/sensor_out.hpp"
#include <string>

namespace sensors {

/**
 * SampleContext - Environment and clock for one timestep
 */
struct SampleContext {
    const env::EnvironmentQuery& env;
    uint64_t timestamp_usec = 0;
    double elapsed_hours = 0.0;     // operating time driving drift
};

/**
 * SensorBase - Abstract interface for all sensors
 *
 * Per sample:
 * 1. read_ideal(ctx)               → true value at the sensor position
 * 2. apply_imperfections(ideal)    → observed reading
 * 3. get_ground_truth(ctx)         → labels (may use the last observed value)
 *
 * Step 2 must finish before step 3. Different sensors may be sampled
 * concurrently; a single sensor is never sampled from two threads at once.
 */
class SensorBase {
public:
    virtual ~SensorBase() = default;

    virtual IdealReading read_ideal(const SampleContext& ctx) const = 0;

    virtual ObservedReading apply_imperfections(const IdealReading& ideal,
                                                const SampleContext& ctx) = 0;

    virtual std::vector<labels::AnomalyLabel> get_ground_truth(const SampleContext& ctx) const = 0;

    /**
     * Run the full sample sequence
     */
    LabeledSample sample(const SampleContext& ctx) {
        LabeledSample s;
        s.observed = apply_imperfections(read_ideal(ctx), ctx);
        s.ground_truth = get_ground_truth(ctx);
        s.sensor_id = s.observed.sensor_id;
        s.timestamp_usec = s.observed.timestamp_usec;
        s.position = s.observed.position;
        s.modality = s.observed.modality;
        return s;
    }

    /**
     * Identity, resolved parameters and pipeline of this sensor
     */
    virtual SensorMetadata metadata() const = 0;

    /**
     * Forget the last observed value
     */
    virtual void reset() = 0;

    virtual const std::string& id() const = 0;
    virtual config::Modality modality() const = 0;

    virtual const utils::Vec3& position() const = 0;
    virtual void set_position(const utils::Vec3& p) = 0;

    bool enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }

protected:
    bool enabled_ = true;
};

} // namespace sensors

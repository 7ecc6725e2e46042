// src/stages/stage_pipeline.hpp
#pragma once

#include "stages/imperfection_stage.hpp"
#include <memory>
#include <vector>

namespace stages {

/**
 * StagePipeline - Threads a reading through an ordered set of stages
 *
 * Responsibilities:
 * - Own registered stages
 * - Keep them sorted by rank
 * - Run them in that order
 *
 * Usage:
 *   StagePipeline pipeline;
 *   pipeline.register_stage(std::make_unique<NoiseInjectionStage>(cfg.noise));
 *   pipeline.register_stage(std::make_unique<CalibrationDriftStage>(cfg.calibration));
 *
 *   // Per sample (calibration runs before noise regardless of registration order):
 *   ReadingState out = pipeline.run(in, ctx);
 */
class StagePipeline {
public:
    StagePipeline() = default;
    ~StagePipeline() = default;

    // Non-copyable (owns unique_ptr stages)
    StagePipeline(const StagePipeline&) = delete;
    StagePipeline& operator=(const StagePipeline&) = delete;
    StagePipeline(StagePipeline&&) = default;
    StagePipeline& operator=(StagePipeline&&) = default;

    /**
     * register_stage() - Add a stage
     *
     * Stages run in rank order (lower = earlier); equal ranks keep
     * registration order.
     */
    void register_stage(std::unique_ptr<ImperfectionStage> stage);

    /**
     * run() - Apply every stage in order to one reading
     */
    ReadingState run(const ReadingState& in, StageContext& ctx) const;

    /**
     * find_stage() - Find stage by name, nullptr if not registered
     */
    const ImperfectionStage* find_stage(const char* name) const;

    /**
     * get_stage() - Stage by execution index, nullptr if out of bounds
     */
    const ImperfectionStage* get_stage(size_t index) const;

    size_t stage_count() const { return stages_.size(); }

private:
    std::vector<std::unique_ptr<ImperfectionStage>> stages_;

    void sort_by_rank();
};

} // namespace stages

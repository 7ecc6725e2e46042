// src/stages/stage_pipeline.cpp
#include "stages/stage_pipeline.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cstring>

namespace stages {

std::string component::harmonic(int order) {
    const char* suffix = "th";
    switch (order % 10) {
        case 1: suffix = (order % 100 == 11) ? "th" : "st"; break;
        case 2: suffix = (order % 100 == 12) ? "th" : "nd"; break;
        case 3: suffix = (order % 100 == 13) ? "th" : "rd"; break;
        default: break;
    }
    return std::to_string(order) + suffix;
}

void StagePipeline::register_stage(std::unique_ptr<ImperfectionStage> stage) {
    if (!stage) {
        LOG_WARN("[StagePipeline] Attempted to register null stage");
        return;
    }

    LOG_DEBUG("[StagePipeline] Registering stage: %s (rank %d)", stage->name(), stage->rank());

    stages_.push_back(std::move(stage));

    // Sort after each registration to maintain rank order
    sort_by_rank();
}

ReadingState StagePipeline::run(const ReadingState& in, StageContext& ctx) const {
    ReadingState state = in;
    for (const auto& stage : stages_) {
        state = stage->apply(state, ctx);
        LOG_TRACE("[StagePipeline] %s after %s: %.6f",
                  ctx.sensor_id.c_str(), stage->name(), state.primary);
    }
    return state;
}

const ImperfectionStage* StagePipeline::find_stage(const char* name) const {
    if (!name) return nullptr;

    for (const auto& stage : stages_) {
        if (std::strcmp(stage->name(), name) == 0) {
            return stage.get();
        }
    }

    return nullptr;
}

const ImperfectionStage* StagePipeline::get_stage(size_t index) const {
    if (index >= stages_.size()) {
        return nullptr;
    }
    return stages_[index].get();
}

void StagePipeline::sort_by_rank() {
    std::stable_sort(stages_.begin(), stages_.end(),
                     [](const std::unique_ptr<ImperfectionStage>& a,
                        const std::unique_ptr<ImperfectionStage>& b) {
                         return a->rank() < b->rank();
                     });
}

} // namespace stages

#pragma once

#include "cce_compute_backend.h"
#include "cce_engine_config.h"
#include "cce_errors.h"
#include "cce_job_parameters.h"
#include "cce_progress.h"
#include "cce_time.h"
#include <string>

namespace cce {

// Terminal success result of one run
struct JobResult {
    std::string output_path;
    TimeUS duration_us = 0;
    int64_t frames_written = 0;
    // Frames with the foreground actually blended in
    int64_t frames_composited = 0;
    int width = 0;
    int height = 0;
    Rate rate{0, 1};
    BackendKind backend = BackendKind::Cpu;
    double elapsed_seconds = 0.0;
};

// Runs one compositing job: decode -> key -> transform -> logo -> encode,
// then audio mixing and muxing. Holds no state across runs.
class PipelineDriver {
public:
    explicit PipelineDriver(EngineConfig config = EngineConfig());

    // On failure or cancellation the intermediate and output files are
    // removed and the error carries the frame index where applicable.
    Result<JobResult> Run(const JobParameters& params,
                          const ProgressCallback& progress = ProgressCallback(),
                          const CancellationToken* cancel = nullptr) const;

    const EngineConfig& config() const { return m_config; }

private:
    EngineConfig m_config;
};

} // namespace cce

#pragma once

#include "cce_color_mask.h"
#include "cce_frame_transformer.h"
#include "cce_mask_refiner.h"
#include "cce_timing_gate.h"
#include <opencv2/core.hpp>
#include <memory>

namespace cce {

class JobParameters;

enum class BackendKind {
    Cpu,
    OpenCL
};

const char* backend_kind_to_string(BackendKind kind);

// Per-job keying configuration shared by both backends
struct KeyingConfig {
    KeyColorSpec key;
    MaskRefinerConfig refine;
    TransformConfig transform;

    static KeyingConfig FromJob(const JobParameters& params);
};

// Executes mask -> refine -> transform for one job.
// Selected once at job start and never switched mid-run. Keeps the most
// recently keyed foreground so it can be reused for repeated output frames.
class ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    virtual BackendKind kind() const = 0;

    // Key and scale a foreground frame (CV_8UC3), replacing the cached one
    virtual void key_foreground(const cv::Mat& foreground_bgr) = 0;

    // Blend the cached foreground onto background (CV_8UC3) in place.
    // Does nothing without a cached foreground, with an inactive gate or
    // with zero opacity.
    virtual void composite(cv::Mat& background, GateState gate) = 0;

    virtual bool has_foreground() const = 0;
};

// Plain cv::Mat path, deterministic
std::unique_ptr<ComputeBackend> create_cpu_backend(const KeyingConfig& config);

// OpenCL path through cv::UMat. Returns Internal when no usable device exists.
Result<std::unique_ptr<ComputeBackend>> create_opencl_backend(const KeyingConfig& config);

// OpenCL when requested and available, otherwise CPU (logged warning)
std::unique_ptr<ComputeBackend> select_compute_backend(const KeyingConfig& config, bool gpu_accel);

} // namespace cce

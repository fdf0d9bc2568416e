#include <chroma_composite_engine/cce_compute_backend.h>
#include <chroma_composite_engine/cce_job_parameters.h>
#include "cce_logging.h"

namespace cce {

const char* backend_kind_to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Cpu:    return "cpu";
        case BackendKind::OpenCL: return "opencl";
    }
    return "cpu";
}

KeyingConfig KeyingConfig::FromJob(const JobParameters& params) {
    KeyingConfig config;
    config.key = params.key_color();

    // Fast mode skips mask cleanup and spill suppression
    config.refine.key = params.key_color();
    config.refine.edge_blur = params.edge_blur_radius();
    config.refine.spill_strength = params.fast_mode() ? 0.0 : params.spill_reduction_strength();
    config.refine.cleanup = !params.fast_mode();

    config.transform.scale = params.scale();
    config.transform.position_x = params.position_x();
    config.transform.position_y = params.position_y();
    config.transform.opacity = params.opacity();
    config.transform.fast = params.fast_mode();
    return config;
}

std::unique_ptr<ComputeBackend> select_compute_backend(const KeyingConfig& config, bool gpu_accel) {
    if (gpu_accel) {
        auto gpu = create_opencl_backend(config);
        if (gpu.is_ok()) {
            qCInfo(cceKeying, "Using OpenCL compute backend");
            return std::move(gpu.value());
        }
        qCWarning(cceKeying, "GPU acceleration unavailable, falling back to CPU: %s",
                  gpu.error().message.c_str());
    }
    qCInfo(cceKeying, "Using CPU compute backend");
    return create_cpu_backend(config);
}

} // namespace cce

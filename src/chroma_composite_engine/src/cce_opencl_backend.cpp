#include <chroma_composite_engine/cce_compute_backend.h>
#include "cce_logging.h"
#include <opencv2/core/ocl.hpp>
#include <opencv2/imgproc.hpp>

namespace cce {

namespace {

// cv::UMat path. OpenCV dispatches the kernels to the default OpenCL device;
// reading results back into cv::Mat synchronizes with the queue, so the
// driver sees an ordered, synchronous interface. Spill suppression runs on
// the host.
class OpenCLBackend : public ComputeBackend {
public:
    explicit OpenCLBackend(const KeyingConfig& config)
        : m_mask(config.key), m_refiner(config.refine), m_transformer(config.transform) {}

    BackendKind kind() const override { return BackendKind::OpenCL; }

    void key_foreground(const cv::Mat& foreground_bgr) override {
        foreground_bgr.copyTo(m_foreground);
        m_mask.generate(m_foreground, m_backdrop);
        m_refiner.refine(m_backdrop, m_alpha);

        if (m_refiner.spill_enabled()) {
            cv::Mat despilled = foreground_bgr.clone();
            cv::Mat alpha;
            m_alpha.copyTo(alpha);
            m_refiner.suppress_spill(despilled, alpha);
            despilled.copyTo(m_foreground);
        }

        m_transformer.resize(m_foreground, m_alpha, m_scaled_foreground, m_scaled_alpha);
        m_has_foreground = true;
    }

    void composite(cv::Mat& background, GateState gate) override {
        const double opacity = m_transformer.config().opacity;
        if (!m_has_foreground || gate == GateState::Inactive || opacity <= 0.0) {
            return;
        }

        const cv::Point at = m_transformer.origin(m_scaled_foreground.size(), background.size());
        const Placement placement = Placement::clip(m_scaled_foreground.size(), background.size(),
                                                    at.x, at.y);
        if (placement.empty()) {
            return;
        }

        cv::Mat dst = background(placement.dst);
        dst.copyTo(m_background_roi);

        m_scaled_alpha(placement.src).convertTo(m_weight_fg, CV_32F, opacity / 255.0);
        cv::subtract(cv::Scalar::all(1.0), m_weight_fg, m_weight_bg);
        cv::blendLinear(m_scaled_foreground(placement.src), m_background_roi,
                        m_weight_fg, m_weight_bg, m_blended);
        m_blended.copyTo(dst);
    }

    bool has_foreground() const override { return m_has_foreground; }

private:
    ColorMaskGenerator m_mask;
    MaskRefiner m_refiner;
    FrameTransformer m_transformer;

    cv::UMat m_foreground;
    cv::UMat m_backdrop;
    cv::UMat m_alpha;
    cv::UMat m_scaled_foreground;
    cv::UMat m_scaled_alpha;
    cv::UMat m_background_roi;
    cv::UMat m_weight_fg;
    cv::UMat m_weight_bg;
    cv::UMat m_blended;
    bool m_has_foreground = false;
};

} // namespace

Result<std::unique_ptr<ComputeBackend>> create_opencl_backend(const KeyingConfig& config) {
    if (!cv::ocl::haveOpenCL()) {
        return Error::internal("OpenCL runtime not available");
    }
    cv::ocl::setUseOpenCL(true);
    if (!cv::ocl::useOpenCL()) {
        return Error::internal("OpenCL could not be enabled");
    }

    // Smoke test: allocate on the device and run one kernel
    try {
        cv::UMat probe(64, 64, CV_8UC3, cv::Scalar::all(0));
        cv::UMat probe_hsv;
        cv::cvtColor(probe, probe_hsv, cv::COLOR_BGR2HSV);
        cv::Mat readback;
        probe_hsv.copyTo(readback);
    } catch (const cv::Exception& e) {
        cv::ocl::setUseOpenCL(false);
        return Error::internal(std::string("OpenCL self-test failed: ") + e.what());
    }

    const cv::ocl::Device& device = cv::ocl::Device::getDefault();
    qCInfo(cceKeying, "OpenCL device: %s (%s)", device.name().c_str(), device.vendorName().c_str());

    std::unique_ptr<ComputeBackend> backend = std::make_unique<OpenCLBackend>(config);
    return Result<std::unique_ptr<ComputeBackend>>(std::move(backend));
}

} // namespace cce

#include <chroma_composite_engine/cce_compute_backend.h>

namespace cce {

namespace {

// cv::Mat path. Buffers are kept across frames and reallocated only when
// the frame size changes.
class CpuBackend : public ComputeBackend {
public:
    explicit CpuBackend(const KeyingConfig& config)
        : m_mask(config.key), m_refiner(config.refine), m_transformer(config.transform) {}

    BackendKind kind() const override { return BackendKind::Cpu; }

    void key_foreground(const cv::Mat& foreground_bgr) override {
        m_mask.generate(foreground_bgr, m_backdrop);
        m_refiner.refine(m_backdrop, m_alpha);

        if (m_refiner.spill_enabled()) {
            foreground_bgr.copyTo(m_despilled);
            m_refiner.suppress_spill(m_despilled, m_alpha);
            m_transformer.resize(m_despilled, m_alpha, m_scaled_foreground, m_scaled_alpha);
        } else {
            m_transformer.resize(foreground_bgr, m_alpha, m_scaled_foreground, m_scaled_alpha);
        }
        m_has_foreground = true;
    }

    void composite(cv::Mat& background, GateState gate) override {
        if (!m_has_foreground) {
            return;
        }
        m_transformer.apply(m_scaled_foreground, m_scaled_alpha, background, gate);
    }

    bool has_foreground() const override { return m_has_foreground; }

private:
    ColorMaskGenerator m_mask;
    MaskRefiner m_refiner;
    FrameTransformer m_transformer;

    cv::Mat m_backdrop;
    cv::Mat m_alpha;
    cv::Mat m_despilled;
    cv::Mat m_scaled_foreground;
    cv::Mat m_scaled_alpha;
    bool m_has_foreground = false;
};

} // namespace

std::unique_ptr<ComputeBackend> create_cpu_backend(const KeyingConfig& config) {
    return std::make_unique<CpuBackend>(config);
}

} // namespace cce

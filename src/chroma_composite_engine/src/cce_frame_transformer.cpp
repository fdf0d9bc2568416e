#include <chroma_composite_engine/cce_frame_transformer.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace cce {

namespace {

// Full-scale blend weight: alpha (0..255) * opacity (0..255)
constexpr uint32_t WEIGHT_ONE = 255 * 255;

int scaled_dimension(int length, double scale) {
    const double scaled = std::round(static_cast<double>(length) * scale);
    if (!(scaled >= 1.0)) {
        return 1;
    }
    return static_cast<int>(std::min(scaled, static_cast<double>(MAX_SCALED_DIMENSION)));
}

int floor_div2(int v) {
    return v >= 0 ? v / 2 : -((-v + 1) / 2);
}

template <typename MatT>
void resize_pair(const MatT& foreground, const MatT& alpha, MatT& foreground_out, MatT& alpha_out,
                 const FrameTransformer& transformer) {
    CV_Assert(foreground.size() == alpha.size());

    const cv::Size target = transformer.scaled_size(foreground.size());
    if (target == foreground.size()) {
        foreground_out = foreground;
        alpha_out = alpha;
        return;
    }
    const int interp = transformer.interpolation(foreground.size(), target);
    cv::resize(foreground, foreground_out, target, 0, 0, interp);
    cv::resize(alpha, alpha_out, target, 0, 0, interp);
}

} // namespace

Result<cv::Size> scale_size(cv::Size size, double scale, const char* field) {
    const double w = std::round(static_cast<double>(size.width) * scale);
    const double h = std::round(static_cast<double>(size.height) * scale);
    if (!std::isfinite(w) || !std::isfinite(h) || w > MAX_SCALED_DIMENSION || h > MAX_SCALED_DIMENSION) {
        return Error::invalid_parameter(field, "scaled size exceeds " +
                                                   std::to_string(MAX_SCALED_DIMENSION) + " pixels");
    }
    return cv::Size(scaled_dimension(size.width, scale), scaled_dimension(size.height, scale));
}

Placement Placement::clip(cv::Size src_size, cv::Size dst_size, int x, int y) {
    Placement placement;
    cv::Rect wanted(x, y, src_size.width, src_size.height);
    placement.dst = wanted & cv::Rect(0, 0, dst_size.width, dst_size.height);
    if (placement.dst.area() <= 0) {
        placement.dst = cv::Rect();
        placement.src = cv::Rect();
        return placement;
    }
    placement.src = cv::Rect(placement.dst.x - x, placement.dst.y - y,
                             placement.dst.width, placement.dst.height);
    return placement;
}

void blend_over(const cv::Mat& src_bgr, const cv::Mat& alpha, cv::Mat& dst_bgr,
                int x, int y, double opacity) {
    CV_Assert(src_bgr.type() == CV_8UC3 && dst_bgr.type() == CV_8UC3);
    CV_Assert(alpha.type() == CV_8UC1 && alpha.size() == src_bgr.size());

    const long op = std::lround(std::min(1.0, std::max(0.0, opacity)) * 255.0);
    if (op == 0) {
        return;
    }
    const Placement placement = Placement::clip(src_bgr.size(), dst_bgr.size(), x, y);
    if (placement.empty()) {
        return;
    }

    const int width = placement.dst.width;
    for (int row = 0; row < placement.dst.height; ++row) {
        const uint8_t* s = src_bgr.ptr<uint8_t>(placement.src.y + row) + 3 * placement.src.x;
        const uint8_t* a = alpha.ptr<uint8_t>(placement.src.y + row) + placement.src.x;
        uint8_t* d = dst_bgr.ptr<uint8_t>(placement.dst.y + row) + 3 * placement.dst.x;

        for (int i = 0; i < width; ++i) {
            const uint32_t w = static_cast<uint32_t>(a[i]) * static_cast<uint32_t>(op);
            if (w == 0) {
                continue;
            }
            uint8_t* dp = d + 3 * i;
            const uint8_t* sp = s + 3 * i;
            if (w == WEIGHT_ONE) {
                dp[0] = sp[0];
                dp[1] = sp[1];
                dp[2] = sp[2];
                continue;
            }
            const uint32_t inv = WEIGHT_ONE - w;
            for (int c = 0; c < 3; ++c) {
                dp[c] = static_cast<uint8_t>((dp[c] * inv + sp[c] * w + WEIGHT_ONE / 2) / WEIGHT_ONE);
            }
        }
    }
}

FrameTransformer::FrameTransformer(const TransformConfig& config)
    : m_config(config) {
}

cv::Size FrameTransformer::scaled_size(cv::Size foreground) const {
    return cv::Size(scaled_dimension(foreground.width, m_config.scale),
                    scaled_dimension(foreground.height, m_config.scale));
}

cv::Point FrameTransformer::origin(cv::Size scaled_foreground, cv::Size background) const {
    return cv::Point(floor_div2(background.width - scaled_foreground.width) + m_config.position_x,
                     floor_div2(background.height - scaled_foreground.height) + m_config.position_y);
}

int FrameTransformer::interpolation(cv::Size src, cv::Size dst) const {
    if (m_config.fast) {
        return cv::INTER_LINEAR;
    }
    if (dst.area() < src.area()) {
        return cv::INTER_AREA;
    }
    return cv::INTER_CUBIC;
}

void FrameTransformer::resize(const cv::Mat& foreground, const cv::Mat& alpha,
                              cv::Mat& foreground_out, cv::Mat& alpha_out) const {
    resize_pair(foreground, alpha, foreground_out, alpha_out, *this);
}

void FrameTransformer::resize(const cv::UMat& foreground, const cv::UMat& alpha,
                              cv::UMat& foreground_out, cv::UMat& alpha_out) const {
    resize_pair(foreground, alpha, foreground_out, alpha_out, *this);
}

void FrameTransformer::apply(const cv::Mat& scaled_foreground, const cv::Mat& scaled_alpha,
                             cv::Mat& background, GateState gate) const {
    if (gate == GateState::Inactive || m_config.opacity <= 0.0) {
        return;
    }
    const cv::Point at = origin(scaled_foreground.size(), background.size());
    blend_over(scaled_foreground, scaled_alpha, background, at.x, at.y, m_config.opacity);
}

} // namespace cce

#pragma once

#include "cce_errors.h"
#include "cce_timing_gate.h"
#include <opencv2/core.hpp>

namespace cce {

// Largest width or height a scaled overlay may reach
constexpr int MAX_SCALED_DIMENSION = 16384;

// size * scale, rounded, at least 1x1. InvalidParameter(field) when either
// side would exceed MAX_SCALED_DIMENSION.
Result<cv::Size> scale_size(cv::Size size, double scale, const char* field);

struct TransformConfig {
    double scale = 1.0;
    // Signed pixel offsets of the foreground center from the background center
    int position_x = 0;
    int position_y = 0;
    double opacity = 1.0;
    // Bilinear resampling instead of area/cubic
    bool fast = true;
};

// Overlap of a source image placed at (x, y) on a destination frame.
// Both rectangles are empty when the source lies fully outside.
struct Placement {
    cv::Rect dst;   // in destination coordinates
    cv::Rect src;   // in source coordinates, same size as dst

    bool empty() const { return dst.area() <= 0; }

    static Placement clip(cv::Size src_size, cv::Size dst_size, int x, int y);
};

// Blend src over dst at (x, y):
//   out = dst * (1 - alpha * opacity) + src * (alpha * opacity)
// alpha is CV_8UC1 (255 = opaque). Integer arithmetic; alpha * opacity == 0
// leaves dst bytes unchanged.
void blend_over(const cv::Mat& src_bgr, const cv::Mat& alpha, cv::Mat& dst_bgr,
                int x, int y, double opacity);

// Scales the keyed foreground and composites it onto the background
class FrameTransformer {
public:
    explicit FrameTransformer(const TransformConfig& config);

    // Size after scaling (at least 1x1, at most MAX_SCALED_DIMENSION a side)
    cv::Size scaled_size(cv::Size foreground) const;

    // Top-left corner of the scaled foreground on the background
    cv::Point origin(cv::Size scaled_foreground, cv::Size background) const;

    // cv::INTER_* used to go from src to dst
    int interpolation(cv::Size src, cv::Size dst) const;

    // Resize foreground and alpha by the configured scale
    void resize(const cv::Mat& foreground, const cv::Mat& alpha,
                cv::Mat& foreground_out, cv::Mat& alpha_out) const;
    void resize(const cv::UMat& foreground, const cv::UMat& alpha,
                cv::UMat& foreground_out, cv::UMat& alpha_out) const;

    // Blend an already scaled foreground onto background in place.
    // Inactive gate or zero opacity leaves background untouched.
    void apply(const cv::Mat& scaled_foreground, const cv::Mat& scaled_alpha,
               cv::Mat& background, GateState gate) const;

    const TransformConfig& config() const { return m_config; }

private:
    TransformConfig m_config;
};

} // namespace cce

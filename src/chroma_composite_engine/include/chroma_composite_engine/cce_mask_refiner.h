#pragma once

#include "cce_key_color.h"
#include <opencv2/core.hpp>

namespace cce {

struct MaskRefinerConfig {
    // Gaussian kernel size; 0 or 1 disables blurring, otherwise odd
    int edge_blur = 5;
    // 0 disables spill suppression
    double spill_strength = 0.0;
    // 3x3 open/close before blurring
    bool cleanup = true;
    KeyColorSpec key;
};

// Turns a hard backdrop mask into a soft subject alpha and removes
// key-colored fringe from subject edges.
class MaskRefiner {
public:
    explicit MaskRefiner(const MaskRefinerConfig& config);

    // backdrop_mask: CV_8UC1, 255 = backdrop.
    // alpha: CV_8UC1, 255 = keep foreground.
    void refine(const cv::Mat& backdrop_mask, cv::Mat& alpha) const;
    void refine(const cv::UMat& backdrop_mask, cv::UMat& alpha) const;

    // Pull the key channel of edge pixels down toward the strongest other
    // channel. Pixels inside the eroded fully-opaque subject are untouched.
    // No-op when spill_strength is 0.
    void suppress_spill(cv::Mat& foreground_bgr, const cv::Mat& alpha) const;

    bool spill_enabled() const { return m_config.spill_strength > 0.0; }

    // BGR channel index (0 = blue, 1 = green, 2 = red) closest to the key hue
    static int key_channel(const KeyColorSpec& key);

    const MaskRefinerConfig& config() const { return m_config; }

private:
    MaskRefinerConfig m_config;
    cv::Mat m_kernel;
};

} // namespace cce

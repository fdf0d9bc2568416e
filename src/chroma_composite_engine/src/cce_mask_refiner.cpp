#include <chroma_composite_engine/cce_mask_refiner.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace cce {

namespace {

template <typename MatT>
void backdrop_to_alpha(const MatT& backdrop, MatT& alpha, const MaskRefinerConfig& config,
                       const cv::Mat& kernel) {
    CV_Assert(backdrop.type() == CV_8UC1);

    if (config.cleanup) {
        // Drop isolated backdrop specks, then fill pinholes in the backdrop
        MatT opened;
        cv::morphologyEx(backdrop, opened, cv::MORPH_OPEN, kernel);
        cv::morphologyEx(opened, opened, cv::MORPH_CLOSE, kernel);
        cv::bitwise_not(opened, alpha);
    } else {
        cv::bitwise_not(backdrop, alpha);
    }

    if (config.edge_blur > 1) {
        cv::GaussianBlur(alpha, alpha, cv::Size(config.edge_blur, config.edge_blur), 0);
    }
}

int hue_distance(int a, int b) {
    int d = std::abs(a - b);
    return std::min(d, HUE_MAX + 1 - d);
}

} // namespace

MaskRefiner::MaskRefiner(const MaskRefinerConfig& config)
    : m_config(config),
      m_kernel(cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3))) {
}

void MaskRefiner::refine(const cv::Mat& backdrop_mask, cv::Mat& alpha) const {
    backdrop_to_alpha(backdrop_mask, alpha, m_config, m_kernel);
}

void MaskRefiner::refine(const cv::UMat& backdrop_mask, cv::UMat& alpha) const {
    backdrop_to_alpha(backdrop_mask, alpha, m_config, m_kernel);
}

int MaskRefiner::key_channel(const KeyColorSpec& key) {
    // OpenCV hue: red 0, green 60, blue 120
    const int center = key.hue_center();
    const int to_red = hue_distance(center, 0);
    const int to_green = hue_distance(center, 60);
    const int to_blue = hue_distance(center, 120);

    if (to_green <= to_red && to_green <= to_blue) return 1;
    if (to_blue <= to_red) return 0;
    return 2;
}

void MaskRefiner::suppress_spill(cv::Mat& foreground_bgr, const cv::Mat& alpha) const {
    if (!spill_enabled()) {
        return;
    }
    CV_Assert(foreground_bgr.type() == CV_8UC3 && alpha.type() == CV_8UC1);
    CV_Assert(foreground_bgr.size() == alpha.size());

    // Fully opaque pixels whose 3x3 neighbourhood is opaque are clearly subject
    cv::Mat solid;
    cv::Mat interior;
    cv::compare(alpha, 255, solid, cv::CMP_EQ);
    cv::erode(solid, interior, m_kernel);

    const int key = key_channel(m_config.key);
    const int other_a = (key + 1) % 3;
    const int other_b = (key + 2) % 3;
    const double strength = std::min(1.0, m_config.spill_strength);

    for (int y = 0; y < foreground_bgr.rows; ++y) {
        uint8_t* px = foreground_bgr.ptr<uint8_t>(y);
        const uint8_t* a = alpha.ptr<uint8_t>(y);
        const uint8_t* in = interior.ptr<uint8_t>(y);
        for (int x = 0; x < foreground_bgr.cols; ++x) {
            if (a[x] == 0 || in[x] != 0) {
                continue;
            }
            uint8_t* p = px + 3 * x;
            const int limit = std::max(p[other_a], p[other_b]);
            const int excess = p[key] - limit;
            if (excess > 0) {
                p[key] = static_cast<uint8_t>(p[key] - std::lround(strength * excess));
            }
        }
    }
}

} // namespace cce

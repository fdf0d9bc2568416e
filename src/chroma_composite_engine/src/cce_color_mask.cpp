#include <chroma_composite_engine/cce_color_mask.h>
#include <opencv2/imgproc.hpp>

namespace cce {

namespace {

template <typename MatT>
void classify_backdrop(const MatT& bgr, MatT& mask, const KeyColorSpec& key) {
    CV_Assert(bgr.type() == CV_8UC3);

    MatT hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

    const HsvTriplet& lo = key.lower;
    const HsvTriplet& hi = key.upper;
    if (!key.hue_wraps()) {
        cv::inRange(hsv, cv::Scalar(lo.h, lo.s, lo.v), cv::Scalar(hi.h, hi.s, hi.v), mask);
        return;
    }

    // [lo.h, 179] U [0, hi.h]
    MatT wrapped;
    cv::inRange(hsv, cv::Scalar(lo.h, lo.s, lo.v), cv::Scalar(HUE_MAX, hi.s, hi.v), mask);
    cv::inRange(hsv, cv::Scalar(0, lo.s, lo.v), cv::Scalar(hi.h, hi.s, hi.v), wrapped);
    cv::bitwise_or(mask, wrapped, mask);
}

} // namespace

ColorMaskGenerator::ColorMaskGenerator(const KeyColorSpec& key)
    : m_key(key) {
}

void ColorMaskGenerator::generate(const cv::Mat& bgr, cv::Mat& mask) const {
    classify_backdrop(bgr, mask, m_key);
}

void ColorMaskGenerator::generate(const cv::UMat& bgr, cv::UMat& mask) const {
    classify_backdrop(bgr, mask, m_key);
}

} // namespace cce

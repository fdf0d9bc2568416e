#pragma once

#include "cce_key_color.h"
#include <opencv2/core.hpp>

namespace cce {

// Classifies pixels of a BGR frame as backdrop (255) or subject (0).
// Stateless; cv::UMat inputs run through OpenCL when it is enabled.
class ColorMaskGenerator {
public:
    static constexpr uint8_t BACKDROP = 255;
    static constexpr uint8_t SUBJECT = 0;

    explicit ColorMaskGenerator(const KeyColorSpec& key);

    // bgr: CV_8UC3. mask: CV_8UC1 of the same size.
    void generate(const cv::Mat& bgr, cv::Mat& mask) const;
    void generate(const cv::UMat& bgr, cv::UMat& mask) const;

    const KeyColorSpec& key() const { return m_key; }

private:
    KeyColorSpec m_key;
};

} // namespace cce

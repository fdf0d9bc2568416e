#pragma once

#include "cce_time.h"
#include <opencv2/core.hpp>
#include <cstdint>

namespace cce {

// Single-channel 8-bit buffer with the dimensions of its source frame.
// Used both for the backdrop mask (255 = backdrop) and the subject alpha
// (255 = keep foreground).
using Mask = cv::Mat;

// Decoded video frame in BGR24 format (CV_8UC3, contiguous rows)
// Owned by the pipeline driver for one loop iteration.
class Frame {
public:
    Frame() = default;
    Frame(cv::Mat bgr, TimeUS pts_us, int64_t index);

    int width() const { return m_image.cols; }
    int height() const { return m_image.rows; }

    // Bytes per row
    int stride_bytes() const { return static_cast<int>(m_image.step[0]); }

    // Presentation timestamp relative to the first frame of the stream
    TimeUS pts_us() const { return m_pts_us; }

    // Decode order index (0-based)
    int64_t index() const { return m_index; }

    bool empty() const { return m_image.empty(); }

    const cv::Mat& image() const { return m_image; }
    cv::Mat& image() { return m_image; }

private:
    cv::Mat m_image;
    TimeUS m_pts_us = 0;
    int64_t m_index = -1;
};

} // namespace cce

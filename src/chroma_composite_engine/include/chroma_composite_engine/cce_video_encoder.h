#pragma once

#include "cce_errors.h"
#include "cce_time.h"
#include <opencv2/core.hpp>
#include <memory>
#include <string>

namespace cce {

class VideoEncoderImpl;

struct VideoEncoderConfig {
    int width = 0;
    int height = 0;
    Rate rate = canonical_rates::RATE_30;
    // Favor encode speed over compression (x264 "ultrafast")
    bool fast = true;
    // x264 constant rate factor
    int crf = 23;
    // Container format name; empty = guess from path extension
    std::string format_name;
};

// Encodes BGR24 frames into a video-only container.
// Frame i is stamped with pts = i on a 1/rate time base, so output
// timestamps are strictly increasing.
class VideoEncoder {
public:
    ~VideoEncoder();

    // Open the output file and the encoder (libx264 if present, else MPEG-4)
    static Result<std::unique_ptr<VideoEncoder>> Create(const std::string& path,
                                                        const VideoEncoderConfig& config);

    // Encode one frame (must be CV_8UC3 of the configured size)
    Result<void> WriteFrame(const cv::Mat& bgr);

    // Flush the encoder and write the trailer. Must be called exactly once.
    Result<void> Finish();

    int64_t frames_written() const;

    // Encoded size; odd dimensions are rounded down to even for 4:2:0
    int encoded_width() const;
    int encoded_height() const;

    const char* codec_name() const;

    // Internal: Constructor is public but VideoEncoderImpl is opaque
    explicit VideoEncoder(std::unique_ptr<VideoEncoderImpl> impl);

private:
    std::unique_ptr<VideoEncoderImpl> m_impl;
};

} // namespace cce

#pragma once

#include <cstdint>
#include <string>

namespace cce {

// Engine tunables that are not part of a job
struct EngineConfig {
    // Output audio format (interleaved float32 before AAC encoding)
    int32_t audio_sample_rate = 48000;
    int32_t audio_channels = 2;
    int64_t audio_bit_rate = 192000;

    // Frames between progress updates in the compositing loop
    int progress_interval_frames = 10;

    // x264 constant rate factor
    int video_crf = 23;

    // Appended to the output path for the video-only intermediate file
    std::string intermediate_suffix = ".video.mkv";
};

} // namespace cce

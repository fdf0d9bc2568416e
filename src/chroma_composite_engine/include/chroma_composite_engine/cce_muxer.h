#pragma once

#include "cce_audio.h"
#include "cce_errors.h"
#include <string>

namespace cce {

struct MuxConfig {
    int64_t audio_bit_rate = 192000;
    // Container format name; empty = guess from output extension
    std::string format_name;
};

// Copy the video stream of video_path into output_path and add audio
// encoded as AAC, interleaved by timestamp.
// An empty audio track produces a video-only output.
Result<void> MuxVideoWithAudio(const std::string& video_path,
                               const AudioTrack& audio,
                               const std::string& output_path,
                               const MuxConfig& config);

} // namespace cce

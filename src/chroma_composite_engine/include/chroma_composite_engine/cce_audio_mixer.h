#pragma once

#include "cce_audio.h"
#include "cce_errors.h"
#include "cce_time.h"
#include <optional>
#include <string>

namespace cce {

enum class AudioMode {
    Synced,
    BackgroundOnly,
    ForegroundOnly,
    Both,
    TimedForeground,
    None
};

const char* audio_mode_to_string(AudioMode mode);
std::optional<AudioMode> audio_mode_from_string(const std::string& name);

struct AudioGains {
    float synced_background = 0.8f;
    float synced_foreground = 1.0f;
    float timed_foreground = 1.0f;
};

struct AudioMixRequest {
    AudioMode mode = AudioMode::Synced;
    // Length of the output video
    TimeUS duration_us = 0;
    // Active window; the foreground track starts at window_start_us
    // in Synced and TimedForeground modes
    TimeUS window_start_us = 0;
    std::optional<TimeUS> window_end_us;
    int32_t sample_rate = 48000;
    int32_t channels = 2;
    AudioGains gains;
};

// Build the output track for request.mode.
// Inputs must be interleaved at request.sample_rate/channels (empty tracks
// count as silence). The result always spans exactly duration_us and is
// scaled down when its peak exceeds 1.0.
Result<AudioTrack> mix_audio(const AudioTrack& foreground, const AudioTrack& background,
                             const AudioMixRequest& request);

} // namespace cce

#include <chroma_composite_engine/cce_audio_mixer.h>
#include "cce_logging.h"
#include <algorithm>
#include <cmath>

namespace cce {

const char* audio_mode_to_string(AudioMode mode) {
    switch (mode) {
        case AudioMode::Synced:          return "synced";
        case AudioMode::BackgroundOnly:  return "background";
        case AudioMode::ForegroundOnly:  return "foreground";
        case AudioMode::Both:            return "both";
        case AudioMode::TimedForeground: return "timed";
        case AudioMode::None:            return "none";
    }
    return "none";
}

std::optional<AudioMode> audio_mode_from_string(const std::string& name) {
    if (name == "synced") return AudioMode::Synced;
    if (name == "background") return AudioMode::BackgroundOnly;
    if (name == "foreground") return AudioMode::ForegroundOnly;
    if (name == "both") return AudioMode::Both;
    if (name == "timed") return AudioMode::TimedForeground;
    if (name == "none") return AudioMode::None;
    return std::nullopt;
}

namespace {

// Add gain * src into out over output frames [dst_begin, dst_end).
// Output frame f reads source frame f - src_origin; frames outside the
// source are silence.
void mix_into(std::vector<float>& out, int channels, const AudioTrack& src,
              int64_t dst_begin, int64_t dst_end, int64_t src_origin, float gain) {
    if (src.empty() || gain == 0.0f) {
        return;
    }
    const int64_t begin = std::max(dst_begin, src_origin);
    const int64_t end = std::min(dst_end, src_origin + src.frames());
    const float* in = src.data_f32();
    for (int64_t f = begin; f < end; ++f) {
        const int64_t s = f - src_origin;
        float* o = out.data() + f * channels;
        const float* i = in + s * channels;
        for (int c = 0; c < channels; ++c) {
            o[c] += gain * i[c];
        }
    }
}

// Scale down so that no sample exceeds full scale
float normalize_peak(std::vector<float>& samples) {
    float peak = 0.0f;
    for (float v : samples) {
        peak = std::max(peak, std::fabs(v));
    }
    if (peak <= 1.0f) {
        return 1.0f;
    }
    const float scale = 1.0f / peak;
    for (float& v : samples) {
        v *= scale;
    }
    return scale;
}

bool format_matches(const AudioTrack& track, const AudioMixRequest& request) {
    return track.empty() ||
           (track.sample_rate() == request.sample_rate && track.channels() == request.channels);
}

} // namespace

Result<AudioTrack> mix_audio(const AudioTrack& foreground, const AudioTrack& background,
                             const AudioMixRequest& request) {
    if (request.sample_rate <= 0 || request.channels <= 0) {
        return Error::invalid_parameter("audio_format", "sample rate and channel count must be positive");
    }
    if (request.duration_us < 0) {
        return Error::invalid_parameter("duration", "must not be negative");
    }
    if (!format_matches(foreground, request) || !format_matches(background, request)) {
        return Error::internal("Audio track format does not match mix format");
    }

    const int channels = request.channels;
    const int64_t total = frames_for_duration(request.duration_us, request.sample_rate);
    const int64_t window_start = std::min(total, frames_for_duration(request.window_start_us,
                                                                     request.sample_rate));
    const int64_t window_end = request.window_end_us
        ? std::min(total, frames_for_duration(*request.window_end_us, request.sample_rate))
        : total;

    std::vector<float> out(static_cast<size_t>(total) * static_cast<size_t>(channels), 0.0f);

    switch (request.mode) {
        case AudioMode::Synced:
            mix_into(out, channels, background, 0, total, 0, request.gains.synced_background);
            mix_into(out, channels, foreground, window_start, window_end, window_start,
                     request.gains.synced_foreground);
            break;
        case AudioMode::BackgroundOnly:
            mix_into(out, channels, background, 0, total, 0, 1.0f);
            break;
        case AudioMode::ForegroundOnly:
            mix_into(out, channels, foreground, 0, total, 0, 1.0f);
            break;
        case AudioMode::Both:
            mix_into(out, channels, background, 0, total, 0, 1.0f);
            mix_into(out, channels, foreground, 0, total, 0, 1.0f);
            break;
        case AudioMode::TimedForeground:
            mix_into(out, channels, background, 0, window_start, 0, 1.0f);
            mix_into(out, channels, background, window_end, total, 0, 1.0f);
            mix_into(out, channels, foreground, window_start, window_end, window_start,
                     request.gains.timed_foreground);
            break;
        case AudioMode::None:
            break;
    }

    const float scale = normalize_peak(out);
    qCDebug(cceAudio, "Mixed %lld frames (%s), window [%lld, %lld), normalization %.3f",
            static_cast<long long>(total), audio_mode_to_string(request.mode),
            static_cast<long long>(window_start), static_cast<long long>(window_end), scale);

    return Result<AudioTrack>(AudioTrack(request.sample_rate, channels, std::move(out)));
}

} // namespace cce

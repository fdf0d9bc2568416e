#pragma once

#include "cce_errors.h"
#include "cce_time.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cce {

class MediaFile;

// Sample format (only F32 interleaved)
enum class SampleFormat {
    F32
};

// Audio format descriptor
struct AudioFormat {
    SampleFormat fmt;       // F32
    int32_t sample_rate;    // Engine rate (48000 by default)
    int32_t channels;       // Always 2 (stereo)
};

// Decoded PCM for a whole track (interleaved float32).
// Held for the full run and released after muxing.
class AudioTrack {
public:
    AudioTrack() = default;
    AudioTrack(int32_t sample_rate, int32_t channels, std::vector<float> samples);

    // Silent track of the given length
    static AudioTrack Silence(int32_t sample_rate, int32_t channels, int64_t frames);

    int32_t sample_rate() const { return m_sample_rate; }
    int32_t channels() const { return m_channels; }

    // Number of sample-frames (samples per channel)
    int64_t frames() const;

    // Duration covered by frames() at sample_rate()
    TimeUS duration_us() const;

    bool empty() const { return m_samples.empty(); }

    // Interleaved samples, frames() * channels() floats
    const float* data_f32() const { return m_samples.data(); }
    const std::vector<float>& samples() const { return m_samples; }
    std::vector<float>& samples() { return m_samples; }

private:
    int32_t m_sample_rate = 0;
    int32_t m_channels = 0;
    std::vector<float> m_samples;
};

// Number of sample-frames spanning duration_us at sample_rate (rounded)
int64_t frames_for_duration(TimeUS duration_us, int32_t sample_rate);

// Decode the complete first audio stream of a media file, resampled to
// float32 stereo at out.sample_rate.
// Files without an audio stream yield an empty track, not an error.
// Returns DecodeFailure on corrupt audio data.
Result<AudioTrack> DecodeAudioTrack(const std::shared_ptr<MediaFile>& media_file,
                                    const AudioFormat& out);

} // namespace cce

#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libavutil/opt.h>
}

#include <chroma_composite_engine/cce_errors.h>
#include <cstdint>

namespace cce {
namespace impl {

// SwrContext wrapper for audio resampling
// Converts any input format to float32 interleaved stereo at target sample rate
class FFmpegResampleContext {
public:
    FFmpegResampleContext() = default;
    ~FFmpegResampleContext();

    // Non-copyable
    FFmpegResampleContext(const FFmpegResampleContext&) = delete;
    FFmpegResampleContext& operator=(const FFmpegResampleContext&) = delete;

    // Move semantics
    FFmpegResampleContext(FFmpegResampleContext&& other) noexcept;
    FFmpegResampleContext& operator=(FFmpegResampleContext&& other) noexcept;

    Result<void> init(int src_sample_rate, const AVChannelLayout* src_ch_layout,
                      AVSampleFormat src_sample_fmt, int dst_sample_rate);

    // Resample audio data
    // Returns number of output samples per channel
    Result<int64_t> convert(const uint8_t* const* src_data, int src_samples,
                            float* dst_data, int64_t dst_max_samples);

    // Drain samples buffered inside the resampler
    Result<int64_t> flush(float* dst_data, int64_t dst_max_samples);

    // Upper bound on output samples for given input
    int64_t get_out_samples(int in_samples) const;

    int dst_channels() const { return m_dst_channels; }

private:
    SwrContext* m_swr_ctx = nullptr;
    int m_dst_sample_rate = 0;
    int m_dst_channels = 2;  // Always stereo output
};

} // namespace impl
} // namespace cce

#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include <chroma_composite_engine/cce_errors.h>
#include <chroma_composite_engine/cce_time.h>
#include <string>

namespace cce {
namespace impl {

// Convert FFmpeg error code to CCE Error
Error ffmpeg_error(int errnum, const std::string& context);

// Apply the FFmpeg log level once per process (quiet unless verbose)
void init_ffmpeg_logging();
void set_ffmpeg_verbose(bool verbose);

// FFmpeg input format context wrapper (for MediaFile)
class FFmpegFormatContext {
public:
    FFmpegFormatContext() = default;
    ~FFmpegFormatContext();

    // Non-copyable
    FFmpegFormatContext(const FFmpegFormatContext&) = delete;
    FFmpegFormatContext& operator=(const FFmpegFormatContext&) = delete;

    // Move semantics
    FFmpegFormatContext(FFmpegFormatContext&& other) noexcept;
    FFmpegFormatContext& operator=(FFmpegFormatContext&& other) noexcept;

    // Open a file
    Result<void> open(const std::string& path);

    // Find video stream
    Result<int> find_video_stream();

    // Find audio stream (returns -1 if no audio, does not error)
    int find_audio_stream();

    AVFormatContext* get() const { return m_fmt_ctx; }
    int video_stream_index() const { return m_video_stream_idx; }
    int audio_stream_index() const { return m_audio_stream_idx; }
    AVStream* video_stream() const;
    AVStream* audio_stream() const;
    AVCodecParameters* video_codec_params() const;
    AVCodecParameters* audio_codec_params() const;

private:
    AVFormatContext* m_fmt_ctx = nullptr;
    int m_video_stream_idx = -1;
    int m_audio_stream_idx = -1;
};

// FFmpeg output format context wrapper (for VideoEncoder and the muxer).
// Closes the AVIO handle and frees the context; the trailer is written
// explicitly through write_trailer().
class FFmpegOutputContext {
public:
    FFmpegOutputContext() = default;
    ~FFmpegOutputContext();

    // Non-copyable
    FFmpegOutputContext(const FFmpegOutputContext&) = delete;
    FFmpegOutputContext& operator=(const FFmpegOutputContext&) = delete;

    // Allocate the muxer; empty format_name guesses from the extension
    Result<void> open(const std::string& path, const std::string& format_name);

    AVStream* add_stream();

    // Open the file and write the header
    Result<void> write_header();

    // Interleaved write; takes ownership of the packet's reference
    Result<void> write_packet(AVPacket* pkt);

    Result<void> write_trailer();

    bool needs_global_header() const;

    AVFormatContext* get() const { return m_fmt_ctx; }
    const std::string& path() const { return m_path; }

private:
    AVFormatContext* m_fmt_ctx = nullptr;
    std::string m_path;
    bool m_header_written = false;
};

// FFmpeg decoder context wrapper (for VideoReader and audio decode)
class FFmpegCodecContext {
public:
    FFmpegCodecContext() = default;
    ~FFmpegCodecContext();

    // Non-copyable
    FFmpegCodecContext(const FFmpegCodecContext&) = delete;
    FFmpegCodecContext& operator=(const FFmpegCodecContext&) = delete;

    // Move semantics
    FFmpegCodecContext(FFmpegCodecContext&& other) noexcept;
    FFmpegCodecContext& operator=(FFmpegCodecContext&& other) noexcept;

    // Initialize a decoder from stream parameters
    Result<void> init_decoder(AVCodecParameters* params);

    // Take ownership of an already configured, unopened encoder context
    Result<void> open_encoder(AVCodecContext* ctx, const AVCodec* codec, AVDictionary** options);

    AVCodecContext* get() const { return m_codec_ctx; }

private:
    void release();

    AVCodecContext* m_codec_ctx = nullptr;
};

// SwScale context wrapper (for pixel format conversion)
class FFmpegScaleContext {
public:
    FFmpegScaleContext() = default;
    ~FFmpegScaleContext();

    // Non-copyable
    FFmpegScaleContext(const FFmpegScaleContext&) = delete;
    FFmpegScaleContext& operator=(const FFmpegScaleContext&) = delete;

    // (Re)initialize when the source geometry or format changes
    Result<void> init(int src_width, int src_height, AVPixelFormat src_fmt,
                      int dst_width, int dst_height, AVPixelFormat dst_fmt);

    // Convert packed source (one plane) into dst frame planes
    void convert_from_packed(const uint8_t* src_data, int src_stride, AVFrame* dst);

    // Convert src frame planes into packed destination (one plane)
    void convert_to_packed(const AVFrame* src, uint8_t* dst_data, int dst_stride);

    SwsContext* get() const { return m_sws_ctx; }

private:
    SwsContext* m_sws_ctx = nullptr;
    int m_src_width = 0;
    int m_src_height = 0;
    AVPixelFormat m_src_fmt = AV_PIX_FMT_NONE;
    AVPixelFormat m_dst_fmt = AV_PIX_FMT_NONE;
};

// Owning AVPacket / AVFrame handles
struct PacketDeleter {
    void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

// Convert AVRational to our Rate
Rate av_rational_to_rate(AVRational r);

// Convert microseconds to stream time base
int64_t us_to_stream_pts(TimeUS us, AVStream* stream);

// Convert stream PTS to microseconds
TimeUS stream_pts_to_us(int64_t pts, AVStream* stream);

} // namespace impl
} // namespace cce

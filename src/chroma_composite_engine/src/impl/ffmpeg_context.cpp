#include "ffmpeg_context.h"
#include <cassert>
#include <mutex>

namespace cce {
namespace impl {

Error ffmpeg_error(int errnum, const std::string& context) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    std::string msg = context + ": " + errbuf;

    // Map FFmpeg errors to CCE errors
    if (errnum == AVERROR(ENOENT)) {
        return Error::file_not_found(msg);
    } else if (errnum == AVERROR_EOF) {
        return Error::eof();
    } else if (errnum == AVERROR(ENOMEM)) {
        return Error::resource_exhausted(msg);
    } else if (errnum == AVERROR_INVALIDDATA || errnum == AVERROR(EINVAL)) {
        return Error::unsupported_media(msg);
    } else if (errnum == AVERROR_DECODER_NOT_FOUND || errnum == AVERROR_DEMUXER_NOT_FOUND) {
        return Error::unsupported_media("No decoder found: " + context);
    } else if (errnum == AVERROR_ENCODER_NOT_FOUND || errnum == AVERROR_MUXER_NOT_FOUND) {
        return Error::encode_failure("No encoder found: " + context);
    }
    return Error::internal(msg);
}

static int s_ffmpeg_log_level = AV_LOG_FATAL;

void init_ffmpeg_logging() {
    // Decoders warn about harmless stream quirks; keep stderr quiet
    static std::once_flag s_ffmpeg_log_init;
    std::call_once(s_ffmpeg_log_init, [] {
        av_log_set_level(s_ffmpeg_log_level);
    });
}

void set_ffmpeg_verbose(bool verbose) {
    s_ffmpeg_log_level = verbose ? AV_LOG_WARNING : AV_LOG_FATAL;
    av_log_set_level(s_ffmpeg_log_level);
}

// FFmpegFormatContext implementation

FFmpegFormatContext::~FFmpegFormatContext() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
}

FFmpegFormatContext::FFmpegFormatContext(FFmpegFormatContext&& other) noexcept
    : m_fmt_ctx(other.m_fmt_ctx),
      m_video_stream_idx(other.m_video_stream_idx),
      m_audio_stream_idx(other.m_audio_stream_idx) {
    other.m_fmt_ctx = nullptr;
    other.m_video_stream_idx = -1;
    other.m_audio_stream_idx = -1;
}

FFmpegFormatContext& FFmpegFormatContext::operator=(FFmpegFormatContext&& other) noexcept {
    if (this != &other) {
        if (m_fmt_ctx) {
            avformat_close_input(&m_fmt_ctx);
        }
        m_fmt_ctx = other.m_fmt_ctx;
        m_video_stream_idx = other.m_video_stream_idx;
        m_audio_stream_idx = other.m_audio_stream_idx;
        other.m_fmt_ctx = nullptr;
        other.m_video_stream_idx = -1;
        other.m_audio_stream_idx = -1;
    }
    return *this;
}

Result<void> FFmpegFormatContext::open(const std::string& path) {
    int ret = avformat_open_input(&m_fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        if (ret == AVERROR(ENOENT)) {
            return Error::file_not_found(path);
        }
        Error err = ffmpeg_error(ret, "avformat_open_input(" + path + ")");
        if (err.code == ErrorCode::Internal || err.code == ErrorCode::EOFReached) {
            err.code = ErrorCode::UnsupportedMedia;
        }
        return err;
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        Error err = ffmpeg_error(ret, "avformat_find_stream_info(" + path + ")");
        err.code = ErrorCode::UnsupportedMedia;
        return err;
    }

    return Result<void>();
}

Result<int> FFmpegFormatContext::find_video_stream() {
    assert(m_fmt_ctx && "Format context not opened");

    m_video_stream_idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_VIDEO,
                                              -1, -1, nullptr, 0);
    if (m_video_stream_idx < 0) {
        return Error::unsupported_media("No video stream found");
    }
    return m_video_stream_idx;
}

AVStream* FFmpegFormatContext::video_stream() const {
    if (m_video_stream_idx < 0) return nullptr;
    return m_fmt_ctx->streams[m_video_stream_idx];
}

AVCodecParameters* FFmpegFormatContext::video_codec_params() const {
    AVStream* stream = video_stream();
    return stream ? stream->codecpar : nullptr;
}

int FFmpegFormatContext::find_audio_stream() {
    assert(m_fmt_ctx && "Format context not opened");

    m_audio_stream_idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_AUDIO,
                                              -1, -1, nullptr, 0);
    return m_audio_stream_idx;
}

AVStream* FFmpegFormatContext::audio_stream() const {
    if (m_audio_stream_idx < 0) return nullptr;
    return m_fmt_ctx->streams[m_audio_stream_idx];
}

AVCodecParameters* FFmpegFormatContext::audio_codec_params() const {
    AVStream* stream = audio_stream();
    return stream ? stream->codecpar : nullptr;
}

// FFmpegOutputContext implementation

FFmpegOutputContext::~FFmpegOutputContext() {
    if (m_fmt_ctx) {
        if (m_fmt_ctx->pb && !(m_fmt_ctx->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&m_fmt_ctx->pb);
        }
        avformat_free_context(m_fmt_ctx);
        m_fmt_ctx = nullptr;
    }
}

Result<void> FFmpegOutputContext::open(const std::string& path, const std::string& format_name) {
    m_path = path;
    int ret = avformat_alloc_output_context2(&m_fmt_ctx, nullptr,
                                             format_name.empty() ? nullptr : format_name.c_str(),
                                             path.c_str());
    if (ret < 0 || !m_fmt_ctx) {
        return Error::unsupported_media("Cannot determine output container for " + path);
    }
    return Result<void>();
}

AVStream* FFmpegOutputContext::add_stream() {
    assert(m_fmt_ctx && "Output context not opened");
    return avformat_new_stream(m_fmt_ctx, nullptr);
}

bool FFmpegOutputContext::needs_global_header() const {
    return m_fmt_ctx && (m_fmt_ctx->oformat->flags & AVFMT_GLOBALHEADER);
}

Result<void> FFmpegOutputContext::write_header() {
    assert(m_fmt_ctx && "Output context not opened");

    if (!(m_fmt_ctx->oformat->flags & AVFMT_NOFILE)) {
        int ret = avio_open(&m_fmt_ctx->pb, m_path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            Error err = ffmpeg_error(ret, "avio_open(" + m_path + ")");
            err.code = ErrorCode::EncodeFailure;
            return err;
        }
    }

    int ret = avformat_write_header(m_fmt_ctx, nullptr);
    if (ret < 0) {
        Error err = ffmpeg_error(ret, "avformat_write_header");
        err.code = ErrorCode::EncodeFailure;
        return err;
    }
    m_header_written = true;
    return Result<void>();
}

Result<void> FFmpegOutputContext::write_packet(AVPacket* pkt) {
    int ret = av_interleaved_write_frame(m_fmt_ctx, pkt);
    if (ret < 0) {
        Error err = ffmpeg_error(ret, "av_interleaved_write_frame");
        err.code = ErrorCode::EncodeFailure;
        return err;
    }
    return Result<void>();
}

Result<void> FFmpegOutputContext::write_trailer() {
    if (!m_header_written) {
        return Error::encode_failure("Trailer without header: " + m_path);
    }
    int ret = av_write_trailer(m_fmt_ctx);
    if (ret < 0) {
        Error err = ffmpeg_error(ret, "av_write_trailer");
        err.code = ErrorCode::EncodeFailure;
        return err;
    }
    return Result<void>();
}

// FFmpegCodecContext implementation

FFmpegCodecContext::~FFmpegCodecContext() {
    release();
}

void FFmpegCodecContext::release() {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
}

FFmpegCodecContext::FFmpegCodecContext(FFmpegCodecContext&& other) noexcept
    : m_codec_ctx(other.m_codec_ctx) {
    other.m_codec_ctx = nullptr;
}

FFmpegCodecContext& FFmpegCodecContext::operator=(FFmpegCodecContext&& other) noexcept {
    if (this != &other) {
        release();
        m_codec_ctx = other.m_codec_ctx;
        other.m_codec_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegCodecContext::init_decoder(AVCodecParameters* params) {
    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        return Error::unsupported_media("No decoder for codec " +
                                        std::string(avcodec_get_name(params->codec_id)));
    }

    release();
    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::resource_exhausted("Failed to allocate codec context");
    }

    int ret = avcodec_parameters_to_context(m_codec_ctx, params);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_parameters_to_context");
    }

    ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        Error err = ffmpeg_error(ret, "avcodec_open2");
        err.code = ErrorCode::UnsupportedMedia;
        return err;
    }

    return Result<void>();
}

Result<void> FFmpegCodecContext::open_encoder(AVCodecContext* ctx, const AVCodec* codec,
                                              AVDictionary** options) {
    release();
    m_codec_ctx = ctx;

    int ret = avcodec_open2(m_codec_ctx, codec, options);
    if (ret < 0) {
        Error err = ffmpeg_error(ret, std::string("avcodec_open2(") + codec->name + ")");
        err.code = ErrorCode::EncodeFailure;
        return err;
    }
    return Result<void>();
}

// FFmpegScaleContext implementation

FFmpegScaleContext::~FFmpegScaleContext() {
    if (m_sws_ctx) {
        sws_freeContext(m_sws_ctx);
    }
}

Result<void> FFmpegScaleContext::init(int src_width, int src_height, AVPixelFormat src_fmt,
                                      int dst_width, int dst_height, AVPixelFormat dst_fmt) {
    if (m_sws_ctx && m_src_width == src_width && m_src_height == src_height &&
        m_src_fmt == src_fmt && m_dst_fmt == dst_fmt) {
        return Result<void>();
    }

    if (m_sws_ctx) {
        sws_freeContext(m_sws_ctx);
    }
    m_src_width = src_width;
    m_src_height = src_height;
    m_src_fmt = src_fmt;
    m_dst_fmt = dst_fmt;

    m_sws_ctx = sws_getContext(
        src_width, src_height, src_fmt,
        dst_width, dst_height, dst_fmt,
        SWS_BILINEAR, nullptr, nullptr, nullptr
    );

    if (!m_sws_ctx) {
        return Error::internal("Failed to create swscale context");
    }

    return Result<void>();
}

void FFmpegScaleContext::convert_from_packed(const uint8_t* src_data, int src_stride, AVFrame* dst) {
    assert(m_sws_ctx && "Scale context not initialized");

    const uint8_t* src_planes[4] = {src_data, nullptr, nullptr, nullptr};
    int src_strides[4] = {src_stride, 0, 0, 0};

    sws_scale(m_sws_ctx, src_planes, src_strides, 0, m_src_height,
              dst->data, dst->linesize);
}

void FFmpegScaleContext::convert_to_packed(const AVFrame* src, uint8_t* dst_data, int dst_stride) {
    assert(m_sws_ctx && "Scale context not initialized");

    uint8_t* dst_planes[4] = {dst_data, nullptr, nullptr, nullptr};
    int dst_strides[4] = {dst_stride, 0, 0, 0};

    sws_scale(m_sws_ctx, src->data, src->linesize, 0, m_src_height,
              dst_planes, dst_strides);
}

// Utility functions

Rate av_rational_to_rate(AVRational r) {
    return Rate{r.num, r.den};
}

int64_t us_to_stream_pts(TimeUS us, AVStream* stream) {
    return av_rescale_q(us, {1, 1000000}, stream->time_base);
}

TimeUS stream_pts_to_us(int64_t pts, AVStream* stream) {
    if (pts == AV_NOPTS_VALUE) {
        return 0;
    }
    return av_rescale_q(pts, stream->time_base, {1, 1000000});
}

} // namespace impl
} // namespace cce

#include <chroma_composite_engine/cce_video_encoder.h>
#include "impl/ffmpeg_context.h"
#include "cce_logging.h"
#include <cassert>

extern "C" {
#include <libavutil/opt.h>
}

namespace cce {

class VideoEncoderImpl {
public:
    impl::FFmpegOutputContext output;
    impl::FFmpegCodecContext codec_ctx;
    impl::FFmpegScaleContext scale_ctx;
    std::unique_ptr<AVFrame, impl::FrameDeleter> frame;
    std::unique_ptr<AVPacket, impl::PacketDeleter> pkt;
    AVStream* stream = nullptr;
    VideoEncoderConfig config;
    int64_t next_pts = 0;
    bool finished = false;

    // Move every packet the encoder has ready into the muxer
    Result<void> drain_packets();
};

Result<void> VideoEncoderImpl::drain_packets() {
    AVCodecContext* ctx = codec_ctx.get();
    while (true) {
        int ret = avcodec_receive_packet(ctx, pkt.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return Result<void>();
        }
        if (ret < 0) {
            Error err = impl::ffmpeg_error(ret, "avcodec_receive_packet");
            return Error::encode_failure(err.message);
        }
        pkt->stream_index = stream->index;
        av_packet_rescale_ts(pkt.get(), ctx->time_base, stream->time_base);
        auto written = output.write_packet(pkt.get());
        if (written.is_error()) {
            return written.error();
        }
    }
}

VideoEncoder::VideoEncoder(std::unique_ptr<VideoEncoderImpl> impl)
    : m_impl(std::move(impl)) {
    assert(m_impl && "VideoEncoder impl cannot be null");
}

VideoEncoder::~VideoEncoder() = default;

// libx264 when the FFmpeg build has it, otherwise the native MPEG-4 encoder
static const AVCodec* find_video_encoder() {
    const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
    if (!codec) {
        codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    }
    return codec;
}

Result<std::unique_ptr<VideoEncoder>> VideoEncoder::Create(const std::string& path,
                                                           const VideoEncoderConfig& config) {
    impl::init_ffmpeg_logging();

    if (config.width <= 0 || config.height <= 0 || !config.rate.is_valid()) {
        return Error::internal("VideoEncoder::Create: invalid geometry or rate");
    }

    auto impl = std::make_unique<VideoEncoderImpl>();
    impl->config = config;

    auto open_result = impl->output.open(path, config.format_name);
    if (open_result.is_error()) {
        return open_result.error();
    }

    const AVCodec* codec = find_video_encoder();
    if (!codec) {
        return Error::encode_failure("No H.264 or MPEG-4 encoder available");
    }

    AVCodecContext* ctx = avcodec_alloc_context3(codec);
    if (!ctx) {
        return Error::resource_exhausted("Failed to allocate encoder context");
    }

    // 4:2:0 needs even dimensions; odd frames are scaled by one pixel
    ctx->width = config.width & ~1;
    ctx->height = config.height & ~1;
    if (ctx->width == 0 || ctx->height == 0) {
        avcodec_free_context(&ctx);
        return Error::unsupported_media("Frame too small to encode");
    }
    ctx->pix_fmt = AV_PIX_FMT_YUV420P;
    ctx->time_base = AVRational{config.rate.den, config.rate.num};
    ctx->framerate = AVRational{config.rate.num, config.rate.den};
    ctx->gop_size = 12;
    if (impl->output.needs_global_header()) {
        ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    AVDictionary* options = nullptr;
    if (codec->id == AV_CODEC_ID_H264) {
        av_dict_set(&options, "preset", config.fast ? "ultrafast" : "medium", 0);
        av_dict_set_int(&options, "crf", config.crf, 0);
    } else {
        // Constant quantizer keeps MPEG-4 output close to visually lossless
        ctx->flags |= AV_CODEC_FLAG_QSCALE;
        ctx->global_quality = FF_QP2LAMBDA * 3;
    }

    auto codec_result = impl->codec_ctx.open_encoder(ctx, codec, &options);
    av_dict_free(&options);
    if (codec_result.is_error()) {
        return codec_result.error();
    }

    impl->stream = impl->output.add_stream();
    if (!impl->stream) {
        return Error::resource_exhausted("Failed to allocate output stream");
    }
    int ret = avcodec_parameters_from_context(impl->stream->codecpar, ctx);
    if (ret < 0) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "avcodec_parameters_from_context").message);
    }
    impl->stream->time_base = ctx->time_base;
    impl->stream->avg_frame_rate = ctx->framerate;

    auto header_result = impl->output.write_header();
    if (header_result.is_error()) {
        return header_result.error();
    }

    impl->frame.reset(av_frame_alloc());
    impl->pkt.reset(av_packet_alloc());
    if (!impl->frame || !impl->pkt) {
        return Error::resource_exhausted("Failed to allocate encode buffers");
    }
    impl->frame->format = ctx->pix_fmt;
    impl->frame->width = ctx->width;
    impl->frame->height = ctx->height;
    ret = av_frame_get_buffer(impl->frame.get(), 0);
    if (ret < 0) {
        return Error::resource_exhausted(impl::ffmpeg_error(ret, "av_frame_get_buffer").message);
    }

    auto scale_result = impl->scale_ctx.init(config.width, config.height, AV_PIX_FMT_BGR24,
                                             ctx->width, ctx->height, ctx->pix_fmt);
    if (scale_result.is_error()) {
        return scale_result.error();
    }

    qCInfo(cceMedia, "Encoding %s with %s (%dx%d @ %d/%d)", path.c_str(), codec->name,
           ctx->width, ctx->height, config.rate.num, config.rate.den);

    return std::make_unique<VideoEncoder>(std::move(impl));
}

Result<void> VideoEncoder::WriteFrame(const cv::Mat& bgr) {
    const int64_t index = m_impl->next_pts;
    if (m_impl->finished) {
        return Error::encode_failure("Encoder already finished", index);
    }
    if (bgr.type() != CV_8UC3 || bgr.cols != m_impl->config.width ||
        bgr.rows != m_impl->config.height) {
        return Error::encode_failure("Frame does not match encoder geometry", index);
    }

    AVFrame* frame = m_impl->frame.get();
    int ret = av_frame_make_writable(frame);
    if (ret < 0) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "av_frame_make_writable").message, index);
    }

    m_impl->scale_ctx.convert_from_packed(bgr.data, static_cast<int>(bgr.step[0]), frame);
    frame->pts = m_impl->next_pts++;

    ret = avcodec_send_frame(m_impl->codec_ctx.get(), frame);
    if (ret < 0) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "avcodec_send_frame").message, index);
    }

    auto drained = m_impl->drain_packets();
    if (drained.is_error()) {
        return drained.error().at_frame(index);
    }
    return Result<void>();
}

Result<void> VideoEncoder::Finish() {
    if (m_impl->finished) {
        return Error::encode_failure("Encoder already finished");
    }
    m_impl->finished = true;

    int ret = avcodec_send_frame(m_impl->codec_ctx.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "avcodec_send_frame(flush)").message);
    }
    auto drained = m_impl->drain_packets();
    if (drained.is_error()) {
        return drained.error();
    }
    return m_impl->output.write_trailer();
}

int64_t VideoEncoder::frames_written() const {
    return m_impl->next_pts;
}

int VideoEncoder::encoded_width() const {
    return m_impl->frame ? m_impl->frame->width : 0;
}

int VideoEncoder::encoded_height() const {
    return m_impl->frame ? m_impl->frame->height : 0;
}

const char* VideoEncoder::codec_name() const {
    return m_impl->codec_ctx.get()->codec->name;
}

} // namespace cce

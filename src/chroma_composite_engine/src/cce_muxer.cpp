#include <chroma_composite_engine/cce_muxer.h>
#include "impl/ffmpeg_context.h"
#include "cce_logging.h"
#include <algorithm>

extern "C" {
#include <libavutil/channel_layout.h>
}

namespace cce {

namespace {

// AAC encoder fed from an interleaved float track in frame_size chunks
class AudioEncodeState {
public:
    impl::FFmpegCodecContext codec_ctx;
    std::unique_ptr<AVFrame, impl::FrameDeleter> frame;
    std::unique_ptr<AVPacket, impl::PacketDeleter> pkt;
    AVStream* stream = nullptr;
    const AudioTrack* track = nullptr;
    int64_t next_sample = 0;
    int frame_size = 1024;

    bool exhausted() const { return next_sample >= track->frames(); }

    Result<void> open(const AudioTrack& audio, const MuxConfig& config,
                      impl::FFmpegOutputContext& output);

    // Encode the next chunk of samples
    Result<void> encode_next(impl::FFmpegOutputContext& output);

    Result<void> flush(impl::FFmpegOutputContext& output);

private:
    Result<void> drain(impl::FFmpegOutputContext& output);
};

Result<void> AudioEncodeState::open(const AudioTrack& audio, const MuxConfig& config,
                                    impl::FFmpegOutputContext& output) {
    track = &audio;

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (!codec) {
        return Error::encode_failure("No AAC encoder available");
    }

    AVCodecContext* ctx = avcodec_alloc_context3(codec);
    if (!ctx) {
        return Error::resource_exhausted("Failed to allocate audio encoder context");
    }
    ctx->sample_fmt = AV_SAMPLE_FMT_FLTP;
    ctx->sample_rate = audio.sample_rate();
    av_channel_layout_default(&ctx->ch_layout, audio.channels());
    ctx->bit_rate = config.audio_bit_rate;
    ctx->time_base = AVRational{1, audio.sample_rate()};
    if (output.needs_global_header()) {
        ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    auto opened = codec_ctx.open_encoder(ctx, codec, nullptr);
    if (opened.is_error()) {
        return opened.error();
    }
    if (ctx->frame_size > 0) {
        frame_size = ctx->frame_size;
    }

    stream = output.add_stream();
    if (!stream) {
        return Error::resource_exhausted("Failed to allocate audio stream");
    }
    int ret = avcodec_parameters_from_context(stream->codecpar, ctx);
    if (ret < 0) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "avcodec_parameters_from_context").message);
    }
    stream->time_base = ctx->time_base;

    frame.reset(av_frame_alloc());
    pkt.reset(av_packet_alloc());
    if (!frame || !pkt) {
        return Error::resource_exhausted("Failed to allocate audio encode buffers");
    }
    return Result<void>();
}

Result<void> AudioEncodeState::encode_next(impl::FFmpegOutputContext& output) {
    AVCodecContext* ctx = codec_ctx.get();
    const int channels = track->channels();
    const int nb = static_cast<int>(std::min<int64_t>(frame_size, track->frames() - next_sample));

    av_frame_unref(frame.get());
    frame->nb_samples = nb;
    frame->format = ctx->sample_fmt;
    frame->sample_rate = ctx->sample_rate;
    int ret = av_channel_layout_copy(&frame->ch_layout, &ctx->ch_layout);
    if (ret < 0) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "av_channel_layout_copy").message);
    }
    ret = av_frame_get_buffer(frame.get(), 0);
    if (ret < 0) {
        return Error::resource_exhausted(impl::ffmpeg_error(ret, "av_frame_get_buffer").message);
    }

    // Interleaved -> planar
    const float* src = track->data_f32() + next_sample * channels;
    for (int c = 0; c < channels; ++c) {
        float* dst = reinterpret_cast<float*>(frame->data[c]);
        for (int i = 0; i < nb; ++i) {
            dst[i] = src[i * channels + c];
        }
    }
    frame->pts = next_sample;
    next_sample += nb;

    ret = avcodec_send_frame(ctx, frame.get());
    if (ret < 0) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "avcodec_send_frame (audio)").message);
    }
    return drain(output);
}

Result<void> AudioEncodeState::flush(impl::FFmpegOutputContext& output) {
    int ret = avcodec_send_frame(codec_ctx.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "avcodec_send_frame (audio flush)").message);
    }
    return drain(output);
}

Result<void> AudioEncodeState::drain(impl::FFmpegOutputContext& output) {
    AVCodecContext* ctx = codec_ctx.get();
    while (true) {
        int ret = avcodec_receive_packet(ctx, pkt.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return Result<void>();
        }
        if (ret < 0) {
            return Error::encode_failure(impl::ffmpeg_error(ret, "avcodec_receive_packet (audio)").message);
        }
        pkt->stream_index = stream->index;
        av_packet_rescale_ts(pkt.get(), ctx->time_base, stream->time_base);
        auto written = output.write_packet(pkt.get());
        if (written.is_error()) {
            return written.error();
        }
    }
}

} // namespace

Result<void> MuxVideoWithAudio(const std::string& video_path,
                               const AudioTrack& audio,
                               const std::string& output_path,
                               const MuxConfig& config) {
    impl::init_ffmpeg_logging();

    impl::FFmpegFormatContext input;
    auto in_result = input.open(video_path);
    if (in_result.is_error()) {
        return Error::encode_failure("Cannot reopen intermediate video: " + in_result.error().message);
    }
    auto video_idx = input.find_video_stream();
    if (video_idx.is_error()) {
        return Error::encode_failure("Intermediate file has no video: " + video_path);
    }
    AVStream* in_stream = input.video_stream();

    impl::FFmpegOutputContext output;
    auto out_result = output.open(output_path, config.format_name);
    if (out_result.is_error()) {
        return out_result.error();
    }

    AVStream* out_video = output.add_stream();
    if (!out_video) {
        return Error::resource_exhausted("Failed to allocate video stream");
    }
    int ret = avcodec_parameters_copy(out_video->codecpar, in_stream->codecpar);
    if (ret < 0) {
        return Error::encode_failure(impl::ffmpeg_error(ret, "avcodec_parameters_copy").message);
    }
    out_video->codecpar->codec_tag = 0;
    out_video->time_base = in_stream->time_base;
    out_video->avg_frame_rate = in_stream->avg_frame_rate;

    const bool with_audio = !audio.empty();
    AudioEncodeState audio_state;
    if (with_audio) {
        auto opened = audio_state.open(audio, config, output);
        if (opened.is_error()) {
            return opened.error();
        }
    }

    auto header = output.write_header();
    if (header.is_error()) {
        return header.error();
    }

    std::unique_ptr<AVPacket, impl::PacketDeleter> pkt(av_packet_alloc());
    if (!pkt) {
        return Error::resource_exhausted("Failed to allocate packet");
    }

    const AVRational audio_tb = AVRational{1, audio.sample_rate() > 0 ? audio.sample_rate() : 1};
    int64_t video_packets = 0;
    while (true) {
        ret = av_read_frame(input.get(), pkt.get());
        if (ret == AVERROR_EOF) {
            break;
        }
        if (ret < 0) {
            return Error::encode_failure(impl::ffmpeg_error(ret, "av_read_frame (remux)").message);
        }
        if (pkt->stream_index != video_idx.value()) {
            av_packet_unref(pkt.get());
            continue;
        }

        // Audio up to this packet's decode time goes first
        int64_t video_ts = pkt->dts != AV_NOPTS_VALUE ? pkt->dts : pkt->pts;
        while (with_audio && !audio_state.exhausted() &&
               (video_ts == AV_NOPTS_VALUE ||
                av_compare_ts(audio_state.next_sample, audio_tb, video_ts, in_stream->time_base) <= 0)) {
            auto encoded = audio_state.encode_next(output);
            if (encoded.is_error()) {
                av_packet_unref(pkt.get());
                return encoded.error();
            }
        }

        av_packet_rescale_ts(pkt.get(), in_stream->time_base, out_video->time_base);
        pkt->stream_index = out_video->index;
        pkt->pos = -1;
        auto written = output.write_packet(pkt.get());
        if (written.is_error()) {
            return written.error();
        }
        ++video_packets;
    }

    if (with_audio) {
        while (!audio_state.exhausted()) {
            auto encoded = audio_state.encode_next(output);
            if (encoded.is_error()) {
                return encoded.error();
            }
        }
        auto flushed = audio_state.flush(output);
        if (flushed.is_error()) {
            return flushed.error();
        }
    }

    auto trailer = output.write_trailer();
    if (trailer.is_error()) {
        return trailer.error();
    }

    qCDebug(cceMedia, "Muxed %lld video packets and %lld audio frames into %s",
            static_cast<long long>(video_packets), static_cast<long long>(audio.frames()),
            output_path.c_str());
    return Result<void>();
}

} // namespace cce

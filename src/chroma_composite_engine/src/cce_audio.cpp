#include <chroma_composite_engine/cce_audio.h>
#include <chroma_composite_engine/cce_media_file.h>
#include "impl/media_file_impl.h"
#include "impl/ffmpeg_resample.h"
#include "cce_logging.h"

namespace cce {

AudioTrack::AudioTrack(int32_t sample_rate, int32_t channels, std::vector<float> samples)
    : m_sample_rate(sample_rate), m_channels(channels), m_samples(std::move(samples)) {
}

AudioTrack AudioTrack::Silence(int32_t sample_rate, int32_t channels, int64_t frames) {
    std::vector<float> samples(static_cast<size_t>(frames > 0 ? frames : 0) *
                               static_cast<size_t>(channels), 0.0f);
    return AudioTrack(sample_rate, channels, std::move(samples));
}

int64_t AudioTrack::frames() const {
    if (m_channels <= 0) return 0;
    return static_cast<int64_t>(m_samples.size()) / m_channels;
}

TimeUS AudioTrack::duration_us() const {
    if (m_sample_rate <= 0) return 0;
    return (frames() * US_PER_SECOND) / m_sample_rate;
}

int64_t frames_for_duration(TimeUS duration_us, int32_t sample_rate) {
    if (duration_us <= 0 || sample_rate <= 0) return 0;
    return (duration_us * sample_rate + US_PER_SECOND / 2) / US_PER_SECOND;
}

// Resample one decoded frame and append it to pcm
static Result<void> append_resampled(impl::FFmpegResampleContext& resampler, AVFrame* frame,
                                     std::vector<float>& pcm) {
    const int channels = resampler.dst_channels();
    int64_t out_needed = resampler.get_out_samples(frame->nb_samples);
    size_t current_size = pcm.size();
    pcm.resize(current_size + static_cast<size_t>(out_needed * channels));

    auto converted = resampler.convert(frame->data, frame->nb_samples,
                                       pcm.data() + current_size, out_needed);
    if (converted.is_error()) {
        pcm.resize(current_size);
        return converted.error();
    }
    pcm.resize(current_size + static_cast<size_t>(converted.value() * channels));
    return Result<void>();
}

Result<AudioTrack> DecodeAudioTrack(const std::shared_ptr<MediaFile>& media_file,
                                    const AudioFormat& out) {
    if (!media_file) {
        return Error::internal("DecodeAudioTrack: null media file");
    }
    if (out.channels != 2) {
        return Error::invalid_parameter("audio_channels", "only stereo output is supported");
    }
    if (!media_file->info().has_audio) {
        qCDebug(cceMedia, "No audio stream in %s", media_file->info().path.c_str());
        return AudioTrack(out.sample_rate, out.channels, {});
    }

    MediaFileImpl* file_impl = media_file->impl_ptr();
    AVFormatContext* fmt_ctx = file_impl->fmt_ctx.get();
    const int audio_stream_idx = file_impl->fmt_ctx.audio_stream_index();

    impl::FFmpegCodecContext codec;
    auto init_result = codec.init_decoder(file_impl->fmt_ctx.audio_codec_params());
    if (init_result.is_error()) {
        return init_result.error();
    }
    AVCodecContext* audio_codec = codec.get();

    impl::FFmpegResampleContext resampler;
    auto resample_result = resampler.init(audio_codec->sample_rate, &audio_codec->ch_layout,
                                          audio_codec->sample_fmt, out.sample_rate);
    if (resample_result.is_error()) {
        return resample_result.error();
    }

    std::unique_ptr<AVPacket, impl::PacketDeleter> pkt(av_packet_alloc());
    std::unique_ptr<AVFrame, impl::FrameDeleter> frame(av_frame_alloc());
    if (!pkt || !frame) {
        return Error::resource_exhausted("Failed to allocate audio decode buffers");
    }

    std::vector<float> pcm;
    if (media_file->info().duration_us > 0) {
        pcm.reserve(static_cast<size_t>(
            frames_for_duration(media_file->info().duration_us, out.sample_rate) * out.channels));
    }

    bool draining = false;
    while (true) {
        if (!draining) {
            int ret = av_read_frame(fmt_ctx, pkt.get());
            if (ret == AVERROR_EOF) {
                ret = avcodec_send_packet(audio_codec, nullptr);
                if (ret < 0 && ret != AVERROR_EOF) {
                    return Error::decode_failure(
                        impl::ffmpeg_error(ret, "avcodec_send_packet (audio flush)").message);
                }
                draining = true;
            } else if (ret < 0) {
                return Error::decode_failure(impl::ffmpeg_error(ret, "av_read_frame (audio)").message);
            } else {
                if (pkt->stream_index != audio_stream_idx) {
                    av_packet_unref(pkt.get());
                    continue;
                }
                ret = avcodec_send_packet(audio_codec, pkt.get());
                av_packet_unref(pkt.get());
                if (ret < 0 && ret != AVERROR(EAGAIN)) {
                    return Error::decode_failure(
                        impl::ffmpeg_error(ret, "avcodec_send_packet (audio)").message);
                }
            }
        }

        // Receive decoded frames; after the flush packet this drains the decoder
        while (true) {
            int ret = avcodec_receive_frame(audio_codec, frame.get());
            if (ret == AVERROR(EAGAIN)) {
                break;
            }
            if (ret == AVERROR_EOF) {
                break;
            }
            if (ret < 0) {
                return Error::decode_failure(
                    impl::ffmpeg_error(ret, "avcodec_receive_frame (audio)").message);
            }

            auto appended = append_resampled(resampler, frame.get(), pcm);
            av_frame_unref(frame.get());
            if (appended.is_error()) {
                return appended.error();
            }
        }

        if (draining) {
            break;
        }
    }

    // Flush any remaining samples from the resampler
    const int64_t flush_capacity = 4096;
    size_t current_size = pcm.size();
    pcm.resize(current_size + static_cast<size_t>(flush_capacity * out.channels));
    auto flushed = resampler.flush(pcm.data() + current_size, flush_capacity);
    if (flushed.is_error()) {
        return flushed.error();
    }
    pcm.resize(current_size + static_cast<size_t>(flushed.value() * out.channels));

    AudioTrack track(out.sample_rate, out.channels, std::move(pcm));
    qCDebug(cceMedia, "Decoded %lld audio frames from %s",
            static_cast<long long>(track.frames()), media_file->info().path.c_str());
    return Result<AudioTrack>(std::move(track));
}

} // namespace cce

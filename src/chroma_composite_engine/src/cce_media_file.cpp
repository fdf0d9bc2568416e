#include <chroma_composite_engine/cce_media_file.h>
#include <chroma_composite_engine/cce_rate.h>
#include "impl/media_file_impl.h"
#include "impl/ffmpeg_context.h"
#include "cce_logging.h"
#include <cassert>

namespace cce {

MediaFile::MediaFile(std::unique_ptr<MediaFileImpl> impl, MediaInfo info)
    : m_impl(std::move(impl)), m_info(std::move(info)) {
    assert(m_impl && "MediaFile impl cannot be null");
}

MediaFile::~MediaFile() = default;

void set_media_log_verbose(bool verbose) {
    impl::set_ffmpeg_verbose(verbose);
}

const MediaInfo& MediaFile::info() const {
    return m_info;
}

// Select nominal rate from avg_frame_rate / r_frame_rate
static Rate select_nominal_rate(AVStream* stream, bool* is_vfr_out) {
    *is_vfr_out = false;

    AVRational avg_rate = stream->avg_frame_rate;
    AVRational r_rate = stream->r_frame_rate;

    bool avg_valid = avg_rate.num > 0 && avg_rate.den > 0;
    bool r_valid = r_rate.num > 0 && r_rate.den > 0;

    Rate result;

    if (avg_valid && !r_valid) {
        result = impl::av_rational_to_rate(avg_rate);
    } else if (!avg_valid && r_valid) {
        result = impl::av_rational_to_rate(r_rate);
    } else if (avg_valid && r_valid) {
        Rate avg = impl::av_rational_to_rate(avg_rate);
        Rate r = impl::av_rational_to_rate(r_rate);

        if (RateUtils::are_close(avg, r)) {
            result = avg;
        } else {
            // Rates disagree significantly - mark as VFR
            *is_vfr_out = true;

            Rate snapped_avg = RateUtils::snap_to_canonical(avg);
            Rate snapped_r = RateUtils::snap_to_canonical(r);

            // Prefer avg if it snapped to canonical
            if (snapped_avg != avg) {
                result = snapped_avg;
            } else if (snapped_r != r) {
                result = snapped_r;
            } else {
                result = avg;
            }
        }
    } else {
        // Neither valid - use 30fps as last resort and mark VFR
        *is_vfr_out = true;
        result = canonical_rates::RATE_30;
    }

    return RateUtils::snap_to_canonical(result);
}

Result<std::shared_ptr<MediaFile>> MediaFile::Open(const std::string& path) {
    impl::init_ffmpeg_logging();

    auto impl = std::make_unique<MediaFileImpl>();

    auto open_result = impl->fmt_ctx.open(path);
    if (open_result.is_error()) {
        qCWarning(cceMedia, "Cannot open %s: %s", path.c_str(), open_result.error().message.c_str());
        return open_result.error();
    }

    MediaInfo info;
    info.path = path;

    // Video stream is optional here; readers reject files without one
    AVStream* video_stream = nullptr;
    auto stream_result = impl->fmt_ctx.find_video_stream();
    if (stream_result.is_ok()) {
        video_stream = impl->fmt_ctx.video_stream();
        AVCodecParameters* params = impl->fmt_ctx.video_codec_params();
        info.has_video = true;
        info.video_width = params->width;
        info.video_height = params->height;
        info.video_codec = avcodec_get_name(params->codec_id);

        bool is_vfr = false;
        Rate nominal = select_nominal_rate(video_stream, &is_vfr);
        info.video_fps_num = nominal.num;
        info.video_fps_den = nominal.den;
        info.is_vfr = is_vfr;
    }

    AVStream* audio_stream = nullptr;
    int audio_idx = impl->fmt_ctx.find_audio_stream();
    if (audio_idx >= 0) {
        audio_stream = impl->fmt_ctx.audio_stream();
        AVCodecParameters* audio_params = impl->fmt_ctx.audio_codec_params();
        info.has_audio = true;
        info.audio_sample_rate = audio_params->sample_rate;
        info.audio_channels = audio_params->ch_layout.nb_channels;
    }

    if (!info.has_video && !info.has_audio) {
        return Error::unsupported_media("No video or audio stream found in " + path);
    }

    // Duration - try format, then video stream, then audio stream
    AVFormatContext* fmt = impl->fmt_ctx.get();
    if (fmt->duration != AV_NOPTS_VALUE) {
        info.duration_us = av_rescale_q(fmt->duration, AV_TIME_BASE_Q, {1, 1000000});
    } else if (video_stream && video_stream->duration != AV_NOPTS_VALUE) {
        info.duration_us = impl::stream_pts_to_us(video_stream->duration, video_stream);
    } else if (audio_stream && audio_stream->duration != AV_NOPTS_VALUE) {
        info.duration_us = impl::stream_pts_to_us(audio_stream->duration, audio_stream);
    }

    qCDebug(cceMedia, "Opened %s: %dx%d @ %d/%d, audio=%d, duration=%lld us",
            path.c_str(), info.video_width, info.video_height,
            info.video_fps_num, info.video_fps_den, info.has_audio ? 1 : 0,
            static_cast<long long>(info.duration_us));

    return std::make_shared<MediaFile>(std::move(impl), std::move(info));
}

} // namespace cce

#include <chroma_composite_engine/cce_video_reader.h>
#include "impl/media_file_impl.h"
#include "impl/ffmpeg_decode.h"
#include "cce_logging.h"
#include <cassert>

namespace cce {

// Decoder state for one video stream
class VideoReaderImpl {
public:
    impl::FFmpegCodecContext codec_ctx;
    impl::FFmpegScaleContext scale_ctx;
    std::unique_ptr<AVPacket, impl::PacketDeleter> pkt;
    std::unique_ptr<AVFrame, impl::FrameDeleter> frame;

    Rate rate{30, 1};
    int64_t frames_read = 0;
    bool have_first_pts = false;
    TimeUS first_pts_us = 0;
    TimeUS last_pts_us = -1;
    bool at_eof = false;
};

VideoReader::VideoReader(std::unique_ptr<VideoReaderImpl> impl, std::shared_ptr<MediaFile> media_file)
    : m_impl(std::move(impl)), m_media_file(std::move(media_file)) {
    assert(m_impl && "VideoReader impl cannot be null");
}

VideoReader::~VideoReader() = default;

Result<std::shared_ptr<VideoReader>> VideoReader::Create(std::shared_ptr<MediaFile> media_file) {
    if (!media_file) {
        return Error::internal("VideoReader::Create: null media file");
    }
    const MediaInfo& info = media_file->info();
    if (!info.has_video) {
        return Error::unsupported_media("No video stream in " + info.path);
    }

    auto impl = std::make_unique<VideoReaderImpl>();
    MediaFileImpl* file_impl = media_file->impl_ptr();

    auto init_result = impl->codec_ctx.init_decoder(file_impl->fmt_ctx.video_codec_params());
    if (init_result.is_error()) {
        return init_result.error();
    }

    impl->pkt.reset(av_packet_alloc());
    impl->frame.reset(av_frame_alloc());
    if (!impl->pkt || !impl->frame) {
        return Error::resource_exhausted("Failed to allocate decode buffers");
    }
    impl->rate = info.video_rate();

    return std::make_shared<VideoReader>(std::move(impl), std::move(media_file));
}

Result<Frame> VideoReader::ReadNext() {
    if (m_impl->at_eof) {
        return Error::eof();
    }

    MediaFileImpl* file_impl = m_media_file->impl_ptr();
    AVFormatContext* fmt_ctx = file_impl->fmt_ctx.get();
    AVStream* stream = file_impl->fmt_ctx.video_stream();
    AVFrame* frame = m_impl->frame.get();
    const int64_t index = m_impl->frames_read;

    av_frame_unref(frame);
    auto decoded = impl::decode_next_frame(m_impl->codec_ctx.get(), fmt_ctx,
                                           file_impl->fmt_ctx.video_stream_index(),
                                           m_impl->pkt.get(), frame);
    if (decoded.is_error()) {
        if (decoded.error().code == ErrorCode::EOFReached) {
            m_impl->at_eof = true;
            return decoded.error();
        }
        qCWarning(cceMedia, "Decode failed in %s at frame %lld: %s",
                  m_media_file->info().path.c_str(), static_cast<long long>(index),
                  decoded.error().message.c_str());
        return Error::decode_failure(decoded.error().message, index);
    }

    // Timestamps relative to the first frame; synthesize from the nominal
    // rate when the container has none
    TimeUS pts_us;
    int64_t pts = frame->best_effort_timestamp;
    if (pts == AV_NOPTS_VALUE) {
        pts = frame->pts;
    }
    if (pts != AV_NOPTS_VALUE) {
        TimeUS abs_us = impl::stream_pts_to_us(pts, stream);
        if (!m_impl->have_first_pts) {
            m_impl->first_pts_us = abs_us;
            m_impl->have_first_pts = true;
        }
        pts_us = abs_us - m_impl->first_pts_us;
    } else {
        pts_us = FrameTime::from_frame(index, m_impl->rate).to_us();
        m_impl->have_first_pts = true;
    }
    if (pts_us <= m_impl->last_pts_us) {
        pts_us = m_impl->last_pts_us + 1;
    }
    m_impl->last_pts_us = pts_us;

    auto scale_result = m_impl->scale_ctx.init(frame->width, frame->height,
                                               static_cast<AVPixelFormat>(frame->format),
                                               frame->width, frame->height, AV_PIX_FMT_BGR24);
    if (scale_result.is_error()) {
        return Error::decode_failure(scale_result.error().message, index);
    }

    cv::Mat bgr(frame->height, frame->width, CV_8UC3);
    m_impl->scale_ctx.convert_to_packed(frame, bgr.data, static_cast<int>(bgr.step[0]));
    av_frame_unref(frame);

    ++m_impl->frames_read;
    return Frame(std::move(bgr), pts_us, index);
}

int64_t VideoReader::frames_read() const {
    return m_impl->frames_read;
}

std::shared_ptr<MediaFile> VideoReader::media_file() const {
    return m_media_file;
}

} // namespace cce

#include "ffmpeg_decode.h"

namespace cce {
namespace impl {

Result<AVFrame*> decode_next_frame(AVCodecContext* codec_ctx, AVFormatContext* fmt_ctx,
                                   int stream_idx, AVPacket* pkt, AVFrame* frame) {
    int ret;
    bool draining = false;

    while (true) {
        // Try to receive a frame from the decoder
        ret = avcodec_receive_frame(codec_ctx, frame);
        if (ret == 0) {
            return frame;
        } else if (ret == AVERROR_EOF) {
            return Error::eof();
        } else if (ret != AVERROR(EAGAIN)) {
            return ffmpeg_error(ret, "avcodec_receive_frame");
        } else if (draining) {
            // Decoder asked for input after being flushed
            return Error::eof();
        }

        // Read next packet of our stream
        while (true) {
            ret = av_read_frame(fmt_ctx, pkt);
            if (ret < 0) {
                if (ret == AVERROR_EOF) {
                    break;
                }
                return ffmpeg_error(ret, "av_read_frame");
            }

            if (pkt->stream_index == stream_idx) {
                break;
            }
            av_packet_unref(pkt);
        }

        if (ret == AVERROR_EOF) {
            // Enter draining mode; buffered frames come out of receive_frame
            ret = avcodec_send_packet(codec_ctx, nullptr);
            if (ret < 0 && ret != AVERROR_EOF) {
                return ffmpeg_error(ret, "avcodec_send_packet(flush)");
            }
            draining = true;
            continue;
        }

        // Send packet to decoder
        ret = avcodec_send_packet(codec_ctx, pkt);
        av_packet_unref(pkt);

        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            return ffmpeg_error(ret, "avcodec_send_packet");
        }
    }
}

} // namespace impl
} // namespace cce

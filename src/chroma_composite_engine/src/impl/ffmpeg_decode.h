#pragma once

#include "ffmpeg_context.h"

namespace cce {
namespace impl {

// Decode next frame of stream_idx from the codec context
// Returns:
//   - Frame on success
//   - EOFReached when no more frames
//   - the mapped FFmpeg error otherwise
Result<AVFrame*> decode_next_frame(AVCodecContext* codec_ctx, AVFormatContext* fmt_ctx,
                                   int stream_idx, AVPacket* pkt, AVFrame* frame);

} // namespace impl
} // namespace cce

#pragma once

#include "cce_compute_backend.h"
#include "cce_frame.h"
#include "cce_video_reader.h"
#include <memory>

namespace cce {

// Sequential cursor over the foreground stream.
// Tracks the last frame whose timestamp is <= the requested window offset
// and keys only that frame; frames skipped over are never keyed.
class ForegroundCursor {
public:
    ForegroundCursor(std::shared_ptr<VideoReader> reader, ComputeBackend& backend);

    // Move to offset_us (non-decreasing across calls). Returns true while a
    // foreground frame covers offset_us.
    Result<bool> advance(TimeUS offset_us);

    // Timestamp of the frame currently keyed, -1 before the first one
    TimeUS current_pts_us() const { return m_has_current ? m_current.pts_us() : -1; }

    void release();

private:
    std::shared_ptr<VideoReader> m_reader;
    ComputeBackend& m_backend;
    TimeUS m_frame_duration_us;
    Frame m_pending;
    Frame m_current;
    bool m_has_pending = false;
    bool m_has_current = false;
    bool m_at_eof = false;
};

} // namespace cce

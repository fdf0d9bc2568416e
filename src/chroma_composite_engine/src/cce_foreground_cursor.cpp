#include <chroma_composite_engine/cce_foreground_cursor.h>
#include <chroma_composite_engine/cce_media_file.h>

namespace cce {

ForegroundCursor::ForegroundCursor(std::shared_ptr<VideoReader> reader, ComputeBackend& backend)
    : m_reader(std::move(reader)), m_backend(backend),
      m_frame_duration_us(FrameTime::from_frame(1, m_reader->media_file()->info().video_rate()).to_us()) {
}

Result<bool> ForegroundCursor::advance(TimeUS offset_us) {
    bool moved = false;
    while (!m_at_eof) {
        if (!m_has_pending) {
            auto next = m_reader->ReadNext();
            if (next.is_error()) {
                if (next.error().code != ErrorCode::EOFReached) {
                    return next.error();
                }
                m_at_eof = true;
                break;
            }
            m_pending = std::move(next.value());
            m_has_pending = true;
        }
        if (m_pending.pts_us() > offset_us) {
            break;
        }
        m_current = std::move(m_pending);
        m_pending = Frame();
        m_has_current = true;
        m_has_pending = false;
        moved = true;
    }

    if (!m_has_current) {
        return false;
    }
    if (moved) {
        m_backend.key_foreground(m_current.image());
    }
    // Past the end of the last frame the background shows through
    if (m_at_eof && offset_us >= m_current.pts_us() + m_frame_duration_us) {
        return false;
    }
    return true;
}

void ForegroundCursor::release() {
    m_reader.reset();
    m_pending = Frame();
    m_current = Frame();
}

} // namespace cce

#include <chroma_composite_engine/cce_frame.h>

namespace cce {

Frame::Frame(cv::Mat bgr, TimeUS pts_us, int64_t index)
    : m_image(std::move(bgr)), m_pts_us(pts_us), m_index(index) {
}

} // namespace cce

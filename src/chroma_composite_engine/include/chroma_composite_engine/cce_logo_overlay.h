#pragma once

#include "cce_errors.h"
#include "cce_timing_gate.h"
#include <opencv2/core.hpp>
#include <optional>
#include <string>

namespace cce {

enum class LogoPosition {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
    Center,
    Custom
};

const char* logo_position_to_string(LogoPosition position);
std::optional<LogoPosition> logo_position_from_string(const std::string& name);

struct LogoSpec {
    std::string path;
    LogoPosition position = LogoPosition::BottomRight;
    // Custom only: top-left corner on the frame
    int x = 0;
    int y = 0;
    // Distance from the frame border for corner placements
    int margin = 20;
    // Relative to the logo's own size; ignored when width/height are set
    double scale = 1.0;
    int width = 0;
    int height = 0;
    double opacity = 1.0;
    double start_time = 0.0;
    std::optional<double> end_time;
};

// Blends a static watermark onto every frame inside its window.
// The image is decoded and resized once.
class LogoOverlayStage {
public:
    // Load the logo from spec.path. Unreadable images are UnsupportedMedia.
    static Result<LogoOverlayStage> Create(const LogoSpec& spec, cv::Size frame_size);

    // Build from an in-memory image (CV_8UC3 or CV_8UC4)
    static Result<LogoOverlayStage> FromImage(const cv::Mat& image, const LogoSpec& spec,
                                              cv::Size frame_size);

    void apply(cv::Mat& frame, TimeUS t_us) const;

    cv::Point origin() const { return m_origin; }
    cv::Size size() const { return m_image.size(); }

private:
    LogoOverlayStage(cv::Mat image, cv::Mat alpha, cv::Point origin, double opacity,
                     TimingGate gate);

    cv::Mat m_image;
    cv::Mat m_alpha;
    cv::Point m_origin;
    double m_opacity;
    TimingGate m_gate;
};

} // namespace cce

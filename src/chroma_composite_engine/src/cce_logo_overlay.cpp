#include <chroma_composite_engine/cce_logo_overlay.h>
#include <chroma_composite_engine/cce_frame_transformer.h>
#include "cce_logging.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <QFileInfo>
#include <QString>
#include <algorithm>
#include <cmath>

namespace cce {

const char* logo_position_to_string(LogoPosition position) {
    switch (position) {
        case LogoPosition::TopLeft:     return "top-left";
        case LogoPosition::TopRight:    return "top-right";
        case LogoPosition::BottomLeft:  return "bottom-left";
        case LogoPosition::BottomRight: return "bottom-right";
        case LogoPosition::Center:      return "center";
        case LogoPosition::Custom:      return "custom";
    }
    return "custom";
}

std::optional<LogoPosition> logo_position_from_string(const std::string& name) {
    if (name == "top-left") return LogoPosition::TopLeft;
    if (name == "top-right") return LogoPosition::TopRight;
    if (name == "bottom-left") return LogoPosition::BottomLeft;
    if (name == "bottom-right") return LogoPosition::BottomRight;
    if (name == "center") return LogoPosition::Center;
    if (name == "custom") return LogoPosition::Custom;
    return std::nullopt;
}

static cv::Point logo_origin(const LogoSpec& spec, cv::Size logo, cv::Size frame) {
    const int m = spec.margin;
    switch (spec.position) {
        case LogoPosition::TopLeft:     return cv::Point(m, m);
        case LogoPosition::TopRight:    return cv::Point(frame.width - logo.width - m, m);
        case LogoPosition::BottomLeft:  return cv::Point(m, frame.height - logo.height - m);
        case LogoPosition::BottomRight: return cv::Point(frame.width - logo.width - m,
                                                         frame.height - logo.height - m);
        case LogoPosition::Center:      return cv::Point((frame.width - logo.width) / 2,
                                                         (frame.height - logo.height) / 2);
        case LogoPosition::Custom:      return cv::Point(spec.x, spec.y);
    }
    return cv::Point(spec.x, spec.y);
}

LogoOverlayStage::LogoOverlayStage(cv::Mat image, cv::Mat alpha, cv::Point origin, double opacity,
                                   TimingGate gate)
    : m_image(std::move(image)), m_alpha(std::move(alpha)), m_origin(origin),
      m_opacity(opacity), m_gate(gate) {
}

Result<LogoOverlayStage> LogoOverlayStage::Create(const LogoSpec& spec, cv::Size frame_size) {
    if (!QFileInfo::exists(QString::fromStdString(spec.path))) {
        return Error::file_not_found(spec.path);
    }
    cv::Mat image = cv::imread(spec.path, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        return Error::unsupported_media("Cannot decode logo image: " + spec.path);
    }
    return FromImage(image, spec, frame_size);
}

Result<LogoOverlayStage> LogoOverlayStage::FromImage(const cv::Mat& image, const LogoSpec& spec,
                                                     cv::Size frame_size) {
    if (image.empty() || image.depth() != CV_8U) {
        return Error::unsupported_media("Logo must be an 8-bit image");
    }

    cv::Mat bgr;
    cv::Mat alpha;
    switch (image.channels()) {
        case 4:
            cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
            cv::extractChannel(image, alpha, 3);
            break;
        case 3:
            bgr = image.clone();
            alpha = cv::Mat(image.size(), CV_8UC1, cv::Scalar(255));
            break;
        case 1:
            cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
            alpha = cv::Mat(image.size(), CV_8UC1, cv::Scalar(255));
            break;
        default:
            return Error::unsupported_media("Unsupported logo channel count");
    }

    cv::Size target;
    if (spec.width > 0 && spec.height > 0) {
        if (spec.width > MAX_SCALED_DIMENSION || spec.height > MAX_SCALED_DIMENSION) {
            return Error::invalid_parameter("logo.width", "explicit size exceeds " +
                                                              std::to_string(MAX_SCALED_DIMENSION) +
                                                              " pixels");
        }
        target = cv::Size(spec.width, spec.height);
    } else {
        auto scaled = scale_size(bgr.size(), spec.scale, "logo.scale");
        if (scaled.is_error()) {
            return scaled.error();
        }
        target = scaled.value();
    }
    if (target != bgr.size()) {
        const int interp = target.area() < bgr.size().area() ? cv::INTER_AREA : cv::INTER_LINEAR;
        cv::resize(bgr, bgr, target, 0, 0, interp);
        cv::resize(alpha, alpha, target, 0, 0, interp);
    }

    const cv::Point origin = logo_origin(spec, target, frame_size);
    std::optional<TimeUS> end_us;
    if (spec.end_time) {
        end_us = seconds_to_us(*spec.end_time);
    }

    qCDebug(cceDriver, "Logo %dx%d at (%d,%d), opacity %.2f", target.width, target.height,
            origin.x, origin.y, spec.opacity);

    return LogoOverlayStage(std::move(bgr), std::move(alpha), origin, spec.opacity,
                            TimingGate(seconds_to_us(spec.start_time), end_us));
}

void LogoOverlayStage::apply(cv::Mat& frame, TimeUS t_us) const {
    if (!m_gate.is_active(t_us)) {
        return;
    }
    blend_over(m_image, m_alpha, frame, m_origin.x, m_origin.y, m_opacity);
}

} // namespace cce

#include <chroma_composite_engine/cce_job_parameters.h>
#include <QDir>
#include <QFileInfo>
#include <cmath>

namespace cce {

namespace {

// Canonical path for files that exist, cleaned absolute path otherwise
QString comparable_path(const std::string& path) {
    QFileInfo info(QString::fromStdString(path));
    const QString canonical = info.canonicalFilePath();
    return canonical.isEmpty() ? QDir::cleanPath(info.absoluteFilePath()) : canonical;
}

bool in_unit_range(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

Result<void> validate_logo(const LogoSpec& logo) {
    if (logo.path.empty()) {
        return Error::invalid_parameter("logo.path", "must not be empty");
    }
    if (!std::isfinite(logo.scale) || logo.scale <= 0.0) {
        return Error::invalid_parameter("logo.scale", "must be greater than 0");
    }
    if (!in_unit_range(logo.opacity)) {
        return Error::invalid_parameter("logo.opacity", "must be within [0, 1]");
    }
    if (logo.width < 0 || (logo.width > 0 && logo.height == 0)) {
        return Error::invalid_parameter("logo.width", "width and height must be given together");
    }
    if (logo.height < 0 || (logo.height > 0 && logo.width == 0)) {
        return Error::invalid_parameter("logo.height", "width and height must be given together");
    }
    if (logo.margin < 0) {
        return Error::invalid_parameter("logo.margin", "must not be negative");
    }
    if (!std::isfinite(logo.start_time) || logo.start_time < 0.0) {
        return Error::invalid_parameter("logo.start_time", "must be a non-negative number of seconds");
    }
    if (logo.end_time && (!std::isfinite(*logo.end_time) || *logo.end_time <= logo.start_time)) {
        return Error::invalid_parameter("logo.end_time", "must be greater than logo.start_time");
    }
    return Result<void>();
}

} // namespace

JobParameters::JobParameters(JobSpec spec, TimeUS start_us, std::optional<TimeUS> end_us)
    : m_spec(std::move(spec)), m_start_us(start_us), m_end_us(end_us) {
}

Result<JobParameters> JobParameters::Create(const JobSpec& spec) {
    if (spec.foreground_path.empty()) {
        return Error::invalid_parameter("foreground_path", "must not be empty");
    }
    if (spec.background_path.empty()) {
        return Error::invalid_parameter("background_path", "must not be empty");
    }
    if (spec.output_path.empty()) {
        return Error::invalid_parameter("output_path", "must not be empty");
    }
    const QString output = comparable_path(spec.output_path);
    if (output == comparable_path(spec.foreground_path) ||
        output == comparable_path(spec.background_path)) {
        return Error::invalid_parameter("output_path", "must differ from the input paths");
    }

    if (!std::isfinite(spec.start_time) || spec.start_time < 0.0) {
        return Error::invalid_parameter("start_time", "must be a non-negative number of seconds");
    }
    const TimeUS start_us = seconds_to_us(spec.start_time);

    std::optional<TimeUS> end_us;
    if (spec.end_time) {
        if (!std::isfinite(*spec.end_time)) {
            return Error::invalid_parameter("end_time", "must be a finite number of seconds");
        }
        end_us = seconds_to_us(*spec.end_time);
        if (*end_us <= start_us) {
            return Error::invalid_parameter("end_time", "must be greater than start_time");
        }
    }

    if (!std::isfinite(spec.scale) || spec.scale <= 0.0) {
        return Error::invalid_parameter("scale", "must be greater than 0");
    }
    if (!in_unit_range(spec.opacity)) {
        return Error::invalid_parameter("opacity", "must be within [0, 1]");
    }

    auto key_result = spec.key_color.validate("key_color");
    if (key_result.is_error()) {
        return key_result.error();
    }

    if (spec.edge_blur_radius < 0) {
        return Error::invalid_parameter("edge_blur_radius", "must not be negative");
    }
    if (spec.edge_blur_radius > 1 && spec.edge_blur_radius % 2 == 0) {
        return Error::invalid_parameter("edge_blur_radius", "must be odd (or 0 to disable)");
    }

    if (!in_unit_range(spec.spill_reduction_strength)) {
        return Error::invalid_parameter("spill_reduction_strength", "must be within [0, 1]");
    }

    if (spec.logo) {
        auto logo_result = validate_logo(*spec.logo);
        if (logo_result.is_error()) {
            return logo_result.error();
        }
    }

    return JobParameters(spec, start_us, end_us);
}

} // namespace cce

#include "job_config.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSet>
#include <QStringList>
#include <cmath>

namespace cce {
namespace cli {

namespace {

Result<double> json_number(const QJsonValue& value, const std::string& field) {
    if (!value.isDouble()) {
        return Error::invalid_parameter(field, "expected a number");
    }
    return value.toDouble();
}

Result<int> json_int(const QJsonValue& value, const std::string& field) {
    if (!value.isDouble()) {
        return Error::invalid_parameter(field, "expected an integer");
    }
    double d = value.toDouble();
    if (std::floor(d) != d || std::fabs(d) > 1e9) {
        return Error::invalid_parameter(field, "expected an integer");
    }
    return static_cast<int>(d);
}

Result<bool> json_bool(const QJsonValue& value, const std::string& field) {
    if (!value.isBool()) {
        return Error::invalid_parameter(field, "expected true or false");
    }
    return value.toBool();
}

Result<std::string> json_string(const QJsonValue& value, const std::string& field) {
    if (!value.isString()) {
        return Error::invalid_parameter(field, "expected a string");
    }
    return value.toString().toStdString();
}

Result<HsvTriplet> json_triplet(const QJsonValue& value, const std::string& field) {
    QJsonArray array = value.toArray();
    if (!value.isArray() || array.size() != 3) {
        return Error::invalid_parameter(field, "expected [h, s, v]");
    }
    int channels[3];
    for (int i = 0; i < 3; ++i) {
        auto channel = json_int(array.at(i), field);
        if (channel.is_error()) {
            return channel.error();
        }
        channels[i] = channel.value();
    }
    return HsvTriplet{channels[0], channels[1], channels[2]};
}

Result<std::optional<double>> json_optional_time(const QJsonValue& value, const std::string& field) {
    if (value.isNull()) {
        return std::optional<double>();
    }
    auto number = json_number(value, field);
    if (number.is_error()) {
        return number.error();
    }
    return std::optional<double>(number.value());
}

// Preset name or {"lower": [h,s,v], "upper": [h,s,v]}
Result<KeyColorSpec> json_key_color(const QJsonValue& value) {
    if (value.isString()) {
        auto preset = key_preset_from_string(value.toString().toStdString());
        if (!preset || *preset == KeyPreset::Custom) {
            return Error::invalid_parameter("key_color", "expected \"green\", \"blue\" or bounds");
        }
        return *preset == KeyPreset::Green ? KeyColorSpec::Green() : KeyColorSpec::Blue();
    }
    if (!value.isObject()) {
        return Error::invalid_parameter("key_color", "expected a preset name or bounds object");
    }
    QJsonObject object = value.toObject();
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (it.key() != "lower" && it.key() != "upper") {
            return Error::invalid_parameter("key_color." + it.key().toStdString(), "unknown key");
        }
    }
    if (!object.contains("lower") || !object.contains("upper")) {
        return Error::invalid_parameter("key_color", "both lower and upper are required");
    }
    auto lower = json_triplet(object.value("lower"), "key_color.lower");
    if (lower.is_error()) {
        return lower.error();
    }
    auto upper = json_triplet(object.value("upper"), "key_color.upper");
    if (upper.is_error()) {
        return upper.error();
    }
    return KeyColorSpec::Custom(lower.value(), upper.value());
}

Result<LogoSpec> json_logo(const QJsonValue& value) {
    if (!value.isObject()) {
        return Error::invalid_parameter("logo", "expected an object");
    }
    LogoSpec logo;
    QJsonObject object = value.toObject();
    for (auto it = object.begin(); it != object.end(); ++it) {
        const QString key = it.key();
        const std::string field = "logo." + key.toStdString();
        const QJsonValue v = it.value();

        if (key == "path") {
            auto r = json_string(v, field);
            if (r.is_error()) return r.error();
            logo.path = r.value();
        } else if (key == "position") {
            auto r = json_string(v, field);
            if (r.is_error()) return r.error();
            auto position = logo_position_from_string(r.value());
            if (!position) {
                return Error::invalid_parameter(field, "unknown position '" + r.value() + "'");
            }
            logo.position = *position;
        } else if (key == "x" || key == "y" || key == "margin" || key == "width" || key == "height") {
            auto r = json_int(v, field);
            if (r.is_error()) return r.error();
            if (key == "x") logo.x = r.value();
            else if (key == "y") logo.y = r.value();
            else if (key == "margin") logo.margin = r.value();
            else if (key == "width") logo.width = r.value();
            else logo.height = r.value();
        } else if (key == "scale" || key == "opacity" || key == "start_time") {
            auto r = json_number(v, field);
            if (r.is_error()) return r.error();
            if (key == "scale") logo.scale = r.value();
            else if (key == "opacity") logo.opacity = r.value();
            else logo.start_time = r.value();
        } else if (key == "end_time") {
            auto r = json_optional_time(v, field);
            if (r.is_error()) return r.error();
            logo.end_time = r.value();
        } else {
            return Error::invalid_parameter(field, "unknown key");
        }
    }
    return logo;
}

Result<void> apply_json_field(const QString& key, const QJsonValue& v, JobSpec& spec) {
    const std::string field = key.toStdString();

    if (key == "foreground_path" || key == "background_path" || key == "output_path") {
        auto r = json_string(v, field);
        if (r.is_error()) return r.error();
        if (key == "foreground_path") spec.foreground_path = r.value();
        else if (key == "background_path") spec.background_path = r.value();
        else spec.output_path = r.value();
    } else if (key == "start_time" || key == "scale" || key == "opacity" ||
               key == "spill_reduction_strength") {
        auto r = json_number(v, field);
        if (r.is_error()) return r.error();
        if (key == "start_time") spec.start_time = r.value();
        else if (key == "scale") spec.scale = r.value();
        else if (key == "opacity") spec.opacity = r.value();
        else spec.spill_reduction_strength = r.value();
    } else if (key == "end_time") {
        auto r = json_optional_time(v, field);
        if (r.is_error()) return r.error();
        spec.end_time = r.value();
    } else if (key == "position_x" || key == "position_y" || key == "edge_blur_radius") {
        auto r = json_int(v, field);
        if (r.is_error()) return r.error();
        if (key == "position_x") spec.position_x = r.value();
        else if (key == "position_y") spec.position_y = r.value();
        else spec.edge_blur_radius = r.value();
    } else if (key == "key_color") {
        auto r = json_key_color(v);
        if (r.is_error()) return r.error();
        spec.key_color = r.value();
    } else if (key == "audio_mode") {
        auto r = json_string(v, field);
        if (r.is_error()) return r.error();
        auto mode = audio_mode_from_string(r.value());
        if (!mode) {
            return Error::invalid_parameter(field, "unknown audio mode '" + r.value() + "'");
        }
        spec.audio_mode = *mode;
    } else if (key == "logo") {
        if (v.isNull()) {
            spec.logo.reset();
            return Result<void>();
        }
        auto r = json_logo(v);
        if (r.is_error()) return r.error();
        spec.logo = r.value();
    } else if (key == "fast_mode" || key == "gpu_accel") {
        auto r = json_bool(v, field);
        if (r.is_error()) return r.error();
        if (key == "fast_mode") spec.fast_mode = r.value();
        else spec.gpu_accel = r.value();
    } else {
        return Error::invalid_parameter(field, "unknown key");
    }
    return Result<void>();
}

Result<double> option_number(const QCommandLineParser& parser, const QString& name) {
    bool ok = false;
    double value = parser.value(name).toDouble(&ok);
    if (!ok) {
        return Error::invalid_parameter(name.toStdString(), "expected a number");
    }
    return value;
}

Result<int> option_int(const QCommandLineParser& parser, const QString& name) {
    bool ok = false;
    int value = parser.value(name).toInt(&ok);
    if (!ok) {
        return Error::invalid_parameter(name.toStdString(), "expected an integer");
    }
    return value;
}

} // namespace

void add_job_options(QCommandLineParser& parser) {
    parser.addOptions({
        {{"f", "foreground"}, "Foreground video filmed against the backdrop.", "path"},
        {{"b", "background"}, "Background video.", "path"},
        {{"o", "output"}, "Output video file.", "path"},
        {"job", "JSON job file; command-line options override it.", "path"},
        {"start", "Start of the active window in seconds.", "seconds"},
        {"end", "End of the active window in seconds (default: end of background).", "seconds"},
        {"x", "Horizontal offset of the foreground center in pixels.", "pixels"},
        {"y", "Vertical offset of the foreground center in pixels.", "pixels"},
        {"scale", "Foreground scale factor.", "factor"},
        {"opacity", "Foreground opacity (0..1).", "value"},
        {"key", "Key color preset: green or blue.", "preset"},
        {"key-lower", "Custom lower HSV bound (OpenCV ranges).", "h,s,v"},
        {"key-upper", "Custom upper HSV bound (OpenCV ranges).", "h,s,v"},
        {"blur", "Edge blur kernel size (odd, 0 disables).", "size"},
        {"spill", "Spill reduction strength (0..1).", "value"},
        {"audio", "Audio mode: synced, background, foreground, both, timed, none.", "mode"},
        {"logo", "Logo image to overlay.", "path"},
        {"logo-position", "top-left, top-right, bottom-left, bottom-right, center or custom.", "position"},
        {"logo-x", "Logo left edge for custom position.", "pixels"},
        {"logo-y", "Logo top edge for custom position.", "pixels"},
        {"logo-margin", "Logo distance from the frame border.", "pixels"},
        {"logo-scale", "Logo scale relative to its own size.", "factor"},
        {"logo-width", "Logo width in pixels (with --logo-height).", "pixels"},
        {"logo-height", "Logo height in pixels (with --logo-width).", "pixels"},
        {"logo-opacity", "Logo opacity (0..1).", "value"},
        {"fast", "Favor speed: no mask cleanup or spill reduction, bilinear scaling."},
        {"quality", "Favor quality: mask cleanup, spill reduction, area/cubic scaling."},
        {"gpu", "Use OpenCL when available."},
    });
}

Result<void> apply_job_json(const QByteArray& json, JobSpec& spec) {
    QJsonParseError parse_error;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Error::invalid_parameter("job", parse_error.errorString().toStdString());
    }
    if (!doc.isObject()) {
        return Error::invalid_parameter("job", "expected a JSON object");
    }

    QJsonObject object = doc.object();
    for (auto it = object.begin(); it != object.end(); ++it) {
        auto applied = apply_json_field(it.key(), it.value(), spec);
        if (applied.is_error()) {
            return applied.error();
        }
    }
    return Result<void>();
}

Result<void> load_job_file(const QString& path, JobSpec& spec) {
    QFile file(path);
    if (!file.exists()) {
        return Error::file_not_found(path.toStdString());
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Error::invalid_parameter("job", "cannot read " + path.toStdString());
    }
    return apply_job_json(file.readAll(), spec);
}

Result<HsvTriplet> parse_hsv_triplet(const QString& text, const std::string& field) {
    QStringList parts = text.split(',');
    if (parts.size() != 3) {
        return Error::invalid_parameter(field, "expected h,s,v");
    }
    int channels[3];
    for (int i = 0; i < 3; ++i) {
        bool ok = false;
        channels[i] = parts[i].trimmed().toInt(&ok);
        if (!ok) {
            return Error::invalid_parameter(field, "expected h,s,v integers");
        }
    }
    return HsvTriplet{channels[0], channels[1], channels[2]};
}

Result<void> apply_command_line(const QCommandLineParser& parser, JobSpec& spec) {
    if (parser.isSet("foreground")) spec.foreground_path = parser.value("foreground").toStdString();
    if (parser.isSet("background")) spec.background_path = parser.value("background").toStdString();
    if (parser.isSet("output")) spec.output_path = parser.value("output").toStdString();

    if (parser.isSet("start")) {
        auto r = option_number(parser, "start");
        if (r.is_error()) return r.error();
        spec.start_time = r.value();
    }
    if (parser.isSet("end")) {
        auto r = option_number(parser, "end");
        if (r.is_error()) return r.error();
        spec.end_time = r.value();
    }
    if (parser.isSet("x")) {
        auto r = option_int(parser, "x");
        if (r.is_error()) return r.error();
        spec.position_x = r.value();
    }
    if (parser.isSet("y")) {
        auto r = option_int(parser, "y");
        if (r.is_error()) return r.error();
        spec.position_y = r.value();
    }
    if (parser.isSet("scale")) {
        auto r = option_number(parser, "scale");
        if (r.is_error()) return r.error();
        spec.scale = r.value();
    }
    if (parser.isSet("opacity")) {
        auto r = option_number(parser, "opacity");
        if (r.is_error()) return r.error();
        spec.opacity = r.value();
    }

    if (parser.isSet("key")) {
        auto preset = key_preset_from_string(parser.value("key").toStdString());
        if (!preset || *preset == KeyPreset::Custom) {
            return Error::invalid_parameter("key", "expected green or blue");
        }
        spec.key_color = *preset == KeyPreset::Green ? KeyColorSpec::Green() : KeyColorSpec::Blue();
    }
    if (parser.isSet("key-lower") || parser.isSet("key-upper")) {
        if (!parser.isSet("key-lower") || !parser.isSet("key-upper")) {
            return Error::invalid_parameter("key_color", "--key-lower and --key-upper go together");
        }
        auto lower = parse_hsv_triplet(parser.value("key-lower"), "key_color.lower");
        if (lower.is_error()) return lower.error();
        auto upper = parse_hsv_triplet(parser.value("key-upper"), "key_color.upper");
        if (upper.is_error()) return upper.error();
        spec.key_color = KeyColorSpec::Custom(lower.value(), upper.value());
    }

    if (parser.isSet("blur")) {
        auto r = option_int(parser, "blur");
        if (r.is_error()) return r.error();
        spec.edge_blur_radius = r.value();
    }
    if (parser.isSet("spill")) {
        auto r = option_number(parser, "spill");
        if (r.is_error()) return r.error();
        spec.spill_reduction_strength = r.value();
    }
    if (parser.isSet("audio")) {
        auto mode = audio_mode_from_string(parser.value("audio").toStdString());
        if (!mode) {
            return Error::invalid_parameter("audio_mode",
                                            "unknown audio mode '" + parser.value("audio").toStdString() + "'");
        }
        spec.audio_mode = *mode;
    }

    const bool any_logo_option = parser.isSet("logo") || parser.isSet("logo-position") ||
        parser.isSet("logo-x") || parser.isSet("logo-y") || parser.isSet("logo-margin") ||
        parser.isSet("logo-scale") || parser.isSet("logo-width") || parser.isSet("logo-height") ||
        parser.isSet("logo-opacity");
    if (any_logo_option) {
        LogoSpec logo = spec.logo ? *spec.logo : LogoSpec();
        if (parser.isSet("logo")) logo.path = parser.value("logo").toStdString();
        if (parser.isSet("logo-position")) {
            auto position = logo_position_from_string(parser.value("logo-position").toStdString());
            if (!position) {
                return Error::invalid_parameter("logo.position", "unknown position");
            }
            logo.position = *position;
        }
        const struct { const char* option; int* target; } int_options[] = {
            {"logo-x", &logo.x}, {"logo-y", &logo.y}, {"logo-margin", &logo.margin},
            {"logo-width", &logo.width}, {"logo-height", &logo.height},
        };
        for (const auto& opt : int_options) {
            if (parser.isSet(opt.option)) {
                auto r = option_int(parser, opt.option);
                if (r.is_error()) return r.error();
                *opt.target = r.value();
            }
        }
        if (parser.isSet("logo-scale")) {
            auto r = option_number(parser, "logo-scale");
            if (r.is_error()) return r.error();
            logo.scale = r.value();
        }
        if (parser.isSet("logo-opacity")) {
            auto r = option_number(parser, "logo-opacity");
            if (r.is_error()) return r.error();
            logo.opacity = r.value();
        }
        spec.logo = logo;
    }

    if (parser.isSet("fast") && parser.isSet("quality")) {
        return Error::invalid_parameter("fast_mode", "--fast and --quality are exclusive");
    }
    if (parser.isSet("fast")) spec.fast_mode = true;
    if (parser.isSet("quality")) spec.fast_mode = false;
    if (parser.isSet("gpu")) spec.gpu_accel = true;

    return Result<void>();
}

QJsonObject media_info_to_json(const MediaInfo& info) {
    QJsonObject json;
    json["path"] = QString::fromStdString(info.path);
    json["duration"] = us_to_seconds(info.duration_us);
    json["has_video"] = info.has_video;
    if (info.has_video) {
        json["width"] = info.video_width;
        json["height"] = info.video_height;
        json["fps"] = info.video_rate().to_fps();
        json["fps_rational"] = QString("%1/%2").arg(info.video_fps_num).arg(info.video_fps_den);
        json["is_vfr"] = info.is_vfr;
        json["video_codec"] = QString::fromStdString(info.video_codec);
    }
    json["has_audio"] = info.has_audio;
    if (info.has_audio) {
        json["audio_sample_rate"] = info.audio_sample_rate;
        json["audio_channels"] = info.audio_channels;
    }
    return json;
}

QJsonObject job_result_to_json(const JobResult& result) {
    QJsonObject json;
    json["output_path"] = QString::fromStdString(result.output_path);
    json["duration"] = us_to_seconds(result.duration_us);
    json["frames_written"] = static_cast<double>(result.frames_written);
    json["frames_composited"] = static_cast<double>(result.frames_composited);
    json["width"] = result.width;
    json["height"] = result.height;
    json["fps"] = result.rate.to_fps();
    json["backend"] = backend_kind_to_string(result.backend);
    json["elapsed_seconds"] = result.elapsed_seconds;
    return json;
}

} // namespace cli
} // namespace cce

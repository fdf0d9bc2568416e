// JSON job files and command-line overrides

#include <QtTest>
#include <QCommandLineParser>
#include <QJsonObject>

#include "job_config.h"

class TestJobConfig : public QObject
{
    Q_OBJECT

private:
    static cce::Result<void> parseArgs(const QStringList& args, cce::JobSpec& spec) {
        QCommandLineParser parser;
        cce::cli::add_job_options(parser);
        if (!parser.parse(QStringList{"cce_compose"} + args)) {
            return cce::Error::invalid_parameter("arguments", parser.errorText().toStdString());
        }
        return cce::cli::apply_command_line(parser, spec);
    }

private slots:
    void test_full_job_json() {
        const QByteArray json = R"({
            "foreground_path": "fg.mp4",
            "background_path": "bg.mp4",
            "output_path": "out.mp4",
            "start_time": 5,
            "end_time": 15,
            "position_x": -40,
            "position_y": 12,
            "scale": 0.5,
            "opacity": 0.9,
            "key_color": "blue",
            "edge_blur_radius": 7,
            "spill_reduction_strength": 0.4,
            "audio_mode": "timed",
            "fast_mode": false,
            "gpu_accel": true,
            "logo": {"path": "logo.png", "position": "top-left", "margin": 8, "opacity": 0.5,
                     "start_time": 1, "end_time": null}
        })";

        cce::JobSpec spec;
        auto result = cce::cli::apply_job_json(json, spec);
        QVERIFY2(result.is_ok(), result.is_ok() ? "" : result.error().message.c_str());

        QCOMPARE(spec.foreground_path, std::string("fg.mp4"));
        QCOMPARE(spec.start_time, 5.0);
        QCOMPARE(*spec.end_time, 15.0);
        QCOMPARE(spec.position_x, -40);
        QCOMPARE(spec.position_y, 12);
        QCOMPARE(spec.scale, 0.5);
        QCOMPARE(spec.key_color.preset, cce::KeyPreset::Blue);
        QCOMPARE(spec.edge_blur_radius, 7);
        QCOMPARE(spec.audio_mode, cce::AudioMode::TimedForeground);
        QVERIFY(!spec.fast_mode);
        QVERIFY(spec.gpu_accel);
        QVERIFY(spec.logo.has_value());
        QCOMPARE(spec.logo->position, cce::LogoPosition::TopLeft);
        QCOMPARE(spec.logo->margin, 8);
        QVERIFY(!spec.logo->end_time.has_value());
    }

    void test_custom_key_bounds() {
        cce::JobSpec spec;
        auto result = cce::cli::apply_job_json(
            R"({"key_color": {"lower": [170, 80, 80], "upper": [10, 255, 255]}})", spec);
        QVERIFY(result.is_ok());
        QCOMPARE(spec.key_color.preset, cce::KeyPreset::Custom);
        QVERIFY(spec.key_color.lower == (cce::HsvTriplet{170, 80, 80}));
        QVERIFY(spec.key_color.hue_wraps());
    }

    void test_unknown_key_rejected() {
        cce::JobSpec spec;
        auto result = cce::cli::apply_job_json(R"({"chroma": 3})", spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::InvalidParameter);
        QCOMPARE(result.error().field, std::string("chroma"));

        result = cce::cli::apply_job_json(R"({"logo": {"path": "a.png", "blend": 1}})", spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().field, std::string("logo.blend"));
    }

    void test_wrong_types_rejected() {
        cce::JobSpec spec;
        auto result = cce::cli::apply_job_json(R"({"scale": "big"})", spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().field, std::string("scale"));

        result = cce::cli::apply_job_json(R"({"edge_blur_radius": 2.5})", spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().field, std::string("edge_blur_radius"));

        result = cce::cli::apply_job_json(R"({"key_color": {"lower": [1, 2], "upper": [3, 4, 5]}})", spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().field, std::string("key_color.lower"));

        result = cce::cli::apply_job_json(R"({"audio_mode": "loud"})", spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().field, std::string("audio_mode"));
    }

    void test_malformed_json() {
        cce::JobSpec spec;
        QVERIFY(cce::cli::apply_job_json("{not json", spec).is_error());
        QVERIFY(cce::cli::apply_job_json("[1, 2]", spec).is_error());
    }

    void test_missing_job_file() {
        cce::JobSpec spec;
        auto result = cce::cli::load_job_file("/nonexistent/job.json", spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::FileNotFound);
    }

    void test_command_line_overrides() {
        cce::JobSpec spec;
        spec.scale = 2.0;
        auto result = parseArgs({"-f", "fg.mp4", "-b", "bg.mp4", "-o", "out.mp4",
                                 "--start", "5", "--end", "15", "--x", "-10", "--scale", "0.5",
                                 "--key", "blue", "--blur", "3", "--audio", "both", "--quality"},
                                spec);
        QVERIFY2(result.is_ok(), result.is_ok() ? "" : result.error().message.c_str());
        QCOMPARE(spec.foreground_path, std::string("fg.mp4"));
        QCOMPARE(spec.output_path, std::string("out.mp4"));
        QCOMPARE(spec.start_time, 5.0);
        QCOMPARE(*spec.end_time, 15.0);
        QCOMPARE(spec.position_x, -10);
        QCOMPARE(spec.scale, 0.5);
        QCOMPARE(spec.key_color.preset, cce::KeyPreset::Blue);
        QCOMPARE(spec.edge_blur_radius, 3);
        QCOMPARE(spec.audio_mode, cce::AudioMode::Both);
        QVERIFY(!spec.fast_mode);
    }

    void test_command_line_key_bounds() {
        cce::JobSpec spec;
        auto result = parseArgs({"--key-lower", "30,50,50", "--key-upper", "90,255,255"}, spec);
        QVERIFY(result.is_ok());
        QCOMPARE(spec.key_color.preset, cce::KeyPreset::Custom);
        QVERIFY(spec.key_color.upper == (cce::HsvTriplet{90, 255, 255}));

        cce::JobSpec lonely;
        result = parseArgs({"--key-lower", "30,50,50"}, lonely);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().field, std::string("key_color"));
    }

    void test_command_line_logo() {
        cce::JobSpec spec;
        auto result = parseArgs({"--logo", "brand.png", "--logo-position", "custom",
                                 "--logo-x", "4", "--logo-y", "6", "--logo-opacity", "0.7"}, spec);
        QVERIFY(result.is_ok());
        QVERIFY(spec.logo.has_value());
        QCOMPARE(spec.logo->path, std::string("brand.png"));
        QCOMPARE(spec.logo->position, cce::LogoPosition::Custom);
        QCOMPARE(spec.logo->x, 4);
        QCOMPARE(spec.logo->y, 6);
        QCOMPARE(spec.logo->opacity, 0.7);
    }

    void test_command_line_bad_values() {
        cce::JobSpec spec;
        auto result = parseArgs({"--scale", "abc"}, spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().field, std::string("scale"));

        result = parseArgs({"--fast", "--quality"}, spec);
        QVERIFY(result.is_error());

        result = parseArgs({"--key-lower", "1,2", "--key-upper", "3,4,5"}, spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().field, std::string("key_color.lower"));
    }

    void test_parse_hsv_triplet() {
        auto t = cce::cli::parse_hsv_triplet(" 35, 40 ,40", "key");
        QVERIFY(t.is_ok());
        QVERIFY(t.value() == (cce::HsvTriplet{35, 40, 40}));
        QVERIFY(cce::cli::parse_hsv_triplet("a,b,c", "key").is_error());
    }

    void test_media_info_json() {
        cce::MediaInfo info;
        info.path = "clip.mp4";
        info.duration_us = 2500000;
        info.has_video = true;
        info.video_width = 1920;
        info.video_height = 1080;
        info.video_fps_num = 30000;
        info.video_fps_den = 1001;
        info.video_codec = "h264";

        QJsonObject json = cce::cli::media_info_to_json(info);
        QCOMPARE(json["width"].toInt(), 1920);
        QCOMPARE(json["duration"].toDouble(), 2.5);
        QCOMPARE(json["fps_rational"].toString(), QString("30000/1001"));
        QVERIFY(!json["has_audio"].toBool());
        QVERIFY(!json.contains("audio_sample_rate"));
    }
};

QTEST_MAIN(TestJobConfig)
#include "test_job_config.moc"

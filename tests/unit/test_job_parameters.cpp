// Validation of job parameters: every rejection names its field

#include <QtTest>
#include <QDir>

#include <chroma_composite_engine/cce_job_parameters.h>

class TestJobParameters : public QObject
{
    Q_OBJECT

private:
    cce::JobSpec validSpec() const {
        cce::JobSpec spec;
        spec.foreground_path = "/tmp/fg.mp4";
        spec.background_path = "/tmp/bg.mp4";
        spec.output_path = "/tmp/out.mp4";
        return spec;
    }

    void expectInvalid(const cce::JobSpec& spec, const std::string& field) {
        auto result = cce::JobParameters::Create(spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::InvalidParameter);
        QCOMPARE(result.error().field, field);
    }

private slots:
    void test_defaults_are_valid() {
        auto result = cce::JobParameters::Create(validSpec());
        QVERIFY(result.is_ok());

        const auto& params = result.value();
        QCOMPARE(params.start_us(), cce::TimeUS(0));
        QVERIFY(!params.end_us().has_value());
        QCOMPARE(params.scale(), 1.0);
        QCOMPARE(params.opacity(), 1.0);
        QCOMPARE(params.key_color().preset, cce::KeyPreset::Green);
        QCOMPARE(params.edge_blur_radius(), 5);
        QCOMPARE(params.audio_mode(), cce::AudioMode::Synced);
        QVERIFY(params.fast_mode());
        QVERIFY(!params.gpu_accel());
    }

    void test_times_converted_to_microseconds() {
        auto spec = validSpec();
        spec.start_time = 5.0;
        spec.end_time = 15.25;
        auto result = cce::JobParameters::Create(spec);
        QVERIFY(result.is_ok());
        QCOMPARE(result.value().start_us(), cce::TimeUS(5000000));
        QCOMPARE(*result.value().end_us(), cce::TimeUS(15250000));

        auto gate = result.value().timing_gate();
        QVERIFY(!gate.is_active(4999999));
        QVERIFY(gate.is_active(5000000));
        QVERIFY(!gate.is_active(15250000));
    }

    void test_missing_paths_rejected() {
        auto spec = validSpec();
        spec.foreground_path.clear();
        expectInvalid(spec, "foreground_path");

        spec = validSpec();
        spec.background_path.clear();
        expectInvalid(spec, "background_path");

        spec = validSpec();
        spec.output_path.clear();
        expectInvalid(spec, "output_path");
    }

    void test_output_must_not_overwrite_input() {
        auto spec = validSpec();
        spec.output_path = spec.background_path;
        expectInvalid(spec, "output_path");
    }

    void test_output_aliasing_input_is_rejected() {
        auto spec = validSpec();
        spec.output_path = "/tmp/./fg.mp4";
        expectInvalid(spec, "output_path");

        spec.output_path = "/tmp/sub/../bg.mp4";
        expectInvalid(spec, "output_path");

        // Relative spelling of an input resolved against the working directory
        spec.foreground_path = QDir::current().filePath("fg.mp4").toStdString();
        spec.output_path = "./fg.mp4";
        expectInvalid(spec, "output_path");
    }

    void test_negative_start_rejected() {
        auto spec = validSpec();
        spec.start_time = -0.5;
        expectInvalid(spec, "start_time");
    }

    void test_end_not_after_start_rejected() {
        auto spec = validSpec();
        spec.start_time = 3.0;
        spec.end_time = 3.0;
        expectInvalid(spec, "end_time");

        spec.end_time = 2.0;
        expectInvalid(spec, "end_time");
    }

    void test_scale_must_be_positive() {
        auto spec = validSpec();
        spec.scale = 0.0;
        expectInvalid(spec, "scale");

        spec.scale = -1.0;
        expectInvalid(spec, "scale");

        spec.scale = std::nan("");
        expectInvalid(spec, "scale");
    }

    void test_opacity_range() {
        auto spec = validSpec();
        spec.opacity = 1.01;
        expectInvalid(spec, "opacity");

        spec.opacity = -0.01;
        expectInvalid(spec, "opacity");

        spec.opacity = 0.0;
        QVERIFY(cce::JobParameters::Create(spec).is_ok());
    }

    void test_key_color_out_of_domain() {
        auto spec = validSpec();
        spec.key_color = cce::KeyColorSpec::Custom({180, 40, 40}, {85, 255, 255});
        expectInvalid(spec, "key_color.lower");

        spec.key_color = cce::KeyColorSpec::Custom({35, 40, 40}, {85, 256, 255});
        expectInvalid(spec, "key_color.upper");
    }

    void test_empty_key_interval_rejected_before_processing() {
        // lower > upper on every channel
        auto spec = validSpec();
        spec.key_color = cce::KeyColorSpec::Custom({90, 200, 200}, {40, 100, 100});
        auto result = cce::JobParameters::Create(spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::InvalidParameter);
        QVERIFY(cce::is_pre_processing_error(result.error().code));
        QCOMPARE(result.error().field, std::string("key_color.lower"));
    }

    void test_wrapping_hue_is_accepted() {
        auto spec = validSpec();
        spec.key_color = cce::KeyColorSpec::Custom({170, 80, 80}, {10, 255, 255});
        QVERIFY(cce::JobParameters::Create(spec).is_ok());
    }

    void test_edge_blur_must_be_odd() {
        auto spec = validSpec();
        spec.edge_blur_radius = 4;
        expectInvalid(spec, "edge_blur_radius");

        spec.edge_blur_radius = -1;
        expectInvalid(spec, "edge_blur_radius");

        spec.edge_blur_radius = 0;
        QVERIFY(cce::JobParameters::Create(spec).is_ok());
        spec.edge_blur_radius = 1;
        QVERIFY(cce::JobParameters::Create(spec).is_ok());
        spec.edge_blur_radius = 7;
        QVERIFY(cce::JobParameters::Create(spec).is_ok());
    }

    void test_spill_strength_range() {
        auto spec = validSpec();
        spec.spill_reduction_strength = 1.5;
        expectInvalid(spec, "spill_reduction_strength");
    }

    void test_logo_fields() {
        auto spec = validSpec();
        cce::LogoSpec logo;
        spec.logo = logo;
        expectInvalid(spec, "logo.path");

        logo.path = "/tmp/logo.png";
        logo.scale = 0.0;
        spec.logo = logo;
        expectInvalid(spec, "logo.scale");

        logo.scale = 0.5;
        logo.width = 64;
        spec.logo = logo;
        expectInvalid(spec, "logo.width");

        logo.height = 32;
        logo.opacity = 2.0;
        spec.logo = logo;
        expectInvalid(spec, "logo.opacity");

        logo.opacity = 0.5;
        logo.start_time = 2.0;
        logo.end_time = 1.0;
        spec.logo = logo;
        expectInvalid(spec, "logo.end_time");

        logo.end_time = 4.0;
        spec.logo = logo;
        QVERIFY(cce::JobParameters::Create(spec).is_ok());
    }

    void test_error_message_names_field() {
        auto spec = validSpec();
        spec.scale = 0.0;
        auto result = cce::JobParameters::Create(spec);
        QVERIFY(result.is_error());
        QVERIFY(result.error().message.find("scale") != std::string::npos);
    }
};

QTEST_MAIN(TestJobParameters)
#include "test_job_parameters.moc"

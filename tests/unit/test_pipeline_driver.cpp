// End-to-end compositing runs on small synthesized clips

#include <QtTest>
#include <QTemporaryDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>

#include <chroma_composite_engine/cce_audio.h>
#include <chroma_composite_engine/cce_foreground_cursor.h>
#include <chroma_composite_engine/cce_media_file.h>
#include <chroma_composite_engine/cce_muxer.h>
#include <chroma_composite_engine/cce_pipeline_driver.h>
#include <chroma_composite_engine/cce_video_encoder.h>
#include <chroma_composite_engine/cce_video_reader.h>

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <functional>

// Records how many foreground frames were keyed
class CountingBackend : public cce::ComputeBackend {
public:
    int keyed = 0;

    cce::BackendKind kind() const override { return cce::BackendKind::Cpu; }
    void key_foreground(const cv::Mat&) override { ++keyed; }
    void composite(cv::Mat&, cce::GateState) override {}
    bool has_foreground() const override { return keyed > 0; }
};

class TestPipelineDriver : public QObject
{
    Q_OBJECT

private:
    static constexpr int WIDTH = 64;
    static constexpr int HEIGHT = 48;
    const cce::Rate m_rate{10, 1};

    QTemporaryDir m_dir;
    QString m_foreground;
    QString m_background;
    bool m_ready = false;
    QString m_setupError;

    static cce::AudioTrack tone(double seconds, float amplitude, double hz) {
        const int32_t rate = 48000;
        const int64_t frames = static_cast<int64_t>(seconds * rate);
        std::vector<float> samples(static_cast<size_t>(frames * 2));
        for (int64_t i = 0; i < frames; ++i) {
            const float v = amplitude * static_cast<float>(std::sin(2.0 * CV_PI * hz * i / rate));
            samples[static_cast<size_t>(2 * i)] = v;
            samples[static_cast<size_t>(2 * i + 1)] = v;
        }
        return cce::AudioTrack(rate, 2, std::move(samples));
    }

    // Encode frames drawn by draw(i), then mux a tone on top
    bool writeClip(const QString& path, int frames, const std::function<cv::Mat(int)>& draw,
                   double tone_hz) {
        const std::string video_path = (path + ".video.mkv").toStdString();

        cce::VideoEncoderConfig config;
        config.width = WIDTH;
        config.height = HEIGHT;
        config.rate = m_rate;
        config.format_name = "matroska";
        auto encoder = cce::VideoEncoder::Create(video_path, config);
        if (encoder.is_error()) {
            m_setupError = QString::fromStdString(encoder.error().message);
            return false;
        }
        for (int i = 0; i < frames; ++i) {
            auto written = encoder.value()->WriteFrame(draw(i));
            if (written.is_error()) {
                m_setupError = QString::fromStdString(written.error().message);
                return false;
            }
        }
        auto finished = encoder.value()->Finish();
        if (finished.is_error()) {
            m_setupError = QString::fromStdString(finished.error().message);
            return false;
        }

        const double seconds = static_cast<double>(frames) * m_rate.den / m_rate.num;
        auto muxed = cce::MuxVideoWithAudio(video_path, tone(seconds, 0.3f, tone_hz),
                                            path.toStdString(), cce::MuxConfig());
        QFile::remove(QString::fromStdString(video_path));
        if (muxed.is_error()) {
            m_setupError = QString::fromStdString(muxed.error().message);
            return false;
        }
        return true;
    }

    cce::JobSpec baseSpec(const QString& output) const {
        cce::JobSpec spec;
        spec.foreground_path = m_foreground.toStdString();
        spec.background_path = m_background.toStdString();
        spec.output_path = output.toStdString();
        return spec;
    }

    static cce::JobParameters params(const cce::JobSpec& spec) {
        auto result = cce::JobParameters::Create(spec);
        if (result.is_error()) {
            qFatal("invalid job: %s", result.error().message.c_str());
        }
        return result.value();
    }

    static std::vector<cv::Mat> decodeAll(const QString& path) {
        std::vector<cv::Mat> frames;
        auto file = cce::MediaFile::Open(path.toStdString());
        if (file.is_error()) return frames;
        auto reader = cce::VideoReader::Create(file.value());
        if (reader.is_error()) return frames;
        while (true) {
            auto frame = reader.value()->ReadNext();
            if (frame.is_error()) break;
            frames.push_back(frame.value().image().clone());
        }
        return frames;
    }

    static bool near(const cv::Vec3b& px, const cv::Vec3b& expected, int tolerance = 40) {
        for (int c = 0; c < 3; ++c) {
            if (std::abs(int(px[c]) - int(expected[c])) > tolerance) return false;
        }
        return true;
    }

    static cv::Vec3b center(const cv::Mat& frame) {
        return frame.at<cv::Vec3b>(frame.rows / 2, frame.cols / 2);
    }

    static void writeMarker(const QString& path) {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("previous render");
    }

    static QByteArray contents(const QString& path) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) return QByteArray();
        return file.readAll();
    }

    const cv::Vec3b BLUE{255, 0, 0};
    const cv::Vec3b RED{0, 0, 255};

private slots:
    void initTestCase() {
        QLoggingCategory::setFilterRules("cce.*.debug=false");
        QVERIFY(m_dir.isValid());
        m_foreground = m_dir.filePath("foreground.mkv");
        m_background = m_dir.filePath("background.mkv");

        // Foreground: red subject on green backdrop, 2 s
        auto fg_ok = writeClip(m_foreground, 20, [](int) {
            cv::Mat frame(HEIGHT, WIDTH, CV_8UC3, cv::Scalar(0, 255, 0));
            cv::rectangle(frame, cv::Rect(WIDTH / 4, HEIGHT / 4, WIDTH / 2, HEIGHT / 2),
                          cv::Scalar(0, 0, 255), cv::FILLED);
            return frame;
        }, 440.0);
        // Background: solid blue, 3 s
        auto bg_ok = fg_ok && writeClip(m_background, 30, [](int) {
            return cv::Mat(HEIGHT, WIDTH, CV_8UC3, cv::Scalar(255, 0, 0));
        }, 220.0);
        m_ready = fg_ok && bg_ok;
    }

    void init() {
        if (!m_ready) {
            QSKIP(qPrintable("Could not synthesize test clips: " + m_setupError));
        }
    }

    void test_window_composites_only_inside() {
        // Window [0.5, 1.5) over a 3 s background and 2 s foreground
        const QString output = m_dir.filePath("window.mp4");
        auto spec = baseSpec(output);
        spec.start_time = 0.5;
        spec.end_time = 1.5;
        spec.audio_mode = cce::AudioMode::TimedForeground;

        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY2(result.is_ok(), result.is_ok() ? "" : result.error().message.c_str());

        const cce::JobResult& job = result.value();
        QCOMPARE(job.frames_written, int64_t(30));
        QCOMPARE(job.frames_composited, int64_t(10));
        QCOMPARE(job.width, WIDTH);
        QCOMPARE(job.height, HEIGHT);
        QCOMPARE(job.backend, cce::BackendKind::Cpu);
        QVERIFY(QFile::exists(output));
        QVERIFY(!QFile::exists(output + ".video.mkv"));

        auto frames = decodeAll(output);
        QCOMPARE(frames.size(), size_t(30));
        QVERIFY(near(center(frames[0]), BLUE));
        QVERIFY(near(center(frames[4]), BLUE));
        QVERIFY(near(center(frames[5]), RED));
        QVERIFY(near(center(frames[14]), RED));
        QVERIFY(near(center(frames[15]), BLUE));
        QVERIFY(near(center(frames[29]), BLUE));
        // Backdrop pixels of the foreground show the background
        QVERIFY(near(frames[10].at<cv::Vec3b>(2, 2), BLUE));
    }

    void test_output_length_follows_background() {
        const QString output = m_dir.filePath("length.mp4");
        auto spec = baseSpec(output);
        spec.start_time = 0.5;

        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_ok());
        QCOMPARE(result.value().frames_written, int64_t(30));
        QCOMPARE(result.value().duration_us, cce::TimeUS(3000000));
        // Foreground runs out after 2 s of the window
        QCOMPARE(result.value().frames_composited, int64_t(20));

        auto media = cce::MediaFile::Open(output.toStdString());
        QVERIFY(media.is_ok());
        QVERIFY(media.value()->info().has_video);
        QVERIFY(media.value()->info().has_audio);
        QVERIFY(std::abs(cce::us_to_seconds(media.value()->info().duration_us) - 3.0) < 0.2);

        auto audio = cce::DecodeAudioTrack(media.value(),
                                           cce::AudioFormat{cce::SampleFormat::F32, 48000, 2});
        QVERIFY(audio.is_ok());
        QVERIFY(std::abs(cce::us_to_seconds(audio.value().duration_us()) - 3.0) < 0.1);
    }

    void test_audio_none_writes_silent_track() {
        const QString output = m_dir.filePath("silent.mp4");
        auto spec = baseSpec(output);
        spec.audio_mode = cce::AudioMode::None;

        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_ok());

        auto media = cce::MediaFile::Open(output.toStdString());
        QVERIFY(media.is_ok());
        QVERIFY(media.value()->info().has_video);
        QVERIFY(media.value()->info().has_audio);

        auto audio = cce::DecodeAudioTrack(media.value(),
                                           cce::AudioFormat{cce::SampleFormat::F32, 48000, 2});
        QVERIFY(audio.is_ok());
        float peak = 0.0f;
        for (float v : audio.value().samples()) {
            peak = std::max(peak, std::fabs(v));
        }
        QVERIFY(peak < 0.01f);
    }

    void test_zero_opacity_outputs_background() {
        const QString output = m_dir.filePath("transparent.mp4");
        auto spec = baseSpec(output);
        spec.opacity = 0.0;

        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_ok());
        QCOMPARE(result.value().frames_composited, int64_t(0));

        auto frames = decodeAll(output);
        QVERIFY(!frames.empty());
        QVERIFY(near(center(frames[5]), BLUE));
    }

    void test_progress_is_monotonic_and_completes() {
        const QString output = m_dir.filePath("progress.mp4");
        std::vector<int> seen;
        cce::EngineConfig config;
        config.progress_interval_frames = 5;
        cce::PipelineDriver driver(config);

        auto result = driver.Run(params(baseSpec(output)), [&seen](const cce::JobProgress& p) {
            seen.push_back(p.percent);
            return true;
        });
        QVERIFY(result.is_ok());
        QVERIFY(seen.size() >= 6);
        QCOMPARE(seen.front(), 0);
        QCOMPARE(seen.back(), 100);
        for (size_t i = 1; i < seen.size(); ++i) {
            QVERIFY(seen[i] >= seen[i - 1]);
        }
    }

    void test_cancel_from_callback_removes_output() {
        const QString output = m_dir.filePath("cancelled.mp4");
        cce::PipelineDriver driver;
        auto result = driver.Run(params(baseSpec(output)), [](const cce::JobProgress& p) {
            return p.percent < 10;
        });
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::Cancelled);
        QVERIFY(!QFile::exists(output));
        QVERIFY(!QFile::exists(output + ".video.mkv"));
    }

    void test_cancel_token_before_start() {
        const QString output = m_dir.filePath("token.mp4");
        cce::CancellationToken token;
        token.cancel();

        cce::PipelineDriver driver;
        auto result = driver.Run(params(baseSpec(output)), cce::ProgressCallback(), &token);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::Cancelled);
        QVERIFY(!QFile::exists(output));
    }

    void test_deterministic_output() {
        const QString first = m_dir.filePath("determinism_a.mp4");
        const QString second = m_dir.filePath("determinism_b.mp4");
        auto spec_a = baseSpec(first);
        spec_a.start_time = 0.3;
        spec_a.scale = 0.75;
        spec_a.position_x = 5;
        auto spec_b = spec_a;
        spec_b.output_path = second.toStdString();

        cce::PipelineDriver driver;
        QVERIFY(driver.Run(params(spec_a)).is_ok());
        QVERIFY(driver.Run(params(spec_b)).is_ok());

        auto frames_a = decodeAll(first);
        auto frames_b = decodeAll(second);
        QCOMPARE(frames_a.size(), frames_b.size());
        for (size_t i = 0; i < frames_a.size(); ++i) {
            QCOMPARE(cv::norm(frames_a[i], frames_b[i], cv::NORM_INF), 0.0);
        }
    }

    void test_missing_input() {
        auto spec = baseSpec(m_dir.filePath("missing.mp4"));
        spec.foreground_path = m_dir.filePath("does_not_exist.mp4").toStdString();

        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::FileNotFound);
        QVERIFY(cce::is_pre_processing_error(result.error().code));
    }

    void test_missing_output_directory() {
        auto spec = baseSpec(m_dir.filePath("no/such/dir/out.mp4"));
        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::InvalidParameter);
        QCOMPARE(result.error().field, std::string("output_path"));
    }

    void test_missing_logo() {
        auto spec = baseSpec(m_dir.filePath("logo.mp4"));
        cce::LogoSpec logo;
        logo.path = m_dir.filePath("no_logo.png").toStdString();
        spec.logo = logo;

        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::FileNotFound);
    }

    void test_failed_open_keeps_existing_output() {
        const QString output = m_dir.filePath("existing.mp4");
        writeMarker(output);
        auto spec = baseSpec(output);
        spec.foreground_path = m_dir.filePath("does_not_exist.mp4").toStdString();

        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::FileNotFound);
        QCOMPARE(contents(output), QByteArray("previous render"));
    }

    void test_cancel_before_start_keeps_existing_output() {
        const QString output = m_dir.filePath("existing_cancelled.mp4");
        writeMarker(output);
        cce::CancellationToken token;
        token.cancel();

        cce::PipelineDriver driver;
        auto result = driver.Run(params(baseSpec(output)), cce::ProgressCallback(), &token);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::Cancelled);
        QCOMPARE(contents(output), QByteArray("previous render"));
    }

    void test_output_aliasing_input_is_rejected() {
        auto spec = baseSpec(m_dir.path() + "/./foreground.mkv");
        spec.background_path = m_dir.filePath("missing_background.mkv").toStdString();

        auto result = cce::JobParameters::Create(spec);
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::InvalidParameter);
        QCOMPARE(result.error().field, std::string("output_path"));
        QVERIFY(QFile::exists(m_foreground));
    }

    void test_oversized_scale_rejected_before_processing() {
        const QString output = m_dir.filePath("huge.mp4");
        writeMarker(output);
        auto spec = baseSpec(output);
        spec.scale = 1e9;

        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::InvalidParameter);
        QCOMPARE(result.error().field, std::string("scale"));
        QVERIFY(cce::is_pre_processing_error(result.error().code));
        QCOMPARE(contents(output), QByteArray("previous render"));
        QVERIFY(!QFile::exists(output + ".video.mkv"));
    }

    void test_write_failure_reports_frame_and_removes_partial_output() {
        if (!QFile::exists("/dev/full")) {
            QSKIP("No /dev/full on this system");
        }
        // Noise does not compress, so the first cluster overflows the write buffer
        const QString background = m_dir.filePath("noise.mkv");
        cv::RNG rng(7);
        QVERIFY2(writeClip(background, 120, [&rng](int) {
            cv::Mat frame(HEIGHT, WIDTH, CV_8UC3);
            rng.fill(frame, cv::RNG::UNIFORM, 0, 256);
            return frame;
        }, 330.0), qPrintable(m_setupError));

        const QString output = m_dir.filePath("full_disk.mp4");
        const QString intermediate = output + ".video.mkv";
        QVERIFY(QFile::link("/dev/full", intermediate));

        auto spec = baseSpec(output);
        spec.background_path = background.toStdString();
        cce::PipelineDriver driver;
        auto result = driver.Run(params(spec));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, cce::ErrorCode::EncodeFailure);
        QVERIFY(result.error().frame_index > 0);
        QVERIFY(result.error().frame_index < 120);
        QVERIFY(!cce::is_pre_processing_error(result.error().code));
        QVERIFY(!QFile::exists(output));
        QVERIFY(!QFileInfo(intermediate).isSymLink());
        QVERIFY(!QFile::exists(intermediate));
    }

    void test_cursor_keys_only_the_covering_frame() {
        auto file = cce::MediaFile::Open(m_foreground.toStdString());
        QVERIFY(file.is_ok());
        auto reader = cce::VideoReader::Create(file.value());
        QVERIFY(reader.is_ok());
        CountingBackend backend;
        cce::ForegroundCursor cursor(reader.value(), backend);
        QCOMPARE(cursor.current_pts_us(), cce::TimeUS(-1));

        // 4 fps sampling of a 10 fps foreground passes 18 frames in 8 steps
        for (int step = 0; step < 8; ++step) {
            auto covered = cursor.advance(step * 250000);
            QVERIFY(covered.is_ok());
            QVERIFY(covered.value());
        }
        QCOMPARE(backend.keyed, 8);
        QCOMPARE(cursor.current_pts_us(), cce::TimeUS(1700000));

        // Repeating an offset reuses the keyed frame
        QVERIFY(cursor.advance(1750000).is_ok());
        QCOMPARE(backend.keyed, 8);

        // Past the last frame nothing is keyed and nothing covers
        auto after = cursor.advance(2500000);
        QVERIFY(after.is_ok());
        QVERIFY(!after.value());
        QCOMPARE(backend.keyed, 9);
        QCOMPARE(cursor.current_pts_us(), cce::TimeUS(1900000));
    }
};

QTEST_MAIN(TestPipelineDriver)
#include "test_pipeline_driver.moc"

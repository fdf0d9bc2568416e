#include <chroma_composite_engine/cce_pipeline_driver.h>
#include <chroma_composite_engine/cce_audio.h>
#include <chroma_composite_engine/cce_audio_mixer.h>
#include <chroma_composite_engine/cce_foreground_cursor.h>
#include <chroma_composite_engine/cce_logo_overlay.h>
#include <chroma_composite_engine/cce_media_file.h>
#include <chroma_composite_engine/cce_muxer.h>
#include <chroma_composite_engine/cce_video_encoder.h>
#include <chroma_composite_engine/cce_video_reader.h>
#include "cce_logging.h"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <algorithm>
#include <new>

namespace cce {

namespace {

// Percent ranges of the job phases
constexpr int PROGRESS_OPENED = 5;
constexpr int PROGRESS_LOOP_BEGIN = 10;
constexpr int PROGRESS_LOOP_END = 90;
constexpr int PROGRESS_MUX = 95;

bool mode_uses_foreground(AudioMode mode) {
    return mode == AudioMode::Synced || mode == AudioMode::ForegroundOnly ||
           mode == AudioMode::Both || mode == AudioMode::TimedForeground;
}

bool mode_uses_background(AudioMode mode) {
    return mode == AudioMode::Synced || mode == AudioMode::BackgroundOnly ||
           mode == AudioMode::Both || mode == AudioMode::TimedForeground;
}

// State of one run. Removes the files it started writing unless the run
// completes; files present before the run are left alone.
class JobRun {
public:
    JobRun(const JobParameters& params, const EngineConfig& config,
           const ProgressCallback& progress, const CancellationToken* cancel)
        : m_params(params), m_config(config), m_reporter(progress, cancel),
          m_intermediate_path(params.output_path() + config.intermediate_suffix) {}

    ~JobRun() {
        release_media();
        if (m_intermediate_started) {
            remove_file(m_intermediate_path);
        }
        if (m_output_started && !m_completed) {
            remove_file(m_params.output_path());
        }
    }

    JobRun(const JobRun&) = delete;
    JobRun& operator=(const JobRun&) = delete;

    Result<JobResult> execute();

    int64_t current_frame() const { return m_current_frame; }

private:
    Result<void> open_inputs();
    Result<void> composite_frames();
    Result<void> produce_audio_and_mux();
    Result<AudioTrack> decode_track(const std::string& path, const char* role) const;
    Error cancelled() const;
    void release_media();
    static void remove_file(const std::string& path);

    const JobParameters& m_params;
    const EngineConfig& m_config;
    ProgressReporter m_reporter;
    std::string m_intermediate_path;

    std::shared_ptr<VideoReader> m_fg_reader;
    std::shared_ptr<VideoReader> m_bg_reader;
    std::optional<LogoOverlayStage> m_logo;
    std::unique_ptr<ComputeBackend> m_backend;
    std::unique_ptr<VideoEncoder> m_encoder;

    int m_width = 0;
    int m_height = 0;
    Rate m_rate{0, 1};
    int64_t m_estimated_frames = 1;
    int64_t m_current_frame = -1;
    int64_t m_frames_written = 0;
    int64_t m_frames_composited = 0;
    bool m_intermediate_started = false;
    bool m_output_started = false;
    bool m_completed = false;
};

void JobRun::remove_file(const std::string& path) {
    QString qpath = QString::fromStdString(path);
    if (QFile::exists(qpath) && !QFile::remove(qpath)) {
        qCWarning(cceDriver, "Could not remove %s", path.c_str());
    }
}

void JobRun::release_media() {
    m_encoder.reset();
    m_fg_reader.reset();
    m_bg_reader.reset();
}

Error JobRun::cancelled() const {
    qCInfo(cceDriver, "Job cancelled at frame %lld", static_cast<long long>(m_current_frame));
    Error err = Error::cancelled();
    err.frame_index = m_current_frame;
    return err;
}

Result<void> JobRun::open_inputs() {
    QFileInfo output_info(QString::fromStdString(m_params.output_path()));
    if (!output_info.absoluteDir().exists()) {
        return Error::invalid_parameter("output_path", "directory does not exist");
    }

    auto fg_file = MediaFile::Open(m_params.foreground_path());
    if (fg_file.is_error()) {
        return fg_file.error();
    }
    auto bg_file = MediaFile::Open(m_params.background_path());
    if (bg_file.is_error()) {
        return bg_file.error();
    }

    auto fg_reader = VideoReader::Create(fg_file.value());
    if (fg_reader.is_error()) {
        return fg_reader.error();
    }
    auto bg_reader = VideoReader::Create(bg_file.value());
    if (bg_reader.is_error()) {
        return bg_reader.error();
    }
    m_fg_reader = fg_reader.value();
    m_bg_reader = bg_reader.value();

    const MediaInfo& fg_info = fg_file.value()->info();
    auto scaled = scale_size(cv::Size(fg_info.video_width, fg_info.video_height), m_params.scale(), "scale");
    if (scaled.is_error()) {
        return scaled.error();
    }

    const MediaInfo& bg_info = bg_file.value()->info();
    m_width = bg_info.video_width;
    m_height = bg_info.video_height;
    m_rate = bg_info.video_rate();
    if (m_width <= 0 || m_height <= 0 || !m_rate.is_valid()) {
        return Error::unsupported_media("Background video has no usable geometry or frame rate");
    }
    if (bg_info.is_vfr) {
        qCWarning(cceDriver, "Background looks variable-rate; output uses %d/%d fps",
                  m_rate.num, m_rate.den);
    }
    m_estimated_frames = std::max<int64_t>(
        1, (bg_info.duration_us * m_rate.num + (US_PER_SECOND * m_rate.den) / 2) /
               (US_PER_SECOND * m_rate.den));

    if (m_params.logo()) {
        auto logo = LogoOverlayStage::Create(*m_params.logo(), cv::Size(m_width, m_height));
        if (logo.is_error()) {
            return logo.error();
        }
        m_logo.emplace(std::move(logo.value()));
    }
    return Result<void>();
}

Result<void> JobRun::composite_frames() {
    m_backend = select_compute_backend(KeyingConfig::FromJob(m_params), m_params.gpu_accel());

    VideoEncoderConfig encoder_config;
    encoder_config.width = m_width;
    encoder_config.height = m_height;
    encoder_config.rate = m_rate;
    encoder_config.fast = m_params.fast_mode();
    encoder_config.crf = m_config.video_crf;
    encoder_config.format_name = "matroska";
    m_intermediate_started = true;
    auto encoder = VideoEncoder::Create(m_intermediate_path, encoder_config);
    if (encoder.is_error()) {
        return encoder.error();
    }
    m_encoder = std::move(encoder.value());

    const TimingGate gate = m_params.timing_gate();
    const int interval = std::max(1, m_config.progress_interval_frames);
    ForegroundCursor cursor(m_fg_reader, *m_backend);

    while (true) {
        if (m_reporter.cancel_requested()) {
            return cancelled();
        }

        auto background = m_bg_reader->ReadNext();
        if (background.is_error()) {
            if (background.error().code == ErrorCode::EOFReached) {
                break;
            }
            return background.error();
        }
        m_current_frame = m_frames_written;
        cv::Mat& image = background.value().image();

        // Output timing follows the background frame grid
        const TimeUS t_us = FrameTime::from_frame(m_frames_written, m_rate).to_us();
        const GateState state = gate.evaluate(t_us);
        if (state == GateState::Active) {
            auto covered = cursor.advance(t_us - gate.start_us());
            if (covered.is_error()) {
                return covered.error().at_frame(m_current_frame);
            }
            if (covered.value() && m_params.opacity() > 0.0) {
                m_backend->composite(image, state);
                ++m_frames_composited;
            }
        }

        if (m_logo) {
            m_logo->apply(image, t_us);
        }

        auto written = m_encoder->WriteFrame(image);
        if (written.is_error()) {
            return written.error();
        }
        ++m_frames_written;

        if (m_frames_written % interval == 0) {
            const int64_t total = std::max(m_estimated_frames, m_frames_written);
            const int percent = PROGRESS_LOOP_BEGIN + static_cast<int>(
                (m_frames_written * (PROGRESS_LOOP_END - PROGRESS_LOOP_BEGIN)) / total);
            std::string status = "Compositing frame " + std::to_string(m_frames_written) + "/" +
                                 std::to_string(total);
            if (!m_reporter.report(std::min(percent, PROGRESS_LOOP_END), status)) {
                return cancelled();
            }
        }
    }

    if (m_frames_written == 0) {
        return Error::decode_failure("Background video produced no frames", 0);
    }

    m_current_frame = -1;
    auto finished = m_encoder->Finish();
    cursor.release();
    m_encoder.reset();
    m_fg_reader.reset();
    m_bg_reader.reset();
    return finished;
}

Result<AudioTrack> JobRun::decode_track(const std::string& path, const char* role) const {
    AudioFormat format{SampleFormat::F32, m_config.audio_sample_rate, m_config.audio_channels};

    // Fresh handle: the video readers consumed the demuxer of the first one
    auto file = MediaFile::Open(path);
    if (file.is_error()) {
        return file.error();
    }
    auto track = DecodeAudioTrack(file.value(), format);
    if (track.is_error()) {
        return track.error();
    }
    if (track.value().empty()) {
        qCWarning(cceAudio, "%s has no audio; using silence", role);
    }
    return track;
}

Result<void> JobRun::produce_audio_and_mux() {
    if (!m_reporter.report(PROGRESS_LOOP_END, "Mixing audio")) {
        return cancelled();
    }

    const AudioMode mode = m_params.audio_mode();
    AudioTrack foreground_audio;
    AudioTrack background_audio;
    if (mode_uses_foreground(mode)) {
        auto track = decode_track(m_params.foreground_path(), "Foreground");
        if (track.is_error()) {
            return track.error();
        }
        foreground_audio = std::move(track.value());
    }
    if (mode_uses_background(mode)) {
        auto track = decode_track(m_params.background_path(), "Background");
        if (track.is_error()) {
            return track.error();
        }
        background_audio = std::move(track.value());
    }
    if (m_reporter.cancel_requested()) {
        return cancelled();
    }

    AudioMixRequest request;
    request.mode = mode;
    request.duration_us = FrameTime::from_frame(m_frames_written, m_rate).to_us();
    request.window_start_us = m_params.start_us();
    request.window_end_us = m_params.end_us();
    request.sample_rate = m_config.audio_sample_rate;
    request.channels = m_config.audio_channels;
    auto mixed = mix_audio(foreground_audio, background_audio, request);
    if (mixed.is_error()) {
        return mixed.error();
    }
    foreground_audio = AudioTrack();
    background_audio = AudioTrack();

    if (!m_reporter.report(PROGRESS_MUX, "Muxing output")) {
        return cancelled();
    }

    MuxConfig mux_config;
    mux_config.audio_bit_rate = m_config.audio_bit_rate;
    m_output_started = true;
    return MuxVideoWithAudio(m_intermediate_path, mixed.value(), m_params.output_path(), mux_config);
}

Result<JobResult> JobRun::execute() {
    QElapsedTimer timer;
    timer.start();

    qCInfo(cceDriver, "Compositing %s over %s -> %s",
           m_params.foreground_path().c_str(), m_params.background_path().c_str(),
           m_params.output_path().c_str());

    m_reporter.report(0, "Opening inputs");
    auto opened = open_inputs();
    if (opened.is_error()) {
        return opened.error();
    }
    if (!m_reporter.report(PROGRESS_OPENED, "Inputs opened")) {
        return cancelled();
    }

    auto composited = composite_frames();
    if (composited.is_error()) {
        return composited.error();
    }

    auto muxed = produce_audio_and_mux();
    if (muxed.is_error()) {
        return muxed.error();
    }

    m_completed = true;
    m_reporter.report(100, "Completed");

    JobResult result;
    result.output_path = m_params.output_path();
    result.duration_us = FrameTime::from_frame(m_frames_written, m_rate).to_us();
    result.frames_written = m_frames_written;
    result.frames_composited = m_frames_composited;
    result.width = m_width & ~1;
    result.height = m_height & ~1;
    result.rate = m_rate;
    result.backend = m_backend ? m_backend->kind() : BackendKind::Cpu;
    result.elapsed_seconds = static_cast<double>(timer.elapsed()) / 1000.0;

    qCInfo(cceDriver, "Wrote %s: %lld frames (%lld composited), %.2f s, %s backend, %.1f s elapsed",
           result.output_path.c_str(), static_cast<long long>(result.frames_written),
           static_cast<long long>(result.frames_composited), us_to_seconds(result.duration_us),
           backend_kind_to_string(result.backend), result.elapsed_seconds);
    return result;
}

} // namespace

PipelineDriver::PipelineDriver(EngineConfig config)
    : m_config(std::move(config)) {
}

Result<JobResult> PipelineDriver::Run(const JobParameters& params,
                                      const ProgressCallback& progress,
                                      const CancellationToken* cancel) const {
    JobRun run(params, m_config, progress, cancel);
    Result<JobResult> result = Error::internal("Job did not run");
    try {
        result = run.execute();
    } catch (const std::bad_alloc&) {
        result = Error::resource_exhausted("Out of memory", run.current_frame());
    } catch (const cv::Exception& e) {
        result = Error::internal(std::string("OpenCV: ") + e.what(), run.current_frame());
    }

    if (result.is_error()) {
        const Error& err = result.error();
        if (err.code != ErrorCode::Cancelled) {
            qCWarning(cceDriver, "Job failed (%s) at frame %lld: %s",
                      error_code_to_string(err.code), static_cast<long long>(err.frame_index),
                      err.message.c_str());
        }
    }
    return result;
}

} // namespace cce

#include "job_config.h"

#include <chroma_composite_engine/cce_media_file.h>
#include <chroma_composite_engine/cce_pipeline_driver.h>

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QLoggingCategory>

#include <csignal>
#include <cstdio>

Q_LOGGING_CATEGORY(cceCli, "cce.cli")

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RUN = 1;
constexpr int EXIT_BAD_INPUT = 2;
constexpr int EXIT_CANCELLED = 130;

cce::CancellationToken g_cancel;

void on_interrupt(int) {
    g_cancel.cancel();
}

int exit_code_for(const cce::Error& error) {
    if (error.code == cce::ErrorCode::Cancelled) {
        return EXIT_CANCELLED;
    }
    return cce::is_pre_processing_error(error.code) ? EXIT_BAD_INPUT : EXIT_FAILURE_RUN;
}

void print_error(const cce::Error& error) {
    if (error.frame_index >= 0) {
        std::fprintf(stderr, "error: %s: %s (frame %lld)\n",
                     cce::error_code_to_string(error.code), error.message.c_str(),
                     static_cast<long long>(error.frame_index));
    } else {
        std::fprintf(stderr, "error: %s: %s\n",
                     cce::error_code_to_string(error.code), error.message.c_str());
    }
}

int probe(const QString& path) {
    auto media = cce::MediaFile::Open(path.toStdString());
    if (media.is_error()) {
        print_error(media.error());
        return exit_code_for(media.error());
    }
    QJsonDocument doc(cce::cli::media_info_to_json(media.value()->info()));
    std::printf("%s", doc.toJson(QJsonDocument::Indented).constData());
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("cce_compose");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Chroma-key a foreground video over a background video.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({"probe", "Print stream information for a media file as JSON and exit.", "path"});
    parser.addOption({"verbose", "Log per-stage debug output, including FFmpeg's own."});
    cce::cli::add_job_options(parser);
    parser.process(app);

    const bool verbose = parser.isSet("verbose");
    QLoggingCategory::setFilterRules(verbose ? "cce.*=true" : "cce.*.debug=false\ncce.*.info=true");
    cce::set_media_log_verbose(verbose);

    if (parser.isSet("probe")) {
        return probe(parser.value("probe"));
    }

    cce::JobSpec spec;
    if (parser.isSet("job")) {
        auto loaded = cce::cli::load_job_file(parser.value("job"), spec);
        if (loaded.is_error()) {
            print_error(loaded.error());
            return EXIT_BAD_INPUT;
        }
    }
    auto applied = cce::cli::apply_command_line(parser, spec);
    if (applied.is_error()) {
        print_error(applied.error());
        return EXIT_BAD_INPUT;
    }

    auto params = cce::JobParameters::Create(spec);
    if (params.is_error()) {
        print_error(params.error());
        return EXIT_BAD_INPUT;
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    cce::PipelineDriver driver;
    auto progress = [](const cce::JobProgress& p) {
        std::printf("[%3d%%] %s\n", p.percent, p.status.c_str());
        std::fflush(stdout);
        return true;
    };

    qCInfo(cceCli, "Key %s, audio %s, %s mode%s",
           cce::key_preset_to_string(spec.key_color.preset),
           cce::audio_mode_to_string(spec.audio_mode),
           spec.fast_mode ? "fast" : "quality", spec.gpu_accel ? ", GPU requested" : "");

    auto result = driver.Run(params.value(), progress, &g_cancel);
    if (result.is_error()) {
        if (result.error().code == cce::ErrorCode::Cancelled) {
            std::fprintf(stderr, "cancelled\n");
        } else {
            print_error(result.error());
        }
        return exit_code_for(result.error());
    }

    QJsonDocument doc(cce::cli::job_result_to_json(result.value()));
    std::printf("%s", doc.toJson(QJsonDocument::Indented).constData());
    return EXIT_OK;
}

#pragma once

#include <chroma_composite_engine/cce_errors.h>
#include <chroma_composite_engine/cce_job_parameters.h>
#include <chroma_composite_engine/cce_media_file.h>
#include <chroma_composite_engine/cce_pipeline_driver.h>

#include <QByteArray>
#include <QCommandLineParser>
#include <QJsonObject>
#include <QString>

namespace cce {
namespace cli {

// Register every job option on the parser
void add_job_options(QCommandLineParser& parser);

// Merge a JSON job description into spec.
// Unknown keys and mistyped values are InvalidParameter naming the key.
Result<void> apply_job_json(const QByteArray& json, JobSpec& spec);

// Read path and merge it into spec
Result<void> load_job_file(const QString& path, JobSpec& spec);

// Apply options given on the command line on top of spec
Result<void> apply_command_line(const QCommandLineParser& parser, JobSpec& spec);

// "h,s,v" -> triplet
Result<HsvTriplet> parse_hsv_triplet(const QString& text, const std::string& field);

QJsonObject media_info_to_json(const MediaInfo& info);
QJsonObject job_result_to_json(const JobResult& result);

} // namespace cli
} // namespace cce

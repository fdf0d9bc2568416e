#pragma once

#include "cce_errors.h"
#include "cce_time.h"
#include <memory>
#include <string>

namespace cce {

// Forward declaration for implementation
class MediaFileImpl;

// Information about an opened media file
struct MediaInfo {
    // Duration in microseconds (0 if the container does not say)
    TimeUS duration_us = 0;

    // Video stream info
    bool has_video = false;
    int video_width = 0;
    int video_height = 0;

    // Nominal frame rate after canonical snapping
    int32_t video_fps_num = 0;
    int32_t video_fps_den = 1;

    // True if file appears to be VFR (variable frame rate)
    // Conservative: may be true even for CFR files
    bool is_vfr = false;

    // Codec name of the video stream (e.g. "h264")
    std::string video_codec;

    // Audio stream info
    bool has_audio = false;
    int32_t audio_sample_rate = 0;
    int32_t audio_channels = 0;

    // Original file path
    std::string path;

    Rate video_rate() const {
        return Rate{video_fps_num, video_fps_den};
    }
};

// Media file handle (opened container).
// Each handle owns its own demuxer position: open one handle per consumer.
class MediaFile {
public:
    ~MediaFile();

    // Open a media file and probe its streams
    // Returns FileNotFound or UnsupportedMedia on failure
    static Result<std::shared_ptr<MediaFile>> Open(const std::string& path);

    const MediaInfo& info() const;

    // Internal: Constructor is public but MediaFileImpl is opaque
    explicit MediaFile(std::unique_ptr<MediaFileImpl> impl, MediaInfo info);

    // Internal: Access impl for readers
    MediaFileImpl* impl_ptr() const { return m_impl.get(); }

private:
    std::unique_ptr<MediaFileImpl> m_impl;
    MediaInfo m_info;
};

// Let FFmpeg's own diagnostics through to stderr (fatal only by default)
void set_media_log_verbose(bool verbose);

} // namespace cce

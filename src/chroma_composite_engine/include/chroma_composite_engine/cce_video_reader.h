#pragma once

#include "cce_errors.h"
#include "cce_frame.h"
#include "cce_media_file.h"
#include <memory>

namespace cce {

// Forward declaration for implementation
class VideoReaderImpl;

// Sequential video decoder producing BGR24 frames in presentation order
class VideoReader {
public:
    ~VideoReader();

    // Create a reader for the video stream of a media file
    // Returns UnsupportedMedia if there is no video stream or no decoder
    static Result<std::shared_ptr<VideoReader>> Create(std::shared_ptr<MediaFile> media_file);

    // Decode the next frame.
    // Timestamps are relative to the first decoded frame.
    // Returns EOFReached after the last frame, DecodeFailure on corrupt data.
    Result<Frame> ReadNext();

    // Number of frames returned so far
    int64_t frames_read() const;

    std::shared_ptr<MediaFile> media_file() const;

    // Internal: Constructor is public but VideoReaderImpl is opaque
    explicit VideoReader(std::unique_ptr<VideoReaderImpl> impl, std::shared_ptr<MediaFile> media_file);

private:
    std::unique_ptr<VideoReaderImpl> m_impl;
    std::shared_ptr<MediaFile> m_media_file;
};

} // namespace cce

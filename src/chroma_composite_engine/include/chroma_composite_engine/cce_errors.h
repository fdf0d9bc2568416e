#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace cce {

// CCE-owned error codes (no FFmpeg or OpenCV codes escape)
enum class ErrorCode {
    Ok,
    InvalidParameter,
    UnsupportedMedia,
    FileNotFound,
    ResourceExhausted,
    DecodeFailure,
    EncodeFailure,
    Cancelled,
    EOFReached,
    Internal
};

// Convert error code to string (for logs and the CLI)
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                return "Ok";
        case ErrorCode::InvalidParameter:  return "InvalidParameter";
        case ErrorCode::UnsupportedMedia:  return "UnsupportedMedia";
        case ErrorCode::FileNotFound:      return "FileNotFound";
        case ErrorCode::ResourceExhausted: return "ResourceExhausted";
        case ErrorCode::DecodeFailure:     return "DecodeFailure";
        case ErrorCode::EncodeFailure:     return "EncodeFailure";
        case ErrorCode::Cancelled:         return "Cancelled";
        case ErrorCode::EOFReached:        return "EOFReached";
        case ErrorCode::Internal:          return "Internal";
    }
    return "Unknown";
}

// Errors detected before the first frame is processed
inline bool is_pre_processing_error(ErrorCode code) {
    return code == ErrorCode::InvalidParameter ||
           code == ErrorCode::UnsupportedMedia ||
           code == ErrorCode::FileNotFound;
}

// Error with context message.
// field is set for InvalidParameter, frame_index for DecodeFailure/EncodeFailure.
struct Error {
    ErrorCode code;
    std::string message;
    std::string field;
    int64_t frame_index = -1;

    static Error ok() { return {ErrorCode::Ok, "", "", -1}; }
    static Error invalid_parameter(const std::string& field_name, const std::string& detail) {
        return {ErrorCode::InvalidParameter, field_name + ": " + detail, field_name, -1};
    }
    static Error unsupported_media(const std::string& detail) {
        return {ErrorCode::UnsupportedMedia, detail, "", -1};
    }
    static Error file_not_found(const std::string& path) {
        return {ErrorCode::FileNotFound, "File not found: " + path, "", -1};
    }
    static Error resource_exhausted(const std::string& detail, int64_t frame = -1) {
        return {ErrorCode::ResourceExhausted, detail, "", frame};
    }
    static Error decode_failure(const std::string& detail, int64_t frame = -1) {
        return {ErrorCode::DecodeFailure, detail, "", frame};
    }
    static Error encode_failure(const std::string& detail, int64_t frame = -1) {
        return {ErrorCode::EncodeFailure, detail, "", frame};
    }
    static Error cancelled() {
        return {ErrorCode::Cancelled, "Job cancelled", "", -1};
    }
    static Error eof() {
        return {ErrorCode::EOFReached, "End of file reached", "", -1};
    }
    static Error internal(const std::string& detail, int64_t frame = -1) {
        return {ErrorCode::Internal, detail, "", frame};
    }

    // Same error, tagged with the frame being processed when it happened
    Error at_frame(int64_t frame) const {
        Error e = *this;
        e.frame_index = frame;
        return e;
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : m_data(std::move(value)) {}

    // Error constructor
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    // Access value (throws std::bad_variant_access if error)
    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    // Access error (throws std::bad_variant_access if ok)
    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (for tests and tooling)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message);
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace cce

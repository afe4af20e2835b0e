#pragma once

#include <QString>

#include <optional>
#include <utility>
#include <variant>

namespace JLC {

// Run-level error codes. Per-boundary problems are outcomes, not errors.
enum class ErrorCode {
    MissingVideoTrack,
    MissingAudioTrack,
    InvalidArg,
    FileNotFound,
    InvalidArchive,
    ParseFailed,
    IoFailed,
    ToolUnavailable,
    Internal
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MissingVideoTrack: return "MissingVideoTrack";
        case ErrorCode::MissingAudioTrack: return "MissingAudioTrack";
        case ErrorCode::InvalidArg:        return "InvalidArg";
        case ErrorCode::FileNotFound:      return "FileNotFound";
        case ErrorCode::InvalidArchive:    return "InvalidArchive";
        case ErrorCode::ParseFailed:       return "ParseFailed";
        case ErrorCode::IoFailed:          return "IoFailed";
        case ErrorCode::ToolUnavailable:   return "ToolUnavailable";
        case ErrorCode::Internal:          return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    QString message;

    static Error missing_video_track() {
        return {ErrorCode::MissingVideoTrack, QStringLiteral("Timeline has no video track")};
    }
    static Error missing_audio_track() {
        return {ErrorCode::MissingAudioTrack, QStringLiteral("Timeline has no audio track")};
    }
    static Error invalid_arg(const QString& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error file_not_found(const QString& path) {
        return {ErrorCode::FileNotFound, QStringLiteral("File not found: %1").arg(path)};
    }
    static Error invalid_archive(const QString& detail) {
        return {ErrorCode::InvalidArchive, detail};
    }
    static Error parse_failed(const QString& detail) {
        return {ErrorCode::ParseFailed, detail};
    }
    static Error io_failed(const QString& detail) {
        return {ErrorCode::IoFailed, detail};
    }
    static Error tool_unavailable(const QString& tool) {
        return {ErrorCode::ToolUnavailable, QStringLiteral("Required tool not found on PATH: %1").arg(tool)};
    }
    static Error internal(const QString& detail) {
        return {ErrorCode::Internal, detail};
    }

    QString describe() const {
        return QStringLiteral("%1: %2").arg(QLatin1String(error_code_to_string(code)), message);
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

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

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

} // namespace JLC

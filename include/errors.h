#pragma once

#include <string>
#include <variant>
#include <stdexcept>
#include <utility>

namespace guild_voice {

/**
 * @brief Error types for different failure modes
 *
 * The first group is the voice pipeline taxonomy surfaced to tool callers;
 * the second group is used by config loading, codecs and HTTP backends.
 */
enum class ErrorType {
    None,
    // Voice session / pipeline
    InvalidIdentifier,
    NotInVoice,
    ChannelNotAllowed,
    TransportError,
    NoActiveSession,
    RequesterNotCollocated,
    CaptureTimeout,
    EmptyTurn,
    SttFailed,
    EmptyTranscript,
    ReplyGenerationFailed,
    TtsFailed,
    NotConnected,
    NotConfigured,
    // Ambient
    IOError,
    NetworkError,
    ParseError,
    InvalidState,
    Unknown
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    explicit operator bool() const { return is_error(); }

    /// Same type, message prefixed with the failing stage ("<context>: <message>")
    Error with_context(const std::string& context) const {
        return Error(type, context + ": " + message);
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

/// Stable name for logs and tool results
inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::InvalidIdentifier: return "InvalidIdentifier";
        case ErrorType::NotInVoice: return "NotInVoice";
        case ErrorType::ChannelNotAllowed: return "ChannelNotAllowed";
        case ErrorType::TransportError: return "TransportError";
        case ErrorType::NoActiveSession: return "NoActiveSession";
        case ErrorType::RequesterNotCollocated: return "RequesterNotCollocated";
        case ErrorType::CaptureTimeout: return "CaptureTimeout";
        case ErrorType::EmptyTurn: return "EmptyTurn";
        case ErrorType::SttFailed: return "SttFailed";
        case ErrorType::EmptyTranscript: return "EmptyTranscript";
        case ErrorType::ReplyGenerationFailed: return "ReplyGenerationFailed";
        case ErrorType::TtsFailed: return "TtsFailed";
        case ErrorType::NotConnected: return "NotConnected";
        case ErrorType::NotConfigured: return "NotConfigured";
        case ErrorType::IOError: return "IOError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace guild_voice

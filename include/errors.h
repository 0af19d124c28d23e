#pragma once

#include <string>
#include <variant>
#include <stdexcept>
#include <utility>

namespace calcvox {

/**
 * @brief Failure kinds surfaced by the session engine
 */
enum class ErrorType {
    None,
    DeviceAcquisitionFailure,   ///< Microphone/speaker could not be opened
    CredentialMissing,          ///< No API key resolved
    TransportOpenFailure,       ///< Connection or handshake failed
    TransportRuntimeError,      ///< Mid-session transport failure
    DecodeFailure,              ///< Malformed inbound audio fragment
    UnrecognizedToolCall,       ///< Never fatal; acknowledged anyway
    ConfigError,
    InvalidArgument
};

inline const char* error_type_name(ErrorType type);

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

    std::string to_string() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

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

using VoidResult = Result<void>;

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_device_error(const std::string& message) {
    return Error(ErrorType::DeviceAcquisitionFailure, message);
}

inline Error make_credential_error(const std::string& message) {
    return Error(ErrorType::CredentialMissing, message);
}

inline Error make_open_error(const std::string& message) {
    return Error(ErrorType::TransportOpenFailure, message);
}

inline Error make_transport_error(const std::string& message) {
    return Error(ErrorType::TransportRuntimeError, message);
}

inline Error make_decode_error(const std::string& message) {
    return Error(ErrorType::DecodeFailure, message);
}

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::DeviceAcquisitionFailure: return "DeviceAcquisitionFailure";
        case ErrorType::CredentialMissing: return "CredentialMissing";
        case ErrorType::TransportOpenFailure: return "TransportOpenFailure";
        case ErrorType::TransportRuntimeError: return "TransportRuntimeError";
        case ErrorType::DecodeFailure: return "DecodeFailure";
        case ErrorType::UnrecognizedToolCall: return "UnrecognizedToolCall";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

} // namespace calcvox

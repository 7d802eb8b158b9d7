#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace dss {

// DSS-owned error codes (no Qt or zlib codes escape)
enum class ErrorCode {
    Ok,
    InvalidArg,
    UnknownFormat,
    Malformed,
    DecompressFailed,
    VersionMismatch,
    OutOfOrder,
    NetworkFailed,
    Internal
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:               return "Ok";
        case ErrorCode::InvalidArg:       return "InvalidArg";
        case ErrorCode::UnknownFormat:    return "UnknownFormat";
        case ErrorCode::Malformed:        return "Malformed";
        case ErrorCode::DecompressFailed: return "DecompressFailed";
        case ErrorCode::VersionMismatch:  return "VersionMismatch";
        case ErrorCode::OutOfOrder:       return "OutOfOrder";
        case ErrorCode::NetworkFailed:    return "NetworkFailed";
        case ErrorCode::Internal:         return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error ok() { return {ErrorCode::Ok, ""}; }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error unknown_format(const std::string& tag) {
        return {ErrorCode::UnknownFormat, "Unrecognized frame tag: " + tag};
    }
    static Error malformed(const std::string& detail) {
        return {ErrorCode::Malformed, detail};
    }
    static Error decompress_failed(const std::string& detail) {
        return {ErrorCode::DecompressFailed, detail};
    }
    static Error version_mismatch(int got, int expected) {
        return {ErrorCode::VersionMismatch,
                "Frame version " + std::to_string(got) +
                " (supported " + std::to_string(expected) + ")"};
    }
    static Error out_of_order(const std::string& detail) {
        return {ErrorCode::OutOfOrder, detail};
    }
    static Error network_failed(const std::string& detail) {
        return {ErrorCode::NetworkFailed, detail};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (tests and tooling only)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message);
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

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

} // namespace dss

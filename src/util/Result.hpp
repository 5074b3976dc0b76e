/**
 * @file Result.hpp
 * @brief Value-or-error return type used by every fallible operation.
 *
 * Result<T> holds either a T or an Error. Result<void> carries only the
 * error case. Errors are tagged with an ErrorCode so callers can branch on
 * the failure category without parsing messages.
 *
 * @section Patterns
 * - Expected-style return: no exceptions cross module boundaries.
 */

#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace smu {

enum class ErrorCode {
    Unknown,
    InvalidState,
    InvalidArgument,
    MandatoryAcquisitionFailed,
    OptionalAcquisitionFailed,
    EncodingUnsupported,
    RecorderFault,
    DeviceError,
    ConfigError,
    IoError,
    ParseError
};

constexpr std::string_view toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidState:
        return "InvalidState";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    case ErrorCode::MandatoryAcquisitionFailed:
        return "MandatoryAcquisitionFailed";
    case ErrorCode::OptionalAcquisitionFailed:
        return "OptionalAcquisitionFailed";
    case ErrorCode::EncodingUnsupported:
        return "EncodingUnsupported";
    case ErrorCode::RecorderFault:
        return "RecorderFault";
    case ErrorCode::DeviceError:
        return "DeviceError";
    case ErrorCode::ConfigError:
        return "ConfigError";
    case ErrorCode::IoError:
        return "IoError";
    case ErrorCode::ParseError:
        return "ParseError";
    case ErrorCode::Unknown:
        break;
    }
    return "Unknown";
}

struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Unknown};
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message,
                      ErrorCode code = ErrorCode::Unknown) {
        return Result(Error{std::move(message), code});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<T>(data_);
    }
    const T& value() const& {
        return std::get<T>(data_);
    }
    T&& value() && {
        return std::get<T>(std::move(data_));
    }

    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

    T valueOr(T fallback) const& {
        return isOk() ? value() : std::move(fallback);
    }

private:
    explicit Result(T value) : data_(std::in_place_index<0>, std::move(value)) {
    }
    explicit Result(Error error)
        : data_(std::in_place_index<1>, std::move(error)) {
    }

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message,
                      ErrorCode code = ErrorCode::Unknown) {
        return Result(Error{std::move(message), code});
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }

    bool isOk() const {
        return !hasError_;
    }
    bool isErr() const {
        return hasError_;
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : hasError_(true), error_(std::move(error)) {
    }

    bool hasError_{false};
    Error error_;
};

} // namespace smu

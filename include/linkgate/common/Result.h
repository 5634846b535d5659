#pragma once

#include <string>
#include <utility>
#include <variant>

namespace linkgate {
namespace common {

// Every failure a request can hit. The HTTP boundary maps these through a
// fixed table; the detail text goes to the log only.
enum class ErrorKind {
    kInvalidLink,
    kUnauthorized,
    kObjectNotFound,
    kMalformedRange,
    kNoSessionsAvailable,
    kBackendUnreachable,
    kBackendTimeout,
    kBackendError,
};

const char* ErrorKindName(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string detail;

    Error(ErrorKind k, std::string d = std::string())
        : kind(k), detail(std::move(d)) {}
};

template <typename T>
class Result {
public:
    Result(T value) : v_(std::move(value)) {}
    Result(Error error) : v_(std::move(error)) {}

    bool ok() const { return v_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<0>(v_); }
    T& value() { return std::get<0>(v_); }
    const Error& error() const { return std::get<1>(v_); }

private:
    std::variant<T, Error> v_;
};

// Result without a payload.
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)), ok_(false) {}

    static Status Ok() { return Status(); }

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }
    const Error& error() const { return error_; }

private:
    Error error_{ErrorKind::kBackendError};
    bool ok_{true};
};

} // namespace common
} // namespace linkgate

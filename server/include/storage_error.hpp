#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace vault::server {

enum class StorageErrc {
    kTraversal,
    kMalformed,
    kTooLong,
    kNotFound,
    kConflict,
    kInvalid,
    kIncomplete,
    kIoFailure,
};

struct StorageError {
    StorageErrc code;
    // Internal detail for the log. Never sent to clients.
    std::string detail;
};

// Stable wire status for an error code.
inline std::string_view status_name(StorageErrc code) {
    switch (code) {
        case StorageErrc::kTraversal:
            return "traversal";
        case StorageErrc::kMalformed:
            return "malformed";
        case StorageErrc::kTooLong:
            return "too_long";
        case StorageErrc::kNotFound:
            return "notfound";
        case StorageErrc::kConflict:
            return "conflict";
        case StorageErrc::kInvalid:
            return "invalid";
        case StorageErrc::kIncomplete:
            return "incomplete";
        case StorageErrc::kIoFailure:
            return "io_error";
    }
    return "error";
}

template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(StorageError error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(state_); }
    const T& value() const { return std::get<T>(state_); }
    T& operator*() { return value(); }
    const T& operator*() const { return value(); }
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const StorageError& error() const { return std::get<StorageError>(state_); }
    StorageErrc code() const { return error().code; }

private:
    std::variant<T, StorageError> state_;
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status(std::monostate{});
}

inline StorageError make_error(StorageErrc code, std::string detail = {}) {
    return StorageError{code, std::move(detail)};
}

}  // namespace vault::server

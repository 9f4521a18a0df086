#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace infstore {

enum class ErrorKind {
    Unauthorized,
    BadRequest,
    StreamReadFailure,
    TransportFailure,
    MetadataWriteFailure,
    NotFound,
    Conflict,
    Internal,
};

struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;
    double retryAfter{0.0};
};

template <typename T>
struct Result {
    std::optional<T> data;
    std::optional<Error> error;

    [[nodiscard]] bool ok() const { return data.has_value(); }
};

struct Status {
    std::optional<Error> error;

    [[nodiscard]] bool ok() const { return !error.has_value(); }
};

Error makeError(ErrorKind kind, std::string message, double retryAfter = 0.0);

template <typename T>
Result<T> success(T value) {
    Result<T> result;
    result.data = std::move(value);
    return result;
}

template <typename T>
Result<T> failure(Error error) {
    Result<T> result;
    result.error = std::move(error);
    return result;
}

inline Status okStatus() {
    return Status{};
}

inline Status failedStatus(Error error) {
    Status status;
    status.error = std::move(error);
    return status;
}

std::string_view toString(ErrorKind kind);

}  // namespace infstore

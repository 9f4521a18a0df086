#include "infstore/result.h"

namespace infstore {

Error makeError(ErrorKind kind, std::string message, double retryAfter) {
    Error error;
    error.kind = kind;
    error.message = std::move(message);
    error.retryAfter = retryAfter;
    return error;
}

std::string_view toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unauthorized:
            return "unauthorized";
        case ErrorKind::BadRequest:
            return "bad_request";
        case ErrorKind::StreamReadFailure:
            return "stream_read_failure";
        case ErrorKind::TransportFailure:
            return "transport_failure";
        case ErrorKind::MetadataWriteFailure:
            return "metadata_write_failure";
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::Conflict:
            return "conflict";
        case ErrorKind::Internal:
            return "internal";
    }
    return "internal";
}

}  // namespace infstore

#include "storage/Records.hpp"

namespace infstore::storage {

std::string_view toString(FileStatus status) {
    switch (status) {
        case FileStatus::Uploading:
            return "uploading";
        case FileStatus::Completed:
            return "completed";
        case FileStatus::Failed:
            return "failed";
    }
    return "uploading";
}

std::string_view toString(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending:
            return "pending";
        case ChunkStatus::Persisted:
            return "persisted";
        case ChunkStatus::Failed:
            return "failed";
    }
    return "pending";
}

std::optional<FileStatus> parseFileStatus(std::string_view value) {
    if (value == "uploading") {
        return FileStatus::Uploading;
    }
    if (value == "completed") {
        return FileStatus::Completed;
    }
    if (value == "failed") {
        return FileStatus::Failed;
    }
    return std::nullopt;
}

std::optional<ChunkStatus> parseChunkStatus(std::string_view value) {
    if (value == "pending") {
        return ChunkStatus::Pending;
    }
    if (value == "persisted") {
        return ChunkStatus::Persisted;
    }
    if (value == "failed") {
        return ChunkStatus::Failed;
    }
    return std::nullopt;
}

}  // namespace infstore::storage

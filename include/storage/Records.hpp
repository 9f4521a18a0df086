#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace infstore::storage {

enum class FileStatus {
    Uploading,
    Completed,
    Failed,
};

enum class ChunkStatus {
    Pending,
    Persisted,
    Failed,
};

std::string_view toString(FileStatus status);
std::string_view toString(ChunkStatus status);
std::optional<FileStatus> parseFileStatus(std::string_view value);
std::optional<ChunkStatus> parseChunkStatus(std::string_view value);

struct FileRecord {
    std::int64_t id{0};
    std::string name;
    std::uint64_t size{0};
    std::uint64_t chunkCount{0};
    FileStatus status{FileStatus::Uploading};
    std::string ownerKey;
    std::string createdAt;
    std::string updatedAt;
};

// One slice of a file, keyed by (fileId, position). Positions start at 1.
struct ChunkRecord {
    std::int64_t fileId{0};
    std::uint32_t position{0};
    std::uint64_t size{0};
    ChunkStatus status{ChunkStatus::Pending};
    std::string externalRef;
};

}  // namespace infstore::storage

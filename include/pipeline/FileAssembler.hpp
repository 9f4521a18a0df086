#pragma once

#include "infstore/result.h"
#include "pipeline/ByteSource.hpp"
#include "storage/IMetadataStore.hpp"
#include "transport/IBlobTransport.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace infstore::pipeline {

struct FileReport {
    storage::FileRecord file;
    std::vector<storage::ChunkRecord> chunks;
    std::uint64_t persistedChunks{0};
    std::uint64_t failedChunks{0};
    std::uint64_t pendingChunks{0};
    // Completed, and positions 1..chunkCount are all persisted with a reference and
    // their sizes add up to the file size.
    bool consistent{false};
};

Result<FileReport> inspectFile(storage::IMetadataStore &store, std::int64_t fileId);

// Replays a consistent file by fetching its chunks from the transport in position
// order. Only one chunk is held in memory at a time.
class AssembledFileReader : public ByteSource {
  public:
    AssembledFileReader(transport::IBlobTransport &transport, std::vector<storage::ChunkRecord> chunks);

    // Fetches the first chunk ahead of the first read so a file whose storage is
    // unreachable can be refused before any byte of it is sent. A later chunk that fails
    // can still only end the stream early.
    Status prefetch();

    Result<ReadChunk> read(std::uint8_t *buffer, std::size_t capacity) override;

  private:
    Status fetchNext();

    transport::IBlobTransport &transport_;
    std::vector<storage::ChunkRecord> chunks_;
    std::size_t nextChunk_{0};
    Bytes current_;
    std::size_t offset_{0};
    bool failed_{false};
};

}  // namespace infstore::pipeline

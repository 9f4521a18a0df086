#pragma once

#include "infstore/result.h"
#include "storage/Records.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace infstore::storage {

// CRUD contract over file, chunk and API key records. Every call is one independent
// atomic write or read; no call spans several records transactionally.
class IMetadataStore {
  public:
    virtual ~IMetadataStore() = default;

    // Creates a file with an empty name, zero size and chunk count, status uploading.
    virtual Result<std::int64_t> createFile(const std::string &ownerKey) = 0;

    // One-shot: sets the final attributes and status completed. Fails with Conflict
    // when the file is no longer uploading and NotFound when it does not exist.
    virtual Status finalizeFile(std::int64_t fileId,
                                const std::string &name,
                                std::uint64_t size,
                                std::uint64_t chunkCount) = 0;

    // Creates the chunk or updates the one stored under (fileId, position).
    virtual Status writeChunk(const ChunkRecord &chunk) = 0;

    virtual Result<bool> lookupApiKey(const std::string &key) = 0;

    // Fails with Conflict when the key already exists.
    virtual Status insertApiKey(const std::string &key) = 0;

    virtual Result<FileRecord> getFile(std::int64_t fileId) = 0;

    // Ordered by position.
    virtual Result<std::vector<ChunkRecord>> listChunks(std::int64_t fileId) = 0;
};

}  // namespace infstore::storage

#pragma once

#include "storage/IMetadataStore.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <utility>

namespace infstore::storage {

// Process-local store used for dry runs and tests.
class InMemoryMetadataStore : public IMetadataStore {
  public:
    InMemoryMetadataStore() = default;

    Result<std::int64_t> createFile(const std::string &ownerKey) override;
    Status finalizeFile(std::int64_t fileId,
                        const std::string &name,
                        std::uint64_t size,
                        std::uint64_t chunkCount) override;
    Status writeChunk(const ChunkRecord &chunk) override;
    Result<bool> lookupApiKey(const std::string &key) override;
    Status insertApiKey(const std::string &key) override;
    Result<FileRecord> getFile(std::int64_t fileId) override;
    Result<std::vector<ChunkRecord>> listChunks(std::int64_t fileId) override;

    [[nodiscard]] std::size_t fileCount() const;
    [[nodiscard]] std::size_t chunkWriteCount() const;

  private:
    mutable std::mutex mutex_;
    std::int64_t nextFileId_{1};
    std::map<std::int64_t, FileRecord> files_;
    std::map<std::pair<std::int64_t, std::uint32_t>, ChunkRecord> chunks_;
    std::set<std::string> keys_;
    std::size_t chunkWrites_{0};
};

}  // namespace infstore::storage

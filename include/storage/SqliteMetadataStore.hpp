#pragma once

#include "infstore/app_config.h"
#include "storage/IMetadataStore.hpp"

#include <drogon/orm/DbClient.h>

#include <memory>

namespace infstore::storage {

// Metadata store backed by SQLite through drogon's ORM client. The schema is created on
// construction; statements run synchronously on the caller's thread.
class SqliteMetadataStore : public IMetadataStore {
  public:
    explicit SqliteMetadataStore(drogon::orm::DbClientPtr client);

    static std::shared_ptr<SqliteMetadataStore> open(const MetadataConfig &config);

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

  private:
    void ensureSchema();

    drogon::orm::DbClientPtr client_;
};

}  // namespace infstore::storage

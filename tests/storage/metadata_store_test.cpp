#include "storage/InMemoryMetadataStore.hpp"
#include "storage/SqliteMetadataStore.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

using infstore::ErrorKind;
using infstore::storage::ChunkRecord;
using infstore::storage::ChunkStatus;
using infstore::storage::FileStatus;
using infstore::storage::IMetadataStore;

namespace {

struct StoreFactory {
    std::string name;
    std::function<std::shared_ptr<IMetadataStore>(const std::filesystem::path &)> create;
};

std::ostream &operator<<(std::ostream &os, const StoreFactory &factory) {
    return os << factory.name;
}

class MetadataStoreContractTest : public ::testing::TestWithParam<StoreFactory> {
   protected:
    void SetUp() override {
        auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
        directory_ = std::filesystem::temp_directory_path() / ("infstore-store-" + std::to_string(timestamp));
        store_ = GetParam().create(directory_ / "metadata.db");
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
    }

    ChunkRecord chunk(std::int64_t fileId, std::uint32_t position, ChunkStatus status, std::string ref = {}) {
        ChunkRecord record;
        record.fileId = fileId;
        record.position = position;
        record.size = 10U * position;
        record.status = status;
        record.externalRef = std::move(ref);
        return record;
    }

    std::filesystem::path directory_;
    std::shared_ptr<IMetadataStore> store_;
};

}  // namespace

TEST_P(MetadataStoreContractTest, CreatedFileIsProvisional) {
    auto id = store_->createFile("owner-key");
    ASSERT_TRUE(id.ok());

    auto file = store_->getFile(*id.data);
    ASSERT_TRUE(file.ok());
    EXPECT_EQ(file.data->id, *id.data);
    EXPECT_TRUE(file.data->name.empty());
    EXPECT_EQ(file.data->size, 0U);
    EXPECT_EQ(file.data->chunkCount, 0U);
    EXPECT_EQ(file.data->status, FileStatus::Uploading);
    EXPECT_EQ(file.data->ownerKey, "owner-key");
}

TEST_P(MetadataStoreContractTest, FinalizeIsOneShot) {
    auto id = *store_->createFile("owner").data;

    ASSERT_TRUE(store_->finalizeFile(id, "movie.mkv", 123, 2).ok());
    auto file = store_->getFile(id);
    ASSERT_TRUE(file.ok());
    EXPECT_EQ(file.data->name, "movie.mkv");
    EXPECT_EQ(file.data->size, 123U);
    EXPECT_EQ(file.data->chunkCount, 2U);
    EXPECT_EQ(file.data->status, FileStatus::Completed);

    auto again = store_->finalizeFile(id, "other", 1, 1);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error->kind, ErrorKind::Conflict);

    auto missing = store_->finalizeFile(id + 100, "x", 1, 1);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error->kind, ErrorKind::NotFound);
}

TEST_P(MetadataStoreContractTest, WriteChunkUpsertsByPosition) {
    auto id = *store_->createFile("owner").data;

    ASSERT_TRUE(store_->writeChunk(chunk(id, 2, ChunkStatus::Pending)).ok());
    ASSERT_TRUE(store_->writeChunk(chunk(id, 1, ChunkStatus::Pending)).ok());
    ASSERT_TRUE(store_->writeChunk(chunk(id, 2, ChunkStatus::Persisted, "ref-2")).ok());

    auto chunks = store_->listChunks(id);
    ASSERT_TRUE(chunks.ok());
    ASSERT_EQ(chunks.data->size(), 2U);
    EXPECT_EQ((*chunks.data)[0].position, 1U);
    EXPECT_EQ((*chunks.data)[0].status, ChunkStatus::Pending);
    EXPECT_EQ((*chunks.data)[1].position, 2U);
    EXPECT_EQ((*chunks.data)[1].status, ChunkStatus::Persisted);
    EXPECT_EQ((*chunks.data)[1].externalRef, "ref-2");
    EXPECT_EQ((*chunks.data)[1].size, 20U);
}

TEST_P(MetadataStoreContractTest, ChunksAreScopedToTheirFile) {
    auto first = *store_->createFile("owner").data;
    auto second = *store_->createFile("owner").data;
    ASSERT_NE(first, second);

    ASSERT_TRUE(store_->writeChunk(chunk(first, 1, ChunkStatus::Persisted, "a")).ok());
    ASSERT_TRUE(store_->writeChunk(chunk(second, 1, ChunkStatus::Failed)).ok());

    EXPECT_EQ(store_->listChunks(first).data->size(), 1U);
    EXPECT_EQ(store_->listChunks(second).data->front().status, ChunkStatus::Failed);
}

TEST_P(MetadataStoreContractTest, ApiKeysAreUnique) {
    auto unknown = store_->lookupApiKey("k1");
    ASSERT_TRUE(unknown.ok());
    EXPECT_FALSE(*unknown.data);

    ASSERT_TRUE(store_->insertApiKey("k1").ok());
    EXPECT_TRUE(*store_->lookupApiKey("k1").data);

    auto duplicate = store_->insertApiKey("k1");
    ASSERT_FALSE(duplicate.ok());
    EXPECT_EQ(duplicate.error->kind, ErrorKind::Conflict);
}

TEST_P(MetadataStoreContractTest, MissingFileIsNotFound) {
    auto file = store_->getFile(4242);
    ASSERT_FALSE(file.ok());
    EXPECT_EQ(file.error->kind, ErrorKind::NotFound);
}

INSTANTIATE_TEST_SUITE_P(
    Drivers,
    MetadataStoreContractTest,
    ::testing::Values(
        StoreFactory{"memory",
                     [](const std::filesystem::path &) {
                         return std::make_shared<infstore::storage::InMemoryMetadataStore>();
                     }},
        StoreFactory{"sqlite",
                     [](const std::filesystem::path &path) {
                         infstore::MetadataConfig config;
                         config.databasePath = path.string();
                         return infstore::storage::SqliteMetadataStore::open(config);
                     }}),
    [](const ::testing::TestParamInfo<StoreFactory> &info) { return info.param.name; });

TEST(InMemoryMetadataStoreTest, RejectsChunkOfUnknownFile) {
    infstore::storage::InMemoryMetadataStore store;
    ChunkRecord record;
    record.fileId = 99;
    record.position = 1;

    auto status = store.writeChunk(record);
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error->kind, ErrorKind::MetadataWriteFailure);
    EXPECT_EQ(store.chunkWriteCount(), 0U);
}

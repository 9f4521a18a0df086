#include "storage/SqliteMetadataStore.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using infstore::storage::ChunkRecord;
using infstore::storage::ChunkStatus;
using infstore::storage::FileStatus;

namespace {

class SqliteMetadataStoreTest : public ::testing::Test {
   protected:
    SqliteMetadataStoreTest() {
        auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
        directory_ = std::filesystem::temp_directory_path() / ("infstore-sqlite-" + std::to_string(timestamp));
        config_.databasePath = (directory_ / "nested" / "infstore.db").string();
    }

    ~SqliteMetadataStoreTest() override {
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
    }

    std::filesystem::path directory_;
    infstore::MetadataConfig config_;
};

}  // namespace

TEST_F(SqliteMetadataStoreTest, CreatesParentDirectory) {
    auto store = infstore::storage::SqliteMetadataStore::open(config_);
    ASSERT_TRUE(store);
    EXPECT_TRUE(std::filesystem::exists(config_.databasePath));
}

TEST_F(SqliteMetadataStoreTest, RecordsSurviveReopen) {
    std::int64_t fileId = 0;
    {
        auto store = infstore::storage::SqliteMetadataStore::open(config_);
        ASSERT_TRUE(store->insertApiKey("persistent-key").ok());
        fileId = *store->createFile("persistent-key").data;

        ChunkRecord chunk;
        chunk.fileId = fileId;
        chunk.position = 1;
        chunk.size = 5;
        chunk.status = ChunkStatus::Persisted;
        chunk.externalRef = "BQACAgIAAxkDAAIB";
        ASSERT_TRUE(store->writeChunk(chunk).ok());
        ASSERT_TRUE(store->finalizeFile(fileId, "notes.txt", 5, 1).ok());
    }

    auto reopened = infstore::storage::SqliteMetadataStore::open(config_);
    EXPECT_TRUE(*reopened->lookupApiKey("persistent-key").data);

    auto file = reopened->getFile(fileId);
    ASSERT_TRUE(file.ok());
    EXPECT_EQ(file.data->name, "notes.txt");
    EXPECT_EQ(file.data->status, FileStatus::Completed);
    EXPECT_FALSE(file.data->createdAt.empty());

    auto chunks = reopened->listChunks(fileId);
    ASSERT_TRUE(chunks.ok());
    ASSERT_EQ(chunks.data->size(), 1U);
    EXPECT_EQ(chunks.data->front().externalRef, "BQACAgIAAxkDAAIB");
}

TEST_F(SqliteMetadataStoreTest, ChunkForUnknownFileIsRejected) {
    auto store = infstore::storage::SqliteMetadataStore::open(config_);
    ChunkRecord chunk;
    chunk.fileId = 12345;
    chunk.position = 1;

    auto status = store->writeChunk(chunk);
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error->kind, infstore::ErrorKind::MetadataWriteFailure);
}

TEST_F(SqliteMetadataStoreTest, ConcurrentInsertsOfOneKeyYieldConflicts) {
    auto store = infstore::storage::SqliteMetadataStore::open(config_);

    constexpr int kThreads = 8;
    std::atomic<int> inserted{0};
    std::atomic<int> conflicts{0};
    std::atomic<int> otherErrors{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            auto status = store->insertApiKey("contended-key");
            if (status.ok()) {
                ++inserted;
            } else if (status.error->kind == infstore::ErrorKind::Conflict) {
                ++conflicts;
            } else {
                ++otherErrors;
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_EQ(inserted.load(), 1);
    EXPECT_EQ(conflicts.load(), kThreads - 1);
    EXPECT_EQ(otherErrors.load(), 0);
}

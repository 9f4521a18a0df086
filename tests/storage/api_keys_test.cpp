#include "storage/ApiKeys.hpp"
#include "storage/InMemoryMetadataStore.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <vector>

using infstore::ErrorKind;
using infstore::storage::InMemoryMetadataStore;

TEST(ApiKeysTest, DefaultGeneratorProducesAlphanumericKeys) {
    InMemoryMetadataStore store;
    auto key = infstore::storage::issueApiKey(store);
    ASSERT_TRUE(key.ok());
    EXPECT_EQ(key.data->size(), infstore::storage::kApiKeyLength);
    for (char ch : *key.data) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(ch)));
    }
    EXPECT_TRUE(*store.lookupApiKey(*key.data).data);
}

TEST(ApiKeysTest, RegeneratesOnCollision) {
    InMemoryMetadataStore store;
    ASSERT_TRUE(store.insertApiKey("taken").ok());

    std::vector<std::string> candidates{"taken", "taken", "fresh"};
    std::size_t next = 0;
    auto key = infstore::storage::issueApiKey(store, [&] { return candidates[next++]; });

    ASSERT_TRUE(key.ok());
    EXPECT_EQ(*key.data, "fresh");
    EXPECT_EQ(next, 3U);
}

TEST(ApiKeysTest, GivesUpAfterRepeatedCollisions) {
    InMemoryMetadataStore store;
    ASSERT_TRUE(store.insertApiKey("taken").ok());

    auto key = infstore::storage::issueApiKey(store, [] { return std::string("taken"); }, 3);
    ASSERT_FALSE(key.ok());
    EXPECT_EQ(key.error->kind, ErrorKind::Conflict);
}

TEST(ApiKeysTest, AuthorizeRejectsMissingAndUnknownKeys) {
    InMemoryMetadataStore store;
    ASSERT_TRUE(store.insertApiKey("known").ok());

    EXPECT_TRUE(infstore::storage::authorizeApiKey(store, "known").ok());

    auto missing = infstore::storage::authorizeApiKey(store, "");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error->kind, ErrorKind::Unauthorized);

    auto unknown = infstore::storage::authorizeApiKey(store, "guess");
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error->kind, ErrorKind::Unauthorized);
}

#pragma once

#include "infstore/result.h"
#include "storage/IMetadataStore.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace infstore::storage {

inline constexpr std::size_t kApiKeyLength = 43;

using KeyGenerator = std::function<std::string()>;

// Default generator: drogon's random alphanumeric string of kApiKeyLength characters.
KeyGenerator defaultKeyGenerator();

// Generates a key and stores it, generating a fresh one whenever the store reports a
// collision. Gives up with Conflict after maxAttempts collisions.
Result<std::string> issueApiKey(IMetadataStore &store,
                                const KeyGenerator &generator = defaultKeyGenerator(),
                                std::size_t maxAttempts = 5);

// Unauthorized when the key is empty or unknown; store failures are passed through.
Status authorizeApiKey(IMetadataStore &store, const std::string &key);

}  // namespace infstore::storage

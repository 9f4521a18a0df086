#include "storage/ApiKeys.hpp"

#include <drogon/utils/Utilities.h>
#include <trantor/utils/Logger.h>

namespace infstore::storage {

KeyGenerator defaultKeyGenerator() {
    return [] { return drogon::utils::genRandomString(static_cast<int>(kApiKeyLength)); };
}

Result<std::string> issueApiKey(IMetadataStore &store, const KeyGenerator &generator, std::size_t maxAttempts) {
    for (std::size_t attempt = 0; attempt < maxAttempts; ++attempt) {
        auto key = generator();
        auto status = store.insertApiKey(key);
        if (status.ok()) {
            return success(std::move(key));
        }
        if (status.error->kind != ErrorKind::Conflict) {
            return failure<std::string>(*status.error);
        }
        LOG_WARN << "Generated API key collided with an existing one, regenerating";
    }
    return failure<std::string>(makeError(ErrorKind::Conflict, "could not generate a unique API key"));
}

Status authorizeApiKey(IMetadataStore &store, const std::string &key) {
    if (key.empty()) {
        return failedStatus(makeError(ErrorKind::Unauthorized, "API key is missing"));
    }
    auto known = store.lookupApiKey(key);
    if (!known.ok()) {
        return failedStatus(*known.error);
    }
    if (!*known.data) {
        return failedStatus(makeError(ErrorKind::Unauthorized, "API key is not valid"));
    }
    return okStatus();
}

}  // namespace infstore::storage

#pragma once

#include "infstore/app_config.h"
#include "transport/IBlobTransport.hpp"

#include <json/json.h>

#include <string>

namespace infstore::transport {

// Stores blobs as documents in a Telegram chat through the Bot API. The returned
// reference is the document's file_id.
class TelegramBlobTransport : public IBlobTransport {
  public:
    explicit TelegramBlobTransport(TransportConfig config);

    Result<std::string> put(const std::string &name, const Bytes &bytes) override;
    Result<Bytes> get(const std::string &externalRef) override;

    [[nodiscard]] const TransportConfig &config() const { return config_; }

  private:
    Status checkConfigured() const;
    std::string methodUrl(const std::string &method) const;
    std::string downloadUrl(const std::string &filePath) const;

    TransportConfig config_;
};

// Decodes a Bot API reply. Returns the "result" member when the reply is ok, otherwise a
// TransportFailure carrying the description and parameters.retry_after.
Result<Json::Value> parseBotApiReply(long statusCode, const std::string &body);

}  // namespace infstore::transport

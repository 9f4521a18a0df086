#pragma once

#include "infstore/result.h"

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

#include <cstdint>
#include <optional>
#include <string>

namespace infstore::http {

std::string getRequestId(const drogon::HttpRequestPtr &req);

drogon::HttpStatusCode statusFor(ErrorKind kind);

// {"error":{"type","message","request_id"}} with the status matching the error kind.
drogon::HttpResponsePtr makeErrorResponse(const Error &error, const std::string &requestId);

// "Authorization: Bearer <key>" first, then "X-API-Key". Empty when neither is set.
std::string extractApiKey(const drogon::HttpRequestPtr &req);

// Positive decimal id, nullopt otherwise.
std::optional<std::int64_t> parseFileId(const std::string &value);

}  // namespace infstore::http

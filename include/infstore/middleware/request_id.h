#pragma once

#include <drogon/HttpFilter.h>
#include <string>

namespace infstore::middleware {

// Tags every request with an X-Request-ID (kept from the client when present), opens
// its metrics observation and installs the request's log context.
class RequestIdMiddleware : public drogon::HttpFilter<RequestIdMiddleware, false> {
  public:
    void doFilter(const drogon::HttpRequestPtr &req,
                  drogon::FilterCallback &&fcb,
                  drogon::FilterChainCallback &&fccb) override;

    static std::string generateRequestId();
};

}  // namespace infstore::middleware

#include "infstore/middleware/request_id.h"

#include "core/Metrics.hpp"
#include "infstore/logging.h"

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/utils/Utilities.h>

#include <cctype>
#include <cstdint>
#include <cstdlib>

namespace infstore::middleware {

namespace {

constexpr std::size_t kMaxRequestIdLength = 128;

// Client supplied ids end up in logs and headers, so only a conservative charset passes.
bool isAcceptableRequestId(const std::string &value) {
    if (value.empty() || value.size() > kMaxRequestIdLength) {
        return false;
    }
    for (char ch : value) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '-' && ch != '_' && ch != '.') {
            return false;
        }
    }
    return true;
}

std::string resolveEndpoint(const drogon::HttpRequestPtr &req) {
    auto path = std::string{req->path()};
    if (path.empty()) {
        return "unknown";
    }
    return path;
}

}  // namespace

void RequestIdMiddleware::doFilter(const drogon::HttpRequestPtr &req,
                                   drogon::FilterCallback &&fcb,
                                   drogon::FilterChainCallback &&fccb) {
    std::string requestId = req->getHeader("X-Request-ID");
    if (!isAcceptableRequestId(requestId)) {
        requestId = generateRequestId();
    }

    req->attributes()->insert("request_id", requestId);
    req->addHeader("X-Request-ID", requestId);

    const auto method = std::string(req->methodString());
    const auto endpoint = resolveEndpoint(req);
    auto contentLength = req->getHeader("Content-Length");
    std::uint64_t bytesIn = req->bodyLength();
    if (!contentLength.empty() && std::isdigit(static_cast<unsigned char>(contentLength.front()))) {
        bytesIn = std::strtoull(contentLength.c_str(), nullptr, 10);
    }

    auto metricsContext = core::MetricsRegistry::instance().startRequest(method, endpoint, bytesIn);
    req->attributes()->insert("observability.metrics", metricsContext);
    req->attributes()->insert("observability.endpoint", endpoint);

    infstore::LogContext logContext{};
    logContext.requestId = requestId;
    logContext.endpoint = endpoint;
    logContext.hasRequest = true;
    infstore::setLogContext(logContext);

    (void)fcb;
    fccb();
}

std::string RequestIdMiddleware::generateRequestId() {
    return drogon::utils::genRandomString(16);
}

}  // namespace infstore::middleware

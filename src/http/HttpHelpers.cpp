#include "http/HttpHelpers.hpp"

#include <json/json.h>

#include <cctype>

namespace infstore::http {

std::string getRequestId(const drogon::HttpRequestPtr &req) {
    if (!req) {
        return {};
    }
    auto attributes = req->attributes();
    if (attributes && attributes->find("request_id")) {
        return attributes->get<std::string>("request_id");
    }
    return req->getHeader("X-Request-ID");
}

drogon::HttpStatusCode statusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unauthorized:
            return drogon::k401Unauthorized;
        case ErrorKind::BadRequest:
            return drogon::k400BadRequest;
        case ErrorKind::NotFound:
            return drogon::k404NotFound;
        case ErrorKind::Conflict:
            return drogon::k409Conflict;
        case ErrorKind::StreamReadFailure:
        case ErrorKind::TransportFailure:
        case ErrorKind::MetadataWriteFailure:
        case ErrorKind::Internal:
            return drogon::k500InternalServerError;
    }
    return drogon::k500InternalServerError;
}

drogon::HttpResponsePtr makeErrorResponse(const Error &error, const std::string &requestId) {
    Json::Value root(Json::objectValue);
    Json::Value body(Json::objectValue);
    body["type"] = std::string(toString(error.kind));
    body["message"] = error.message;
    body["request_id"] = requestId;
    root["error"] = std::move(body);

    auto response = drogon::HttpResponse::newHttpJsonResponse(root);
    response->setStatusCode(statusFor(error.kind));
    if (!requestId.empty()) {
        response->addHeader("X-Request-ID", requestId);
    }
    return response;
}

std::string extractApiKey(const drogon::HttpRequestPtr &req) {
    auto authorization = req->getHeader("Authorization");
    if (!authorization.empty()) {
        static const std::string kBearer = "bearer ";
        if (authorization.size() > kBearer.size()) {
            bool bearer = true;
            for (std::size_t i = 0; i < kBearer.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(authorization[i])) != kBearer[i]) {
                    bearer = false;
                    break;
                }
            }
            if (bearer) {
                auto key = authorization.substr(kBearer.size());
                auto first = key.find_first_not_of(' ');
                return first == std::string::npos ? std::string{} : key.substr(first);
            }
        }
        return authorization;
    }
    return req->getHeader("X-API-Key");
}

std::optional<std::int64_t> parseFileId(const std::string &value) {
    if (value.empty() || value.size() > 18) {
        return std::nullopt;
    }
    std::int64_t id = 0;
    for (char ch : value) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        id = id * 10 + (ch - '0');
    }
    if (id <= 0) {
        return std::nullopt;
    }
    return id;
}

}  // namespace infstore::http

#include "transport/TelegramBlobTransport.hpp"

#include <cpr/cpr.h>
#include <trantor/utils/Logger.h>

#include <memory>

namespace infstore::transport {
namespace {

Error transportError(const std::string &message, double retryAfter = 0.0) {
    return makeError(ErrorKind::TransportFailure, message, retryAfter);
}

void applyTimeouts(cpr::Session &session, const TransportConfig &config) {
    session.SetTimeout(cpr::Timeout{static_cast<int>(config.timeout.count())});
    session.SetConnectTimeout(cpr::ConnectTimeout{static_cast<int>(config.connectTimeout.count())});
}

}  // namespace

Result<Json::Value> parseBotApiReply(long statusCode, const std::string &body) {
    Json::Value payload;
    std::string errs;
    auto reader = std::unique_ptr<Json::CharReader>(Json::CharReaderBuilder().newCharReader());
    if (body.empty() || !reader->parse(body.c_str(), body.c_str() + body.size(), &payload, &errs) ||
        !payload.isObject()) {
        return failure<Json::Value>(
            transportError("Bot API returned HTTP " + std::to_string(statusCode) + " with an unreadable body"));
    }

    if (payload.get("ok", false).asBool() && statusCode >= 200 && statusCode < 300) {
        return success(payload["result"]);
    }

    std::string description = payload.get("description", "").asString();
    if (description.empty()) {
        description = "request rejected";
    }
    double retryAfter = 0.0;
    const auto &parameters = payload["parameters"];
    if (parameters.isObject() && parameters.isMember("retry_after")) {
        retryAfter = parameters["retry_after"].asDouble();
    }
    return failure<Json::Value>(
        transportError("Bot API error " + std::to_string(statusCode) + ": " + description, retryAfter));
}

TelegramBlobTransport::TelegramBlobTransport(TransportConfig config) : config_(std::move(config)) {
    if (!config_.baseUrl.empty() && config_.baseUrl.back() == '/') {
        config_.baseUrl.pop_back();
    }
}

Status TelegramBlobTransport::checkConfigured() const {
    if (config_.dryRun) {
        return failedStatus(transportError("DRY_RUN is enabled; Telegram call skipped"));
    }
    if (config_.token.empty()) {
        return failedStatus(transportError("Telegram bot token is not configured"));
    }
    if (config_.chatId.empty()) {
        return failedStatus(transportError("Telegram chat id is not configured"));
    }
    return okStatus();
}

std::string TelegramBlobTransport::methodUrl(const std::string &method) const {
    return config_.baseUrl + "/bot" + config_.token + "/" + method;
}

std::string TelegramBlobTransport::downloadUrl(const std::string &filePath) const {
    return config_.baseUrl + "/file/bot" + config_.token + "/" + filePath;
}

Result<std::string> TelegramBlobTransport::put(const std::string &name, const Bytes &bytes) {
    if (auto status = checkConfigured(); !status.ok()) {
        return failure<std::string>(*status.error);
    }
    if (bytes.empty()) {
        return failure<std::string>(transportError("refusing to store an empty document"));
    }
    if (bytes.size() > kTransportItemCeilingBytes) {
        return failure<std::string>(transportError("document of " + std::to_string(bytes.size()) +
                                                   " bytes exceeds the transport limit"));
    }

    cpr::Session session;
    session.SetUrl(cpr::Url{methodUrl("sendDocument")});
    applyTimeouts(session, config_);
    session.SetMultipart(cpr::Multipart{
        {"chat_id", config_.chatId},
        {"document", cpr::Buffer{bytes.begin(), bytes.end(), std::string{name}}},
    });

    cpr::Response response = session.Post();
    if (response.error.code != cpr::ErrorCode::OK) {
        return failure<std::string>(transportError("sendDocument failed: " + response.error.message));
    }

    auto reply = parseBotApiReply(response.status_code, response.text);
    if (!reply.ok()) {
        return failure<std::string>(*reply.error);
    }
    const auto &document = (*reply.data)["document"];
    auto fileId = document.isObject() ? document.get("file_id", "").asString() : std::string{};
    if (fileId.empty()) {
        return failure<std::string>(transportError("sendDocument reply carries no document file_id"));
    }
    LOG_DEBUG << "Stored document " << name << " (" << bytes.size() << " bytes)";
    return success(std::move(fileId));
}

Result<Bytes> TelegramBlobTransport::get(const std::string &externalRef) {
    if (auto status = checkConfigured(); !status.ok()) {
        return failure<Bytes>(*status.error);
    }
    if (externalRef.empty()) {
        return failure<Bytes>(transportError("empty document reference"));
    }

    cpr::Session lookup;
    lookup.SetUrl(cpr::Url{methodUrl("getFile")});
    lookup.SetParameters(cpr::Parameters{{"file_id", externalRef}});
    applyTimeouts(lookup, config_);
    cpr::Response lookupResponse = lookup.Get();
    if (lookupResponse.error.code != cpr::ErrorCode::OK) {
        return failure<Bytes>(transportError("getFile failed: " + lookupResponse.error.message));
    }
    auto reply = parseBotApiReply(lookupResponse.status_code, lookupResponse.text);
    if (!reply.ok()) {
        return failure<Bytes>(*reply.error);
    }
    auto filePath = reply.data->get("file_path", "").asString();
    if (filePath.empty()) {
        return failure<Bytes>(transportError("getFile reply carries no file_path"));
    }

    cpr::Session download;
    download.SetUrl(cpr::Url{downloadUrl(filePath)});
    applyTimeouts(download, config_);
    cpr::Response body = download.Get();
    if (body.error.code != cpr::ErrorCode::OK) {
        return failure<Bytes>(transportError("document download failed: " + body.error.message));
    }
    if (body.status_code != 200) {
        return failure<Bytes>(transportError("document download returned HTTP " + std::to_string(body.status_code)));
    }
    return success(Bytes(body.text.begin(), body.text.end()));
}

}  // namespace infstore::transport

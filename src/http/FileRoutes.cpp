#include "http/FileRoutes.hpp"

#include "http/FilePartForwarder.hpp"
#include "http/HttpHelpers.hpp"
#include "http/InFlightUploads.hpp"
#include "http/StreamPipe.hpp"
#include "infstore/logging.h"
#include "infstore/middleware/request_id.h"
#include "pipeline/FileAssembler.hpp"
#include "storage/ApiKeys.hpp"

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/MultiPart.h>
#include <drogon/RequestStream.h>
#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace infstore::http {
namespace {

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;
using ResponseCallback = std::function<void(const HttpResponsePtr &)>;

constexpr const char *kFileFieldName = "file";

HttpResponsePtr makeJsonResponse(const Json::Value &payload, drogon::HttpStatusCode status, const std::string &requestId) {
    auto response = drogon::HttpResponse::newHttpJsonResponse(payload);
    response->setStatusCode(status);
    if (!requestId.empty()) {
        response->addHeader("X-Request-ID", requestId);
    }
    return response;
}

Json::Value receiptToJson(const pipeline::UploadReceipt &receipt) {
    Json::Value payload(Json::objectValue);
    payload["file_id"] = static_cast<Json::Int64>(receipt.fileId);
    payload["filename"] = receipt.filename;
    payload["size"] = static_cast<Json::UInt64>(receipt.size);
    payload["chunks"] = static_cast<Json::UInt64>(receipt.chunkCount);
    payload["status"] = "accepted";
    return payload;
}

Json::Value reportToJson(const pipeline::FileReport &report) {
    Json::Value payload(Json::objectValue);
    payload["file_id"] = static_cast<Json::Int64>(report.file.id);
    payload["filename"] = report.file.name;
    payload["size"] = static_cast<Json::UInt64>(report.file.size);
    payload["chunk_count"] = static_cast<Json::UInt64>(report.file.chunkCount);
    payload["status"] = std::string(storage::toString(report.file.status));
    payload["created_at"] = report.file.createdAt;
    payload["updated_at"] = report.file.updatedAt;
    payload["consistent"] = report.consistent;
    payload["persisted_chunks"] = static_cast<Json::UInt64>(report.persistedChunks);
    payload["pending_chunks"] = static_cast<Json::UInt64>(report.pendingChunks);
    payload["failed_chunks"] = static_cast<Json::UInt64>(report.failedChunks);

    Json::Value chunks(Json::arrayValue);
    for (const auto &chunk : report.chunks) {
        Json::Value item(Json::objectValue);
        item["position"] = static_cast<Json::UInt>(chunk.position);
        item["size"] = static_cast<Json::UInt64>(chunk.size);
        item["status"] = std::string(storage::toString(chunk.status));
        chunks.append(std::move(item));
    }
    payload["chunks"] = std::move(chunks);
    return payload;
}

// Authorizes the caller and loads the file named by ?file_id=. Files owned by another
// key are reported as missing.
Result<pipeline::FileReport> loadOwnedFile(Services &services, const HttpRequestPtr &req) {
    const auto apiKey = extractApiKey(req);
    if (auto authorized = storage::authorizeApiKey(*services.store, apiKey); !authorized.ok()) {
        return failure<pipeline::FileReport>(*authorized.error);
    }

    const auto rawId = req->getParameter("file_id");
    auto fileId = parseFileId(rawId);
    if (!fileId) {
        return failure<pipeline::FileReport>(makeError(ErrorKind::BadRequest, "file_id must be a positive integer"));
    }

    auto report = pipeline::inspectFile(*services.store, *fileId);
    if (!report.ok()) {
        return report;
    }
    if (report.data->file.ownerKey != apiKey) {
        return failure<pipeline::FileReport>(
            makeError(ErrorKind::NotFound, "file " + std::to_string(*fileId) + " does not exist"));
    }
    return report;
}

void runUpload(const std::shared_ptr<Services> &services,
               const std::shared_ptr<StreamPipe> &pipe,
               std::uint64_t ticket,
               const LogContext &context,
               const std::string &apiKey,
               const std::string &filenameHint,
               const ResponseCallback &callback) {
    // Declared first so the ticket is released only after the response is handed back.
    InFlightTicket inFlight(InFlightUploads::instance(), ticket);
    ScopedLogContext scoped(context);
    HttpResponsePtr response;
    try {
        pipeline::UploadRequest request{apiKey, filenameHint, *pipe, context.requestId};
        auto result = services->coordinator->handleUpload(request);
        response = result.ok() ? makeJsonResponse(receiptToJson(*result.data), drogon::k202Accepted, context.requestId)
                               : makeErrorResponse(*result.error, context.requestId);
    } catch (const std::exception &ex) {
        LOG_ERROR << "Upload failed unexpectedly: " << ex.what();
        response = makeErrorResponse(makeError(ErrorKind::Internal, "upload failed"), context.requestId);
    }
    pipe->close();
    callback(response);
}

// Used when Drogon hands over a fully buffered request instead of a body stream.
void forwardBufferedBody(const HttpRequestPtr &req, FilePartForwarder &forwarder, StreamPipe &pipe) {
    drogon::MultiPartParser parser;
    if (parser.parse(req) != 0) {
        pipe.reject(makeError(ErrorKind::BadRequest, "body is not a valid multipart/form-data message"));
        return;
    }
    for (const auto &file : parser.getFiles()) {
        drogon::MultipartHeader header;
        header.name = file.getItemName();
        header.filename = file.getFileName();
        forwarder.onHeader(header);
        forwarder.onData(file.fileData(), file.fileLength());
    }
    forwarder.onFinish(nullptr);
}

}  // namespace

void closeInFlightUploads() {
    InFlightUploads::instance().closeAll();
}

void registerFileRoutes(const AppConfig &config, const std::shared_ptr<Services> &services) {
    using drogon::Get;
    using drogon::Post;
    const auto filter = middleware::RequestIdMiddleware::classTypeName();
    const auto pipeCapacity = config.pipeline.bodyPipeCapacity;

    drogon::app().registerHandler(
        "/upload",
        [services, pipeCapacity](const HttpRequestPtr &req, drogon::RequestStreamPtr &&stream, ResponseCallback &&callback) {
            auto pipe = std::make_shared<StreamPipe>(pipeCapacity);
            auto ticket = InFlightUploads::instance().add(pipe);
            auto context = currentLogContext();
            context.requestId = getRequestId(req);

            // One thread per upload: it blocks on body reads and on the chunk queue,
            // neither of which may stall the network loop's other connections for long.
            std::thread(runUpload,
                        services,
                        pipe,
                        ticket,
                        context,
                        extractApiKey(req),
                        req->getHeader("X-Filename"),
                        std::move(callback))
                .detach();

            auto forwarder = std::make_shared<FilePartForwarder>(pipe, kFileFieldName);
            if (!stream) {
                forwardBufferedBody(req, *forwarder, *pipe);
                return;
            }

            auto reader = drogon::RequestStreamReader::newMultipartReader(
                req,
                [forwarder](drogon::MultipartHeader header) { forwarder->onHeader(header); },
                [forwarder](const char *data, std::size_t length) { forwarder->onData(data, length); },
                [forwarder](std::exception_ptr error) { forwarder->onFinish(std::move(error)); });
            if (!reader) {
                pipe->reject(makeError(ErrorKind::BadRequest, "Content-Type must be multipart/form-data with a boundary"));
                stream->setStreamReader(drogon::RequestStreamReader::newNullReader());
                return;
            }
            stream->setStreamReader(std::move(reader));
        },
        {Post, filter});

    drogon::app().registerHandler(
        "/get_api_key",
        [services](const HttpRequestPtr &req, ResponseCallback &&callback) {
            const auto requestId = getRequestId(req);
            auto issued = storage::issueApiKey(*services->store);
            if (!issued.ok()) {
                LOG_ERROR << "Could not issue API key: " << issued.error->message;
                callback(makeErrorResponse(*issued.error, requestId));
                return;
            }
            Json::Value payload(Json::objectValue);
            payload["key"] = *issued.data;
            callback(makeJsonResponse(payload, drogon::k200OK, requestId));
        },
        {Get, filter});

    drogon::app().registerHandler(
        "/file_status",
        [services](const HttpRequestPtr &req, ResponseCallback &&callback) {
            const auto requestId = getRequestId(req);
            auto report = loadOwnedFile(*services, req);
            if (!report.ok()) {
                callback(makeErrorResponse(*report.error, requestId));
                return;
            }
            callback(makeJsonResponse(reportToJson(*report.data), drogon::k200OK, requestId));
        },
        {Get, filter});

    drogon::app().registerHandler(
        "/get_file",
        [services](const HttpRequestPtr &req, ResponseCallback &&callback) {
            const auto requestId = getRequestId(req);
            auto report = loadOwnedFile(*services, req);
            if (!report.ok()) {
                callback(makeErrorResponse(*report.error, requestId));
                return;
            }
            if (!report.data->consistent) {
                callback(makeErrorResponse(
                    makeError(ErrorKind::Conflict, "file is not completely persisted"), requestId));
                return;
            }

            const auto fileId = report.data->file.id;
            auto attachment = report.data->file.name.empty() ? "file" + std::to_string(fileId) : report.data->file.name;
            auto reader = std::make_shared<pipeline::AssembledFileReader>(*services->transport, report.data->chunks);
            if (auto first = reader->prefetch(); !first.ok()) {
                callback(makeErrorResponse(*first.error, requestId));
                return;
            }
            // The stream callback runs on the network thread and blocks while a chunk is
            // fetched from the transport. Once the status line is out a failing chunk can
            // only cut the body short; clients detect that from the missing bytes.
            auto response = drogon::HttpResponse::newStreamResponse(
                [reader, services, fileId](char *buffer, std::size_t size) -> std::size_t {
                    if (buffer == nullptr || size == 0) {
                        return 0;
                    }
                    auto read = reader->read(reinterpret_cast<std::uint8_t *>(buffer), size);
                    if (!read.ok()) {
                        LOG_ERROR << "Download of file " << fileId << " aborted: " << read.error->message;
                        return 0;
                    }
                    return read.data->size;
                },
                attachment,
                drogon::CT_APPLICATION_OCTET_STREAM);
            response->addHeader("X-Request-ID", requestId);
            callback(response);
        },
        {Get, filter});
}

}  // namespace infstore::http

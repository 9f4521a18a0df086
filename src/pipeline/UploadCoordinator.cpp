#include "pipeline/UploadCoordinator.hpp"

#include "core/Metrics.hpp"
#include "infstore/logging.h"
#include "pipeline/ChunkFramer.hpp"
#include "storage/ApiKeys.hpp"

#include <trantor/utils/Logger.h>

#include <limits>
#include <stdexcept>

namespace infstore::pipeline {
namespace {

template <typename T>
Result<T> rejected(Error error) {
    core::MetricsRegistry::instance().recordUploadRejected(std::string(toString(error.kind)));
    return failure<T>(std::move(error));
}

}  // namespace

std::string sanitizeFilename(const std::string &filename) {
    auto slash = filename.find_last_of("/\\");
    return slash == std::string::npos ? filename : filename.substr(slash + 1);
}

UploadCoordinator::UploadCoordinator(storage::IMetadataStore &store, ChunkQueue &queue, CoordinatorOptions options)
    : store_(store), queue_(queue), options_(options) {
    if (options_.chunkSize == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }
    if (options_.readSize == 0) {
        options_.readSize = 64 * 1024;
    }
}

Result<UploadReceipt> UploadCoordinator::handleUpload(const UploadRequest &request) {
    auto authorized = storage::authorizeApiKey(store_, request.ownerKey);
    if (!authorized.ok()) {
        LOG_WARN << "Upload rejected: " << authorized.error->message;
        return rejected<UploadReceipt>(*authorized.error);
    }

    auto header = request.file.nextFile();
    if (!header.ok()) {
        LOG_WARN << "Upload aborted before the file part: " << header.error->message;
        return rejected<UploadReceipt>(*header.error);
    }
    if (!header.data->has_value()) {
        return rejected<UploadReceipt>(makeError(ErrorKind::BadRequest, "multipart body has no \"file\" part"));
    }

    auto filename = sanitizeFilename((*header.data)->filename);
    if (filename.empty()) {
        filename = request.filenameHint;
    }
    return streamFile(request, std::move(filename));
}

Result<UploadReceipt> UploadCoordinator::streamFile(const UploadRequest &request, std::string filename) {
    auto &metrics = core::MetricsRegistry::instance();

    auto created = store_.createFile(request.ownerKey);
    if (!created.ok()) {
        LOG_ERROR << "Could not create file record: " << created.error->message;
        return rejected<UploadReceipt>(makeError(ErrorKind::MetadataWriteFailure, created.error->message));
    }
    const auto fileId = *created.data;

    auto context = currentLogContext();
    context.fileId = fileId;
    ScopedLogContext scoped(context);
    LOG_INFO << "Receiving \"" << filename << "\"";

    ChunkFramer framer(request.file, options_.chunkSize, options_.readSize);
    std::uint32_t position = 0;
    while (true) {
        auto frame = framer.next();
        if (!frame.ok()) {
            LOG_ERROR << "Upload aborted after " << position << " chunk(s): " << frame.error->message;
            return rejected<UploadReceipt>(*frame.error);
        }
        if (frame.data->empty()) {
            break;
        }
        if (position == std::numeric_limits<std::uint32_t>::max()) {
            return rejected<UploadReceipt>(makeError(ErrorKind::BadRequest, "file has too many chunks"));
        }
        ++position;

        storage::ChunkRecord record;
        record.fileId = fileId;
        record.position = position;
        record.size = frame.data->size();
        record.status = storage::ChunkStatus::Pending;
        auto written = store_.writeChunk(record);
        if (!written.ok()) {
            LOG_ERROR << "Could not record chunk " << position << ": " << written.error->message;
            return rejected<UploadReceipt>(makeError(ErrorKind::MetadataWriteFailure, written.error->message));
        }

        metrics.recordBytesIngested(record.size);
        LOG_DEBUG << "Queueing chunk " << position << " (" << record.size << " bytes)";
        PendingChunk chunk{fileId, position, std::move(*frame.data), request.requestId};
        if (!queue_.push(std::move(chunk))) {
            return rejected<UploadReceipt>(makeError(ErrorKind::Internal, "chunk queue is closed"));
        }
        metrics.recordChunkEnqueued();
        metrics.setQueueDepth(queue_.size());
    }

    UploadReceipt receipt;
    receipt.fileId = fileId;
    receipt.filename = std::move(filename);
    receipt.size = framer.bytesFramed();
    receipt.chunkCount = position;

    auto finalized = store_.finalizeFile(fileId, receipt.filename, receipt.size, receipt.chunkCount);
    if (!finalized.ok()) {
        LOG_ERROR << "Could not finalize file: " << finalized.error->message;
        return rejected<UploadReceipt>(makeError(ErrorKind::MetadataWriteFailure, finalized.error->message));
    }

    metrics.recordUploadAccepted();
    LOG_INFO << "Queued \"" << receipt.filename << "\": " << receipt.size << " bytes in " << receipt.chunkCount
             << " chunk(s)";
    return success(std::move(receipt));
}

}  // namespace infstore::pipeline

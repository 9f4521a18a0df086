#include "pipeline/FileAssembler.hpp"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cstring>

namespace infstore::pipeline {

Result<FileReport> inspectFile(storage::IMetadataStore &store, std::int64_t fileId) {
    auto file = store.getFile(fileId);
    if (!file.ok()) {
        return failure<FileReport>(*file.error);
    }
    auto chunks = store.listChunks(fileId);
    if (!chunks.ok()) {
        return failure<FileReport>(*chunks.error);
    }

    FileReport report;
    report.file = std::move(*file.data);
    report.chunks = std::move(*chunks.data);

    bool contiguous = report.chunks.size() == report.file.chunkCount;
    std::uint64_t totalSize = 0;
    for (std::size_t i = 0; i < report.chunks.size(); ++i) {
        const auto &chunk = report.chunks[i];
        switch (chunk.status) {
            case storage::ChunkStatus::Persisted:
                ++report.persistedChunks;
                break;
            case storage::ChunkStatus::Failed:
                ++report.failedChunks;
                break;
            case storage::ChunkStatus::Pending:
                ++report.pendingChunks;
                break;
        }
        if (chunk.position != i + 1 || chunk.status != storage::ChunkStatus::Persisted || chunk.externalRef.empty()) {
            contiguous = false;
        }
        totalSize += chunk.size;
    }

    report.consistent = report.file.status == storage::FileStatus::Completed && contiguous &&
                        totalSize == report.file.size;
    return success(std::move(report));
}

AssembledFileReader::AssembledFileReader(transport::IBlobTransport &transport,
                                         std::vector<storage::ChunkRecord> chunks)
    : transport_(transport), chunks_(std::move(chunks)) {
    std::sort(chunks_.begin(), chunks_.end(), [](const auto &lhs, const auto &rhs) {
        return lhs.position < rhs.position;
    });
}

Status AssembledFileReader::fetchNext() {
    const auto &record = chunks_[nextChunk_];
    auto bytes = transport_.get(record.externalRef);
    if (!bytes.ok()) {
        return failedStatus(*bytes.error);
    }
    if (bytes.data->size() != record.size) {
        return failedStatus(makeError(ErrorKind::TransportFailure,
                                      "chunk " + std::to_string(record.position) + " came back with " +
                                          std::to_string(bytes.data->size()) + " bytes, expected " +
                                          std::to_string(record.size)));
    }
    current_ = std::move(*bytes.data);
    offset_ = 0;
    ++nextChunk_;
    return okStatus();
}

Status AssembledFileReader::prefetch() {
    if (failed_) {
        return failedStatus(makeError(ErrorKind::TransportFailure, "file reassembly already failed"));
    }
    if (nextChunk_ > 0 || chunks_.empty()) {
        return okStatus();
    }
    auto status = fetchNext();
    if (!status.ok()) {
        failed_ = true;
        LOG_ERROR << "File reassembly failed: " << status.error->message;
    }
    return status;
}

Result<ReadChunk> AssembledFileReader::read(std::uint8_t *buffer, std::size_t capacity) {
    if (failed_) {
        return failure<ReadChunk>(makeError(ErrorKind::TransportFailure, "file reassembly already failed"));
    }

    ReadChunk chunk;
    while (offset_ >= current_.size()) {
        if (nextChunk_ >= chunks_.size()) {
            Bytes().swap(current_);
            chunk.endOfStream = true;
            return success(chunk);
        }
        if (auto status = fetchNext(); !status.ok()) {
            failed_ = true;
            LOG_ERROR << "File reassembly failed: " << status.error->message;
            return failure<ReadChunk>(*status.error);
        }
    }

    chunk.size = std::min(capacity, current_.size() - offset_);
    std::memcpy(buffer, current_.data() + offset_, chunk.size);
    offset_ += chunk.size;
    chunk.endOfStream = offset_ >= current_.size() && nextChunk_ >= chunks_.size();
    return success(chunk);
}

}  // namespace infstore::pipeline

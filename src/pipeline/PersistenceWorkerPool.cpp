#include "pipeline/PersistenceWorkerPool.hpp"

#include "core/Metrics.hpp"
#include "infstore/logging.h"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace infstore::pipeline {
namespace {

std::chrono::milliseconds retryDelay(std::chrono::milliseconds base, std::size_t attempt, double retryAfterSeconds) {
    auto delay = base * (1LL << std::min<std::size_t>(attempt, 6));
    auto hinted = std::chrono::milliseconds(static_cast<std::int64_t>(retryAfterSeconds * 1000.0));
    return std::max(delay, hinted);
}

}  // namespace

std::string chunkBlobName(std::int64_t fileId, std::uint32_t position) {
    return "file" + std::to_string(fileId) + ".part" + std::to_string(position);
}

PersistenceWorkerPool::PersistenceWorkerPool(ChunkQueue &queue,
                                             transport::IBlobTransport &transport,
                                             storage::IMetadataStore &store,
                                             IntervalRateLimiter &limiter,
                                             WorkerOptions options)
    : queue_(queue), transport_(transport), store_(store), limiter_(limiter), options_(options) {
    if (options_.workerCount == 0) {
        throw std::invalid_argument("Worker pool needs at least one worker");
    }
    if (options_.maxAttempts == 0) {
        options_.maxAttempts = 1;
    }
}

PersistenceWorkerPool::~PersistenceWorkerPool() {
    stop();
}

void PersistenceWorkerPool::start() {
    std::lock_guard guard(lifecycleMutex_);
    if (running_.exchange(true)) {
        return;
    }
    workers_.reserve(options_.workerCount);
    for (std::size_t i = 0; i < options_.workerCount; ++i) {
        workers_.emplace_back([this, i] { run(i); });
    }
    LOG_INFO << "Started " << options_.workerCount << " persistence worker(s)";
}

void PersistenceWorkerPool::stop() {
    std::lock_guard guard(lifecycleMutex_);
    queue_.close();
    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (running_.exchange(false)) {
        LOG_INFO << "Persistence workers stopped: " << persisted_.load() << " persisted, " << failed_.load()
                 << " failed";
    }
    workers_.clear();
}

void PersistenceWorkerPool::run(std::size_t index) {
    LOG_DEBUG << "Persistence worker " << index << " running";
    while (auto chunk = queue_.pop()) {
        core::MetricsRegistry::instance().setQueueDepth(queue_.size());
        // persist() releases the bytes once they are sent, so keep the size for the record.
        const std::uint64_t size = chunk->data.size();
        try {
            persist(*chunk);
        } catch (const std::exception &ex) {
            recordFailure(*chunk, size, makeError(ErrorKind::Internal, ex.what()), {});
        }
    }
    LOG_DEBUG << "Persistence worker " << index << " drained the queue";
}

Result<std::string> PersistenceWorkerPool::sendWithRetry(const PendingChunk &chunk, double &latencyMs) {
    const auto name = chunkBlobName(chunk.fileId, chunk.position);
    Error lastError;
    for (std::size_t attempt = 0; attempt < options_.maxAttempts; ++attempt) {
        std::this_thread::sleep_until(limiter_.reserve());

        const auto started = std::chrono::steady_clock::now();
        auto ref = transport_.put(name, chunk.data);
        latencyMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        if (ref.ok()) {
            return ref;
        }

        lastError = ref.error.value_or(makeError(ErrorKind::TransportFailure, "transport put failed"));
        if (attempt + 1 < options_.maxAttempts) {
            auto delay = retryDelay(options_.retryBackoff, attempt, lastError.retryAfter);
            LOG_WARN << "Chunk " << chunk.position << " send attempt " << (attempt + 1) << " failed: "
                     << lastError.message << "; retrying in " << delay.count() << " ms";
            core::MetricsRegistry::instance().recordChunkRetry();
            std::this_thread::sleep_for(delay);
        }
    }
    return failure<std::string>(lastError);
}

Status PersistenceWorkerPool::persist(PendingChunk &chunk) {
    LogContext context;
    context.requestId = chunk.requestId;
    context.endpoint = "worker";
    context.fileId = chunk.fileId;
    ScopedLogContext scoped(context);

    const std::uint64_t size = chunk.data.size();
    double latencyMs = 0.0;
    auto ref = sendWithRetry(chunk, latencyMs);
    if (!ref.ok()) {
        recordFailure(chunk, size, *ref.error, {});
        return failedStatus(*ref.error);
    }

    Bytes().swap(chunk.data);

    storage::ChunkRecord record;
    record.fileId = chunk.fileId;
    record.position = chunk.position;
    record.size = size;
    record.status = storage::ChunkStatus::Persisted;
    record.externalRef = *ref.data;
    auto written = store_.writeChunk(record);
    if (!written.ok()) {
        recordFailure(chunk, size, *written.error, *ref.data);
        return written;
    }

    ++persisted_;
    core::MetricsRegistry::instance().recordChunkPersisted(latencyMs);
    LOG_DEBUG << "Chunk " << chunk.position << " persisted (" << size << " bytes, " << latencyMs << " ms)";
    return okStatus();
}

void PersistenceWorkerPool::recordFailure(const PendingChunk &chunk,
                                          std::uint64_t size,
                                          const Error &error,
                                          std::string externalRef) {
    ++failed_;
    core::MetricsRegistry::instance().recordChunkFailed(std::string(toString(error.kind)));
    LOG_ERROR << "Chunk " << chunk.position << " of file " << chunk.fileId << " failed: " << error.message;

    storage::ChunkRecord record;
    record.fileId = chunk.fileId;
    record.position = chunk.position;
    record.size = size;
    record.status = storage::ChunkStatus::Failed;
    record.externalRef = std::move(externalRef);
    auto written = store_.writeChunk(record);
    if (!written.ok()) {
        LOG_ERROR << "Could not record chunk " << chunk.position << " of file " << chunk.fileId
                  << " as failed: " << written.error->message
                  << (record.externalRef.empty() ? std::string{} : "; stored blob reference " + record.externalRef);
    }
}

}  // namespace infstore::pipeline

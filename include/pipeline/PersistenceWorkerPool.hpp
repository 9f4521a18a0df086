#pragma once

#include "infstore/result.h"
#include "pipeline/ChunkQueue.hpp"
#include "pipeline/RateLimiter.hpp"
#include "storage/IMetadataStore.hpp"
#include "transport/IBlobTransport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace infstore::pipeline {

struct WorkerOptions {
    std::size_t workerCount{1};
    std::size_t maxAttempts{1};
    std::chrono::milliseconds retryBackoff{500};
};

// Long-lived workers draining the chunk queue. Each chunk is sent to the blob transport
// and its outcome recorded in the metadata store as persisted (with the external
// reference) or failed. A failing chunk never stops the worker.
class PersistenceWorkerPool {
  public:
    PersistenceWorkerPool(ChunkQueue &queue,
                          transport::IBlobTransport &transport,
                          storage::IMetadataStore &store,
                          IntervalRateLimiter &limiter,
                          WorkerOptions options);
    ~PersistenceWorkerPool();

    PersistenceWorkerPool(const PersistenceWorkerPool &) = delete;
    PersistenceWorkerPool &operator=(const PersistenceWorkerPool &) = delete;

    void start();

    // Closes the queue, lets the workers drain what is left and joins them.
    void stop();

    // Persists one chunk on the calling thread; the chunk's bytes are released once
    // the transport accepted them.
    Status persist(PendingChunk &chunk);

    [[nodiscard]] std::uint64_t persistedCount() const { return persisted_.load(); }
    [[nodiscard]] std::uint64_t failedCount() const { return failed_.load(); }
    [[nodiscard]] bool running() const { return running_.load(); }

  private:
    void run(std::size_t index);
    Result<std::string> sendWithRetry(const PendingChunk &chunk, double &latencyMs);
    void recordFailure(const PendingChunk &chunk, std::uint64_t size, const Error &error, std::string externalRef);

    ChunkQueue &queue_;
    transport::IBlobTransport &transport_;
    storage::IMetadataStore &store_;
    IntervalRateLimiter &limiter_;
    WorkerOptions options_;

    std::mutex lifecycleMutex_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> persisted_{0};
    std::atomic<std::uint64_t> failed_{0};
};

// Name under which a chunk is stored in the blob transport.
std::string chunkBlobName(std::int64_t fileId, std::uint32_t position);

}  // namespace infstore::pipeline

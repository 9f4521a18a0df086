#pragma once

#include "pipeline/BoundedBlockingQueue.hpp"
#include "pipeline/ByteSource.hpp"

#include <cstdint>
#include <string>

namespace infstore::pipeline {

// A framed chunk in flight between the upload that produced it and the worker that
// persists it. The bytes are moved along, never shared.
struct PendingChunk {
    std::int64_t fileId{0};
    std::uint32_t position{0};
    Bytes data;
    std::string requestId;
};

using ChunkQueue = BoundedBlockingQueue<PendingChunk>;

}  // namespace infstore::pipeline

#pragma once

#include "pipeline/ByteSource.hpp"

#include <cstddef>
#include <cstdint>

namespace infstore::pipeline {

// Slices a byte stream into frames of exactly chunkSize bytes, followed by at most one
// shorter frame holding the remainder. Frames are produced lazily, one per next() call,
// so at most one frame is held in memory at a time.
//
// next() returns an empty frame once the stream is exhausted; emitted frames are never
// empty. A read error is returned as is and the bytes of the unfinished frame are
// dropped; every later call fails as well.
class ChunkFramer {
  public:
    ChunkFramer(ByteSource &source, std::size_t chunkSize, std::size_t readSize = 64 * 1024);

    Result<Bytes> next();

    [[nodiscard]] std::uint64_t bytesFramed() const { return bytesFramed_; }
    [[nodiscard]] std::uint64_t framesEmitted() const { return framesEmitted_; }
    [[nodiscard]] std::size_t chunkSize() const { return chunkSize_; }

  private:
    ByteSource &source_;
    std::size_t chunkSize_;
    std::size_t readSize_;
    bool finished_{false};
    bool failed_{false};
    std::uint64_t bytesFramed_{0};
    std::uint64_t framesEmitted_{0};
};

// Number of frames a stream of totalBytes produces: ceil(totalBytes / chunkSize).
std::uint64_t expectedFrameCount(std::uint64_t totalBytes, std::size_t chunkSize);

}  // namespace infstore::pipeline

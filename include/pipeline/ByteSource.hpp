#pragma once

#include "infstore/result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace infstore::pipeline {

using Bytes = std::vector<std::uint8_t>;

struct ReadChunk {
    std::size_t size{0};
    bool endOfStream{false};
};

// Sequential reader over a stream of unknown length. A read may deliver zero bytes
// without ending the stream; the end is signalled only through endOfStream, which may
// accompany the final bytes.
class ByteSource {
  public:
    virtual ~ByteSource() = default;

    virtual Result<ReadChunk> read(std::uint8_t *buffer, std::size_t capacity) = 0;
};

// Serves an in-memory body, optionally in slices of at most maxReadSize bytes.
class StringByteSource : public ByteSource {
  public:
    explicit StringByteSource(std::string data, std::size_t maxReadSize = 0);

    Result<ReadChunk> read(std::uint8_t *buffer, std::size_t capacity) override;

  private:
    std::string data_;
    std::size_t offset_{0};
    std::size_t maxReadSize_;
};

}  // namespace infstore::pipeline

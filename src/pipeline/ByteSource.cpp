#include "pipeline/ByteSource.hpp"

#include <algorithm>
#include <cstring>

namespace infstore::pipeline {

StringByteSource::StringByteSource(std::string data, std::size_t maxReadSize)
    : data_(std::move(data)), maxReadSize_(maxReadSize) {}

Result<ReadChunk> StringByteSource::read(std::uint8_t *buffer, std::size_t capacity) {
    auto remaining = data_.size() - offset_;
    auto count = std::min(remaining, capacity);
    if (maxReadSize_ > 0) {
        count = std::min(count, maxReadSize_);
    }
    if (count > 0) {
        std::memcpy(buffer, data_.data() + offset_, count);
        offset_ += count;
    }

    ReadChunk chunk;
    chunk.size = count;
    chunk.endOfStream = offset_ == data_.size();
    return success(chunk);
}

}  // namespace infstore::pipeline

#include "pipeline/ChunkFramer.hpp"

#include <algorithm>
#include <stdexcept>

namespace infstore::pipeline {

ChunkFramer::ChunkFramer(ByteSource &source, std::size_t chunkSize, std::size_t readSize)
    : source_(source), chunkSize_(chunkSize), readSize_(readSize) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }
    if (readSize_ == 0) {
        throw std::invalid_argument("Read size must be greater than zero");
    }
}

Result<Bytes> ChunkFramer::next() {
    if (failed_) {
        return failure<Bytes>(makeError(ErrorKind::StreamReadFailure, "stream already failed"));
    }
    if (finished_) {
        return success(Bytes{});
    }

    Bytes frame(chunkSize_);
    std::size_t filled = 0;
    while (filled < chunkSize_) {
        const auto want = std::min(readSize_, chunkSize_ - filled);
        auto read = source_.read(frame.data() + filled, want);
        if (!read.ok()) {
            failed_ = true;
            return failure<Bytes>(read.error.value_or(makeError(ErrorKind::StreamReadFailure, "read failed")));
        }
        if (read.data->size > want) {
            failed_ = true;
            return failure<Bytes>(makeError(ErrorKind::Internal, "byte source overran the read buffer"));
        }
        filled += read.data->size;
        if (read.data->endOfStream) {
            finished_ = true;
            break;
        }
    }

    if (filled < chunkSize_) {
        frame.resize(filled);
        frame.shrink_to_fit();
    }
    if (filled > 0) {
        bytesFramed_ += filled;
        ++framesEmitted_;
    }
    return success(std::move(frame));
}

std::uint64_t expectedFrameCount(std::uint64_t totalBytes, std::size_t chunkSize) {
    if (chunkSize == 0) {
        return 0;
    }
    return (totalBytes + chunkSize - 1) / chunkSize;
}

}  // namespace infstore::pipeline

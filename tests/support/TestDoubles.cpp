#include "support/TestDoubles.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace infstore::testing {

ScriptedByteSource::ScriptedByteSource(std::vector<std::string> pieces, bool failAtEnd)
    : pieces_(std::move(pieces)), failAtEnd_(failAtEnd) {}

Result<pipeline::ReadChunk> ScriptedByteSource::read(std::uint8_t *buffer, std::size_t capacity) {
    ++readCalls_;
    pipeline::ReadChunk chunk;
    if (piece_ >= pieces_.size()) {
        if (failAtEnd_) {
            return failure<pipeline::ReadChunk>(makeError(ErrorKind::StreamReadFailure, "connection reset"));
        }
        chunk.endOfStream = true;
        return success(chunk);
    }

    const auto &piece = pieces_[piece_];
    chunk.size = std::min(capacity, piece.size() - offset_);
    std::memcpy(buffer, piece.data() + offset_, chunk.size);
    offset_ += chunk.size;
    if (offset_ >= piece.size()) {
        ++piece_;
        offset_ = 0;
    }
    return success(chunk);
}

ScriptedFilePart::ScriptedFilePart(std::optional<pipeline::FilePartHeader> header,
                                   std::vector<std::string> pieces,
                                   bool failAtEnd)
    : header_(std::move(header)), bytes_(std::move(pieces), failAtEnd) {}

Result<std::optional<pipeline::FilePartHeader>> ScriptedFilePart::nextFile() {
    ++nextFileCalls_;
    if (headerError) {
        return failure<std::optional<pipeline::FilePartHeader>>(*headerError);
    }
    return success(header_);
}

Result<pipeline::ReadChunk> ScriptedFilePart::read(std::uint8_t *buffer, std::size_t capacity) {
    return bytes_.read(buffer, capacity);
}

Result<std::string> RecordingBlobTransport::put(const std::string &name, const transport::Bytes &bytes) {
    std::lock_guard guard(mutex_);
    ++putCalls_;
    if (failAll_ || failuresLeft_ > 0) {
        if (failuresLeft_ > 0) {
            --failuresLeft_;
        }
        return failure<std::string>(makeError(ErrorKind::TransportFailure, "Too Many Requests", retryAfter_));
    }
    auto ref = "blob-" + std::to_string(blobs_.size() + 1);
    blobs_.emplace(ref, bytes);
    names_.push_back(name);
    return success(ref);
}

Result<transport::Bytes> RecordingBlobTransport::get(const std::string &externalRef) {
    std::lock_guard guard(mutex_);
    auto it = blobs_.find(externalRef);
    if (it == blobs_.end()) {
        return failure<transport::Bytes>(makeError(ErrorKind::TransportFailure, "unknown blob " + externalRef));
    }
    return success(it->second);
}

void RecordingBlobTransport::failNextPuts(std::size_t count, double retryAfter) {
    std::lock_guard guard(mutex_);
    failuresLeft_ = count;
    retryAfter_ = retryAfter;
}

void RecordingBlobTransport::failAllPuts(bool fail) {
    std::lock_guard guard(mutex_);
    failAll_ = fail;
}

void RecordingBlobTransport::corruptStoredBlob(const std::string &ref) {
    std::lock_guard guard(mutex_);
    auto it = blobs_.find(ref);
    if (it != blobs_.end() && !it->second.empty()) {
        it->second.pop_back();
    }
}

std::size_t RecordingBlobTransport::putCalls() const {
    std::lock_guard guard(mutex_);
    return putCalls_;
}

std::vector<std::string> RecordingBlobTransport::putNames() const {
    std::lock_guard guard(mutex_);
    return names_;
}

std::size_t RecordingBlobTransport::storedCount() const {
    std::lock_guard guard(mutex_);
    return blobs_.size();
}

Result<std::int64_t> FailingMetadataStore::createFile(const std::string &ownerKey) {
    if (failCreate) {
        return failure<std::int64_t>(makeError(ErrorKind::MetadataWriteFailure, "database is locked"));
    }
    return InMemoryMetadataStore::createFile(ownerKey);
}

Status FailingMetadataStore::finalizeFile(std::int64_t fileId,
                                          const std::string &name,
                                          std::uint64_t size,
                                          std::uint64_t chunkCount) {
    if (failFinalize) {
        return failedStatus(makeError(ErrorKind::MetadataWriteFailure, "database is locked"));
    }
    return InMemoryMetadataStore::finalizeFile(fileId, name, size, chunkCount);
}

Status FailingMetadataStore::writeChunk(const storage::ChunkRecord &chunk) {
    if (throwOnChunkWritesWithStatus && *throwOnChunkWritesWithStatus == chunk.status) {
        throw std::runtime_error("statement cache corrupted");
    }
    if (failChunkWritesWithStatus && *failChunkWritesWithStatus == chunk.status) {
        return failedStatus(makeError(ErrorKind::MetadataWriteFailure, "database is locked"));
    }
    return InMemoryMetadataStore::writeChunk(chunk);
}

std::string patternedBytes(std::size_t size, unsigned seed) {
    std::string bytes(size, '\0');
    unsigned state = seed;
    for (auto &byte : bytes) {
        state = state * 1103515245u + 12345u;
        byte = static_cast<char>((state >> 16) & 0xFF);
    }
    return bytes;
}

std::string toString(const pipeline::Bytes &bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace infstore::testing

#include "storage/InMemoryMetadataStore.hpp"

namespace infstore::storage {

Result<std::int64_t> InMemoryMetadataStore::createFile(const std::string &ownerKey) {
    std::lock_guard guard(mutex_);
    FileRecord record;
    record.id = nextFileId_++;
    record.ownerKey = ownerKey;
    record.status = FileStatus::Uploading;
    files_.emplace(record.id, record);
    return success(record.id);
}

Status InMemoryMetadataStore::finalizeFile(std::int64_t fileId,
                                           const std::string &name,
                                           std::uint64_t size,
                                           std::uint64_t chunkCount) {
    std::lock_guard guard(mutex_);
    auto it = files_.find(fileId);
    if (it == files_.end()) {
        return failedStatus(makeError(ErrorKind::NotFound, "file " + std::to_string(fileId) + " does not exist"));
    }
    if (it->second.status != FileStatus::Uploading) {
        return failedStatus(makeError(ErrorKind::Conflict, "file " + std::to_string(fileId) + " is already finalized"));
    }
    it->second.name = name;
    it->second.size = size;
    it->second.chunkCount = chunkCount;
    it->second.status = FileStatus::Completed;
    return okStatus();
}

Status InMemoryMetadataStore::writeChunk(const ChunkRecord &chunk) {
    std::lock_guard guard(mutex_);
    if (files_.find(chunk.fileId) == files_.end()) {
        return failedStatus(
            makeError(ErrorKind::MetadataWriteFailure, "chunk references unknown file " + std::to_string(chunk.fileId)));
    }
    chunks_[{chunk.fileId, chunk.position}] = chunk;
    ++chunkWrites_;
    return okStatus();
}

Result<bool> InMemoryMetadataStore::lookupApiKey(const std::string &key) {
    std::lock_guard guard(mutex_);
    return success(keys_.count(key) > 0);
}

Status InMemoryMetadataStore::insertApiKey(const std::string &key) {
    std::lock_guard guard(mutex_);
    if (!keys_.insert(key).second) {
        return failedStatus(makeError(ErrorKind::Conflict, "API key already exists"));
    }
    return okStatus();
}

Result<FileRecord> InMemoryMetadataStore::getFile(std::int64_t fileId) {
    std::lock_guard guard(mutex_);
    auto it = files_.find(fileId);
    if (it == files_.end()) {
        return failure<FileRecord>(makeError(ErrorKind::NotFound, "file " + std::to_string(fileId) + " does not exist"));
    }
    return success(it->second);
}

Result<std::vector<ChunkRecord>> InMemoryMetadataStore::listChunks(std::int64_t fileId) {
    std::lock_guard guard(mutex_);
    std::vector<ChunkRecord> chunks;
    for (auto it = chunks_.lower_bound({fileId, 0}); it != chunks_.end() && it->first.first == fileId; ++it) {
        chunks.push_back(it->second);
    }
    return success(std::move(chunks));
}

std::size_t InMemoryMetadataStore::fileCount() const {
    std::lock_guard guard(mutex_);
    return files_.size();
}

std::size_t InMemoryMetadataStore::chunkWriteCount() const {
    std::lock_guard guard(mutex_);
    return chunkWrites_;
}

}  // namespace infstore::storage

#pragma once

#include "infstore/result.h"
#include "pipeline/ChunkQueue.hpp"
#include "pipeline/FilePartSource.hpp"
#include "storage/IMetadataStore.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace infstore::pipeline {

struct UploadRequest {
    std::string ownerKey;
    // Used when the file part carries no filename.
    std::string filenameHint;
    FilePartSource &file;
    std::string requestId;
};

struct UploadReceipt {
    std::int64_t fileId{0};
    std::string filename;
    std::uint64_t size{0};
    std::uint64_t chunkCount{0};
};

struct CoordinatorOptions {
    std::size_t chunkSize{20 * 1000 * 1000};
    std::size_t readSize{64 * 1024};
};

// Drives one upload: authorizes the key, waits for the "file" part, frames it into
// chunks, queues them for the workers and finalizes the file record. Returns
// once every chunk is queued; persistence happens later on the worker pool.
//
// Unauthorized and BadRequest are reported before a file record exists. Later failures
// leave the file in status uploading with the chunks queued so far.
class UploadCoordinator {
  public:
    UploadCoordinator(storage::IMetadataStore &store, ChunkQueue &queue, CoordinatorOptions options);

    Result<UploadReceipt> handleUpload(const UploadRequest &request);

  private:
    Result<UploadReceipt> streamFile(const UploadRequest &request, std::string filename);

    storage::IMetadataStore &store_;
    ChunkQueue &queue_;
    CoordinatorOptions options_;
};

// Strips any client-side directory from a multipart filename.
std::string sanitizeFilename(const std::string &filename);

}  // namespace infstore::pipeline

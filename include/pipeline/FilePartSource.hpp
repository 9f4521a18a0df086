#pragma once

#include "pipeline/ByteSource.hpp"

#include <optional>
#include <string>

namespace infstore::pipeline {

struct FilePartHeader {
    std::string filename;
    std::string contentType;
};

// The "file" part of an upload form, already separated from the rest of the body by
// the HTTP layer. nextFile() blocks until the part starts and returns nullopt when the
// form ended without one; read() then serves the part's bytes up to its end.
class FilePartSource : public ByteSource {
  public:
    virtual Result<std::optional<FilePartHeader>> nextFile() = 0;
};

}  // namespace infstore::pipeline

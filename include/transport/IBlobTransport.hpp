#pragma once

#include "infstore/result.h"
#include "pipeline/ByteSource.hpp"

#include <string>

namespace infstore::transport {

using pipeline::Bytes;

// Put-only external blob channel. A put never overwrites: every call stores a new item
// and returns a fresh opaque reference.
class IBlobTransport {
  public:
    virtual ~IBlobTransport() = default;

    virtual Result<std::string> put(const std::string &name, const Bytes &bytes) = 0;
    virtual Result<Bytes> get(const std::string &externalRef) = 0;
};

}  // namespace infstore::transport

#pragma once

#include "http/StreamPipe.hpp"

#include <drogon/RequestStream.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <string>

namespace infstore::http {

// Receives the parts of a multipart body as Drogon's multipart reader separates them
// and forwards only the first part named fieldName into a StreamPipe. Every other part
// is read and dropped.
class FilePartForwarder {
  public:
    FilePartForwarder(std::shared_ptr<StreamPipe> pipe, std::string fieldName);

    void onHeader(const drogon::MultipartHeader &header);
    void onData(const char *data, std::size_t length);
    void onFinish(std::exception_ptr error);

  private:
    std::shared_ptr<StreamPipe> pipe_;
    std::string fieldName_;
    bool inFile_{false};
    bool fileSeen_{false};
    bool finished_{false};
};

}  // namespace infstore::http

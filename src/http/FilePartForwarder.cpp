#include "http/FilePartForwarder.hpp"

#include <trantor/utils/Logger.h>

#include <utility>

namespace infstore::http {

FilePartForwarder::FilePartForwarder(std::shared_ptr<StreamPipe> pipe, std::string fieldName)
    : pipe_(std::move(pipe)), fieldName_(std::move(fieldName)) {}

void FilePartForwarder::onHeader(const drogon::MultipartHeader &header) {
    if (finished_) {
        return;
    }
    if (inFile_) {
        // The file part ends where the next part begins.
        inFile_ = false;
        finished_ = true;
        pipe_->finish();
        return;
    }
    if (!fileSeen_ && header.name == fieldName_) {
        fileSeen_ = true;
        inFile_ = true;
        if (!pipe_->beginFile({header.filename, header.contentType})) {
            LOG_TRACE << "File part started after the upload stopped reading";
        }
        return;
    }
    LOG_DEBUG << "Skipping multipart field \"" << header.name << "\"";
}

void FilePartForwarder::onData(const char *data, std::size_t length) {
    if (!inFile_) {
        return;
    }
    if (!pipe_->write(data, length)) {
        LOG_TRACE << "Discarding " << length << " body bytes after the upload finished";
    }
}

void FilePartForwarder::onFinish(std::exception_ptr error) {
    inFile_ = false;
    if (finished_) {
        if (error) {
            LOG_DEBUG << "Request body failed after the file part was complete";
        }
        return;
    }
    finished_ = true;
    pipe_->finish(std::move(error));
}

}  // namespace infstore::http

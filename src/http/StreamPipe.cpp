#include "http/StreamPipe.hpp"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace infstore::http {
namespace {

std::string describe(const std::exception_ptr &error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception &ex) {
        return ex.what();
    } catch (...) {
        return "unknown error";
    }
}

}  // namespace

StreamPipe::StreamPipe(std::size_t capacity) : fragments_(capacity == 0 ? 1 : capacity) {}

bool StreamPipe::beginFile(pipeline::FilePartHeader header) {
    Fragment fragment;
    fragment.kind = FragmentKind::Header;
    fragment.header = std::move(header);
    return fragments_.push(std::move(fragment));
}

bool StreamPipe::write(const char *data, std::size_t length) {
    if (length == 0) {
        return !fragments_.closed();
    }
    Fragment fragment;
    fragment.data.assign(data, length);
    return fragments_.push(std::move(fragment));
}

void StreamPipe::finish(std::exception_ptr error) {
    Fragment fragment;
    fragment.kind = FragmentKind::End;
    if (error) {
        fragment.kind = FragmentKind::Error;
        fragment.error = makeError(ErrorKind::StreamReadFailure, "request body interrupted: " + describe(error));
    }
    push(std::move(fragment), "Request body ended after the upload stopped reading it");
}

void StreamPipe::reject(Error error) {
    Fragment fragment;
    fragment.kind = FragmentKind::Error;
    fragment.error = std::move(error);
    push(std::move(fragment), "Request body rejected after the upload stopped reading it");
}

void StreamPipe::close() {
    fragments_.close();
}

void StreamPipe::push(Fragment fragment, const char *dropped) {
    if (!fragments_.push(std::move(fragment))) {
        LOG_DEBUG << dropped;
    }
}

Error StreamPipe::fail(Error error) {
    error_ = std::move(error);
    return *error_;
}

Result<std::optional<pipeline::FilePartHeader>> StreamPipe::nextFile() {
    using HeaderResult = std::optional<pipeline::FilePartHeader>;
    if (error_) {
        return failure<HeaderResult>(*error_);
    }
    if (ended_) {
        return success(HeaderResult{});
    }

    while (true) {
        auto next = fragments_.pop();
        if (!next) {
            return failure<HeaderResult>(
                fail(makeError(ErrorKind::StreamReadFailure, "request body closed before the file part started")));
        }
        switch (next->kind) {
            case FragmentKind::Header:
                return success(HeaderResult{std::move(next->header)});
            case FragmentKind::End:
                ended_ = true;
                return success(HeaderResult{});
            case FragmentKind::Error:
                return failure<HeaderResult>(fail(std::move(*next->error)));
            case FragmentKind::Data:
                break;
        }
    }
}

Result<pipeline::ReadChunk> StreamPipe::read(std::uint8_t *buffer, std::size_t capacity) {
    pipeline::ReadChunk chunk;
    if (error_) {
        return failure<pipeline::ReadChunk>(*error_);
    }
    if (ended_) {
        chunk.endOfStream = true;
        return success(chunk);
    }

    while (offset_ >= current_.size()) {
        auto next = fragments_.pop();
        if (!next) {
            return failure<pipeline::ReadChunk>(
                fail(makeError(ErrorKind::StreamReadFailure, "request body closed before it ended")));
        }
        switch (next->kind) {
            case FragmentKind::Data:
                current_ = std::move(next->data);
                offset_ = 0;
                break;
            case FragmentKind::End:
                ended_ = true;
                chunk.endOfStream = true;
                return success(chunk);
            case FragmentKind::Error:
                return failure<pipeline::ReadChunk>(fail(std::move(*next->error)));
            case FragmentKind::Header:
                break;
        }
    }

    chunk.size = std::min(capacity, current_.size() - offset_);
    std::memcpy(buffer, current_.data() + offset_, chunk.size);
    offset_ += chunk.size;
    return success(chunk);
}

}  // namespace infstore::http

#pragma once

#include "pipeline/BoundedBlockingQueue.hpp"
#include "pipeline/FilePartSource.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <string>

namespace infstore::http {

// Hands the "file" part of a request body from the network thread to the thread running
// the upload. Writes block while capacity fragments are queued, which holds back the
// connection until the upload catches up.
class StreamPipe : public pipeline::FilePartSource {
  public:
    explicit StreamPipe(std::size_t capacity);

    // Starts the file part. Returns false once the reading side has closed the pipe.
    bool beginFile(pipeline::FilePartHeader header);

    // Returns false once the reading side has closed the pipe; the data is dropped.
    bool write(const char *data, std::size_t length);

    // Marks the end of the file part, or of the body when no file part was seen. A
    // non-null error makes the reader fail with StreamReadFailure after the fragments
    // already queued.
    void finish(std::exception_ptr error = nullptr);

    // Fails the reader with the given error, e.g. a body that is not a multipart form.
    void reject(Error error);

    // Called by the reading side when it no longer needs the body.
    void close();

    Result<std::optional<pipeline::FilePartHeader>> nextFile() override;
    Result<pipeline::ReadChunk> read(std::uint8_t *buffer, std::size_t capacity) override;

  private:
    enum class FragmentKind {
        Header,
        Data,
        End,
        Error,
    };

    struct Fragment {
        FragmentKind kind{FragmentKind::Data};
        std::string data;
        pipeline::FilePartHeader header;
        std::optional<Error> error;
    };

    void push(Fragment fragment, const char *dropped);
    Error fail(Error error);

    pipeline::BoundedBlockingQueue<Fragment> fragments_;
    std::string current_;
    std::size_t offset_{0};
    bool ended_{false};
    std::optional<Error> error_;
};

}  // namespace infstore::http

#include "http/StreamPipe.hpp"

#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using infstore::ErrorKind;
using infstore::http::StreamPipe;
using infstore::pipeline::FilePartHeader;

namespace {

// Reads until the end of the stream; returns the error kind if one occurred.
std::string drain(StreamPipe &pipe, std::optional<ErrorKind> &error, std::size_t bufferSize = 4) {
    std::string out;
    std::vector<std::uint8_t> buffer(bufferSize);
    while (true) {
        auto chunk = pipe.read(buffer.data(), buffer.size());
        if (!chunk.ok()) {
            error = chunk.error->kind;
            return out;
        }
        out.append(reinterpret_cast<const char *>(buffer.data()), chunk.data->size);
        if (chunk.data->endOfStream) {
            return out;
        }
    }
}

}  // namespace

TEST(StreamPipeTest, DeliversHeaderThenFragmentsInOrder) {
    StreamPipe pipe(2);
    std::thread writer([&] {
        EXPECT_TRUE(pipe.beginFile({"notes.txt", "text/plain"}));
        for (const std::string piece : {"hello ", "", "streaming ", "world"}) {
            EXPECT_TRUE(pipe.write(piece.data(), piece.size()));
        }
        pipe.finish();
    });

    auto header = pipe.nextFile();
    std::optional<ErrorKind> error;
    std::string body;
    if (header.ok() && header.data->has_value()) {
        body = drain(pipe, error, 3);
    }
    pipe.close();
    writer.join();

    ASSERT_TRUE(header.ok());
    ASSERT_TRUE(header.data->has_value());
    EXPECT_EQ((*header.data)->filename, "notes.txt");
    EXPECT_EQ((*header.data)->contentType, "text/plain");
    EXPECT_FALSE(error);
    EXPECT_EQ(body, "hello streaming world");
}

TEST(StreamPipeTest, BodyWithoutFilePartHasNoHeader) {
    StreamPipe pipe(4);
    pipe.finish();

    auto header = pipe.nextFile();
    ASSERT_TRUE(header.ok());
    EXPECT_FALSE(header.data->has_value());

    std::array<std::uint8_t, 8> buffer{};
    auto chunk = pipe.read(buffer.data(), buffer.size());
    ASSERT_TRUE(chunk.ok());
    EXPECT_TRUE(chunk.data->endOfStream);
}

TEST(StreamPipeTest, EndStaysEnded) {
    StreamPipe pipe(4);
    ASSERT_TRUE(pipe.beginFile({"a.bin", ""}));
    pipe.finish();
    ASSERT_TRUE(pipe.nextFile().ok());

    std::array<std::uint8_t, 8> buffer{};
    auto first = pipe.read(buffer.data(), buffer.size());
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(first.data->endOfStream);
    auto second = pipe.read(buffer.data(), buffer.size());
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second.data->endOfStream);
    EXPECT_EQ(second.data->size, 0U);
}

TEST(StreamPipeTest, InterruptedBodyFailsAfterQueuedData) {
    StreamPipe pipe(4);
    ASSERT_TRUE(pipe.beginFile({"a.bin", ""}));
    ASSERT_TRUE(pipe.write("abc", 3));
    pipe.finish(std::make_exception_ptr(std::runtime_error("connection reset")));
    ASSERT_TRUE(pipe.nextFile().ok());

    std::optional<ErrorKind> error;
    auto body = drain(pipe, error);
    EXPECT_EQ(body, "abc");
    ASSERT_TRUE(error);
    EXPECT_EQ(*error, ErrorKind::StreamReadFailure);
}

TEST(StreamPipeTest, RejectionKeepsItsKindAndSticks) {
    StreamPipe pipe(4);
    pipe.reject(infstore::makeError(ErrorKind::BadRequest, "not a form"));

    auto header = pipe.nextFile();
    ASSERT_FALSE(header.ok());
    EXPECT_EQ(header.error->kind, ErrorKind::BadRequest);

    std::array<std::uint8_t, 4> buffer{};
    auto chunk = pipe.read(buffer.data(), buffer.size());
    ASSERT_FALSE(chunk.ok());
    EXPECT_EQ(chunk.error->kind, ErrorKind::BadRequest);
}

TEST(StreamPipeTest, ClosedPipeRejectsWritesAndFailsReads) {
    StreamPipe pipe(1);
    pipe.close();

    EXPECT_FALSE(pipe.beginFile({"a.bin", ""}));
    EXPECT_FALSE(pipe.write("x", 1));
    pipe.finish();

    auto header = pipe.nextFile();
    ASSERT_FALSE(header.ok());
    EXPECT_EQ(header.error->kind, ErrorKind::StreamReadFailure);

    std::array<std::uint8_t, 4> buffer{};
    auto chunk = pipe.read(buffer.data(), buffer.size());
    ASSERT_FALSE(chunk.ok());
    EXPECT_EQ(chunk.error->kind, ErrorKind::StreamReadFailure);
}

TEST(StreamPipeTest, CloseReleasesBlockedWriter) {
    StreamPipe pipe(1);
    ASSERT_TRUE(pipe.write("a", 1));

    bool accepted = true;
    std::thread writer([&] { accepted = pipe.write("b", 1); });
    pipe.close();
    writer.join();

    EXPECT_FALSE(accepted);
}

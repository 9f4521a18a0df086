#include "http/InFlightUploads.hpp"

#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using infstore::ErrorKind;
using infstore::http::InFlightTicket;
using infstore::http::InFlightUploads;
using infstore::http::StreamPipe;

TEST(InFlightUploadsTest, CloseAllWithNothingInFlightReturns) {
    InFlightUploads uploads;
    uploads.closeAll();
    EXPECT_EQ(uploads.active(), 0U);
}

TEST(InFlightUploadsTest, CloseAllWaitsForUploadThreadsToReturn) {
    InFlightUploads uploads;
    auto pipe = std::make_shared<StreamPipe>(4);
    const auto ticket = uploads.add(pipe);

    std::atomic<bool> readFailed{false};
    std::atomic<bool> returned{false};
    std::thread upload([&, pipe] {
        InFlightTicket inFlight(uploads, ticket);
        // Blocks until shutdown closes the pipe.
        auto header = pipe->nextFile();
        readFailed = !header.ok() && header.error->kind == ErrorKind::StreamReadFailure;
        // Work the upload still does with the services after its body is cut off.
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        returned = true;
    });

    uploads.closeAll();
    EXPECT_TRUE(returned.load());
    EXPECT_TRUE(readFailed.load());
    EXPECT_EQ(uploads.active(), 0U);
    upload.join();

    EXPECT_FALSE(pipe->write("x", 1));
}

TEST(InFlightUploadsTest, FinishedUploadsAreForgotten) {
    InFlightUploads uploads;
    auto pipe = std::make_shared<StreamPipe>(1);
    {
        InFlightTicket inFlight(uploads, uploads.add(pipe));
        EXPECT_EQ(uploads.active(), 1U);
    }
    EXPECT_EQ(uploads.active(), 0U);

    uploads.closeAll();
    EXPECT_TRUE(pipe->write("x", 1));
}

#include "core/Metrics.hpp"

#include <gtest/gtest.h>

#include <string>

using infstore::core::MetricsRegistry;

namespace {

bool contains(const std::string &text, const std::string &needle) {
    return text.find(needle) != std::string::npos;
}

}  // namespace

TEST(MetricsRegistryTest, RecordsRequestSeries) {
    MetricsRegistry registry;
    auto observation = registry.startRequest("POST", "/upload", 128);
    observation->complete(202, 64);

    auto failed = registry.startRequest("POST", "/upload", 10);
    failed->complete(401, 80, "unauthorized");

    const auto output = registry.renderPrometheus();
    EXPECT_TRUE(contains(output, "requests_total{method=\"POST\",endpoint=\"/upload\"} 2\n"));
    EXPECT_TRUE(contains(output, "bytes_in{method=\"POST\",endpoint=\"/upload\"} 138\n"));
    EXPECT_TRUE(contains(output, "bytes_out{method=\"POST\",endpoint=\"/upload\"} 144\n"));
    EXPECT_TRUE(contains(output, "errors_total{method=\"POST\",endpoint=\"/upload\",type=\"unauthorized\"} 1\n"));
    EXPECT_TRUE(contains(output, "latency_ms_count{method=\"POST\",endpoint=\"/upload\"} 2\n"));
}

TEST(MetricsRegistryTest, CompleteIsRecordedOnce) {
    MetricsRegistry registry;
    auto observation = registry.startRequest("GET", "/health", 0);
    observation->complete(200, 10);
    observation->complete(500, 10);

    const auto output = registry.renderPrometheus();
    EXPECT_TRUE(contains(output, "requests_total{method=\"GET\",endpoint=\"/health\"} 1\n"));
    EXPECT_FALSE(contains(output, "errors_total{method=\"GET\""));
}

TEST(MetricsRegistryTest, AbandonedObservationCountsAsError) {
    MetricsRegistry registry;
    registry.startRequest("GET", "/get_file", 0).reset();

    EXPECT_TRUE(contains(registry.renderPrometheus(),
                         "errors_total{method=\"GET\",endpoint=\"/get_file\",type=\"abandoned\"} 1\n"));
}

TEST(MetricsRegistryTest, StatusWithoutTypeIsClassified) {
    MetricsRegistry registry;
    registry.startRequest("GET", "/file_status", 0)->complete(404, 0);

    EXPECT_TRUE(contains(registry.renderPrometheus(),
                         "errors_total{method=\"GET\",endpoint=\"/file_status\",type=\"http_4xx\"} 1\n"));
}

TEST(MetricsRegistryTest, RendersPipelineCounters) {
    MetricsRegistry registry;
    registry.recordUploadAccepted();
    registry.recordUploadRejected("bad_request");
    registry.recordBytesIngested(4096);
    registry.recordChunkEnqueued();
    registry.recordChunkEnqueued();
    registry.recordChunkPersisted(42.0);
    registry.recordChunkFailed("transport_failure");
    registry.recordChunkRetry();
    registry.setQueueDepth(3);

    const auto output = registry.renderPrometheus();
    EXPECT_TRUE(contains(output, "uploads_total{outcome=\"accepted\"} 1\n"));
    EXPECT_TRUE(contains(output, "uploads_total{outcome=\"rejected\",type=\"bad_request\"} 1\n"));
    EXPECT_TRUE(contains(output, "bytes_ingested_total 4096\n"));
    EXPECT_TRUE(contains(output, "chunks_enqueued_total 2\n"));
    EXPECT_TRUE(contains(output, "chunks_persisted_total 1\n"));
    EXPECT_TRUE(contains(output, "chunks_failed_total{type=\"transport_failure\"} 1\n"));
    EXPECT_TRUE(contains(output, "chunk_retries_total 1\n"));
    EXPECT_TRUE(contains(output, "chunk_queue_depth 3\n"));
    EXPECT_TRUE(contains(output, "transport_latency_ms_bucket{le=\"50.000000\"} 1\n"));
    EXPECT_TRUE(contains(output, "transport_latency_ms_count 1\n"));
}

TEST(MetricsRegistryTest, EscapesLabelValues) {
    MetricsRegistry registry;
    registry.recordUploadRejected("say \"hi\"");

    EXPECT_TRUE(contains(registry.renderPrometheus(), "type=\"say \\\"hi\\\"\""));
}

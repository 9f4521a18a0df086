#include "core/Metrics.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <utility>

namespace infstore::core {

namespace {
// Milliseconds; uploads and Telegram sends run for seconds, so the tail is long.
constexpr std::array<double, 12> kDefaultBuckets{
    1.0, 5.0, 10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0, 15000.0, 60000.0};

std::string formatDouble(double value) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(6);
    oss << value;
    return oss.str();
}

}  // namespace

MetricsRegistry &MetricsRegistry::instance() {
    static MetricsRegistry instance;
    return instance;
}

MetricsRegistry::MetricsRegistry() {
    pipeline_.transportLatency = createHistogram();
}

std::shared_ptr<RequestObservation> MetricsRegistry::startRequest(std::string method,
                                                                  std::string endpoint,
                                                                  std::uint64_t bytesIn) {
    return std::make_shared<RequestObservation>(*this, std::move(method), std::move(endpoint), bytesIn);
}

void MetricsRegistry::incrementError(const std::string &method,
                                     const std::string &endpoint,
                                     const std::string &errorType) {
    if (errorType.empty()) {
        return;
    }
    const SeriesKey key{method, endpoint};
    std::unique_lock lock(mutex_);
    auto &series = metricsBySeries_[key];
    if (series.latency.buckets.empty()) {
        series.latency = createHistogram();
    }
    ++series.errorCounts[errorType];
}

void MetricsRegistry::recordUploadAccepted() {
    std::unique_lock lock(mutex_);
    ++pipeline_.uploadsAccepted;
}

void MetricsRegistry::recordUploadRejected(const std::string &errorType) {
    std::unique_lock lock(mutex_);
    ++pipeline_.uploadsRejected[errorType.empty() ? "unknown" : errorType];
}

void MetricsRegistry::recordChunkEnqueued() {
    std::unique_lock lock(mutex_);
    ++pipeline_.chunksEnqueued;
}

void MetricsRegistry::recordChunkPersisted(double transportLatencyMs) {
    std::unique_lock lock(mutex_);
    ++pipeline_.chunksPersisted;
    observe(pipeline_.transportLatency, transportLatencyMs);
}

void MetricsRegistry::recordChunkFailed(const std::string &errorType) {
    std::unique_lock lock(mutex_);
    ++pipeline_.chunksFailed[errorType.empty() ? "unknown" : errorType];
}

void MetricsRegistry::recordChunkRetry() {
    std::unique_lock lock(mutex_);
    ++pipeline_.chunkRetries;
}

void MetricsRegistry::recordBytesIngested(std::uint64_t bytes) {
    std::unique_lock lock(mutex_);
    pipeline_.bytesIngested += bytes;
}

void MetricsRegistry::setQueueDepth(std::size_t depth) {
    std::unique_lock lock(mutex_);
    pipeline_.queueDepth = depth;
}

void MetricsRegistry::recordRequest(const SeriesKey &key,
                                    double latencyMs,
                                    std::uint64_t bytesIn,
                                    std::uint64_t bytesOut,
                                    const std::string &errorType) {
    std::unique_lock lock(mutex_);
    auto &series = metricsBySeries_[key];
    if (series.latency.buckets.empty()) {
        series.latency = createHistogram();
    }

    ++series.requestsTotal;
    series.bytesIn += bytesIn;
    series.bytesOut += bytesOut;
    observe(series.latency, latencyMs);

    if (!errorType.empty()) {
        ++series.errorCounts[errorType];
    }
}

MetricsRegistry::Histogram MetricsRegistry::createHistogram() {
    Histogram histogram;
    histogram.buckets.assign(kDefaultBuckets.begin(), kDefaultBuckets.end());
    histogram.counts.assign(histogram.buckets.size() + 1, 0);
    return histogram;
}

void MetricsRegistry::observe(Histogram &histogram, double value) {
    auto &counts = histogram.counts;
    bool bucketed = false;
    for (std::size_t i = 0; i < histogram.buckets.size(); ++i) {
        if (value <= histogram.buckets[i]) {
            ++counts[i];
            bucketed = true;
            break;
        }
    }
    if (!bucketed) {
        ++counts.back();
    }
    histogram.sum += value;
    ++histogram.totalCount;
}

void MetricsRegistry::renderHistogram(std::ostringstream &oss,
                                      const std::string &name,
                                      const std::string &labels,
                                      const Histogram &histogram) {
    if (histogram.buckets.empty()) {
        return;
    }
    const auto prefix = labels.empty() ? std::string{} : labels + ",";
    const auto braces = labels.empty() ? std::string{} : "{" + labels + "}";
    std::uint64_t cumulative = 0;
    for (std::size_t i = 0; i < histogram.buckets.size(); ++i) {
        cumulative += histogram.counts[i];
        oss << name << "_bucket{" << prefix << "le=\"" << formatDouble(histogram.buckets[i]) << "\"} " << cumulative
            << "\n";
    }
    cumulative += histogram.counts.back();
    oss << name << "_bucket{" << prefix << "le=\"+Inf\"} " << cumulative << "\n";
    oss << name << "_sum" << braces << " " << formatDouble(histogram.sum) << "\n";
    oss << name << "_count" << braces << " " << histogram.totalCount << "\n";
}

std::string MetricsRegistry::escapeLabel(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '\\':
            case '\"':
                escaped.push_back('\\');
                escaped.push_back(ch);
                break;
            case '\n':
                escaped.append("\\n");
                break;
            default:
                escaped.push_back(ch);
                break;
        }
    }
    return escaped;
}

std::string MetricsRegistry::renderPrometheus() const {
    std::ostringstream oss;
    oss << "# HELP requests_total Total number of HTTP requests handled.\n";
    oss << "# TYPE requests_total counter\n";
    oss << "# HELP errors_total Total number of error responses by type.\n";
    oss << "# TYPE errors_total counter\n";
    oss << "# HELP latency_ms Request latency in milliseconds.\n";
    oss << "# TYPE latency_ms histogram\n";
    oss << "# HELP bytes_in Total request bytes received.\n";
    oss << "# TYPE bytes_in counter\n";
    oss << "# HELP bytes_out Total response bytes sent.\n";
    oss << "# TYPE bytes_out counter\n";

    std::shared_lock lock(mutex_);
    for (const auto &[key, series] : metricsBySeries_) {
        const auto labels = "method=\"" + escapeLabel(key.method) + "\",endpoint=\"" + escapeLabel(key.endpoint) + "\"";
        oss << "requests_total{" << labels << "} " << series.requestsTotal << "\n";
        oss << "bytes_in{" << labels << "} " << series.bytesIn << "\n";
        oss << "bytes_out{" << labels << "} " << series.bytesOut << "\n";

        for (const auto &[errorType, count] : series.errorCounts) {
            oss << "errors_total{" << labels << ",type=\"" << escapeLabel(errorType) << "\"} " << count << "\n";
        }
        renderHistogram(oss, "latency_ms", labels, series.latency);
    }

    oss << "# HELP uploads_total Upload requests by outcome.\n";
    oss << "# TYPE uploads_total counter\n";
    oss << "uploads_total{outcome=\"accepted\"} " << pipeline_.uploadsAccepted << "\n";
    for (const auto &[errorType, count] : pipeline_.uploadsRejected) {
        oss << "uploads_total{outcome=\"rejected\",type=\"" << escapeLabel(errorType) << "\"} " << count << "\n";
    }

    oss << "# HELP bytes_ingested_total File bytes framed into chunks.\n";
    oss << "# TYPE bytes_ingested_total counter\n";
    oss << "bytes_ingested_total " << pipeline_.bytesIngested << "\n";

    oss << "# HELP chunks_enqueued_total Chunks handed to the persistence queue.\n";
    oss << "# TYPE chunks_enqueued_total counter\n";
    oss << "chunks_enqueued_total " << pipeline_.chunksEnqueued << "\n";

    oss << "# HELP chunks_persisted_total Chunks stored in the blob transport and recorded.\n";
    oss << "# TYPE chunks_persisted_total counter\n";
    oss << "chunks_persisted_total " << pipeline_.chunksPersisted << "\n";

    oss << "# HELP chunks_failed_total Chunks recorded as failed, by error type.\n";
    oss << "# TYPE chunks_failed_total counter\n";
    for (const auto &[errorType, count] : pipeline_.chunksFailed) {
        oss << "chunks_failed_total{type=\"" << escapeLabel(errorType) << "\"} " << count << "\n";
    }

    oss << "# HELP chunk_retries_total Transport attempts repeated after a failure.\n";
    oss << "# TYPE chunk_retries_total counter\n";
    oss << "chunk_retries_total " << pipeline_.chunkRetries << "\n";

    oss << "# HELP chunk_queue_depth Chunks waiting for a worker.\n";
    oss << "# TYPE chunk_queue_depth gauge\n";
    oss << "chunk_queue_depth " << pipeline_.queueDepth << "\n";

    oss << "# HELP transport_latency_ms Blob transport put latency in milliseconds.\n";
    oss << "# TYPE transport_latency_ms histogram\n";
    renderHistogram(oss, "transport_latency_ms", "", pipeline_.transportLatency);

    return oss.str();
}

RequestObservation::RequestObservation(MetricsRegistry &registry,
                                       std::string method,
                                       std::string endpoint,
                                       std::uint64_t bytesIn)
    : registry_(registry),
      method_(std::move(method)),
      endpoint_(std::move(endpoint)),
      bytesIn_(bytesIn),
      start_(std::chrono::steady_clock::now()) {}

RequestObservation::~RequestObservation() {
    if (!completed_.load(std::memory_order_acquire)) {
        complete(0, 0, "abandoned");
    }
}

void RequestObservation::complete(unsigned statusCode, std::uint64_t bytesOut, const std::string &errorType) {
    bool expected = false;
    if (!completed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    latencyMs_ = std::chrono::duration<double, std::milli>(now - start_).count();
    statusCode_ = statusCode;

    std::string resolvedErrorType = errorType;
    if (resolvedErrorType.empty() && statusCode >= 400) {
        resolvedErrorType = statusCode >= 500 ? "http_5xx" : "http_4xx";
    }

    MetricsRegistry::SeriesKey key{method_, endpoint_};
    registry_.recordRequest(key, latencyMs_, bytesIn_, bytesOut, resolvedErrorType);
}

double RequestObservation::latencyMs() const {
    return latencyMs_;
}

}  // namespace infstore::core

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace infstore::core {

class RequestObservation;

class MetricsRegistry {
  public:
    static MetricsRegistry &instance();

    MetricsRegistry();

    std::shared_ptr<RequestObservation> startRequest(std::string method, std::string endpoint, std::uint64_t bytesIn);

    void incrementError(const std::string &method, const std::string &endpoint, const std::string &errorType);

    void recordUploadAccepted();
    void recordUploadRejected(const std::string &errorType);
    void recordChunkEnqueued();
    void recordChunkPersisted(double transportLatencyMs);
    void recordChunkFailed(const std::string &errorType);
    void recordChunkRetry();
    void recordBytesIngested(std::uint64_t bytes);
    void setQueueDepth(std::size_t depth);

    std::string renderPrometheus() const;

  private:
    friend class RequestObservation;

    struct SeriesKey {
        std::string method;
        std::string endpoint;

        bool operator<(const SeriesKey &other) const {
            return std::tie(method, endpoint) < std::tie(other.method, other.endpoint);
        }
    };

    struct Histogram {
        std::vector<double> buckets;
        std::vector<std::uint64_t> counts;
        double sum{0.0};
        std::uint64_t totalCount{0};
    };

    struct SeriesMetrics {
        std::uint64_t requestsTotal{0};
        std::uint64_t bytesIn{0};
        std::uint64_t bytesOut{0};
        std::map<std::string, std::uint64_t> errorCounts;
        Histogram latency;
    };

    struct PipelineMetrics {
        std::uint64_t uploadsAccepted{0};
        std::map<std::string, std::uint64_t> uploadsRejected;
        std::uint64_t chunksEnqueued{0};
        std::uint64_t chunksPersisted{0};
        std::map<std::string, std::uint64_t> chunksFailed;
        std::uint64_t chunkRetries{0};
        std::uint64_t bytesIngested{0};
        std::uint64_t queueDepth{0};
        Histogram transportLatency;
    };

    void recordRequest(const SeriesKey &key,
                       double latencyMs,
                       std::uint64_t bytesIn,
                       std::uint64_t bytesOut,
                       const std::string &errorType);

    static Histogram createHistogram();
    static void observe(Histogram &histogram, double value);
    static void renderHistogram(std::ostringstream &oss,
                                const std::string &name,
                                const std::string &labels,
                                const Histogram &histogram);

    static std::string escapeLabel(std::string_view value);

    mutable std::shared_mutex mutex_;
    std::map<SeriesKey, SeriesMetrics> metricsBySeries_;
    PipelineMetrics pipeline_;
};

class RequestObservation : public std::enable_shared_from_this<RequestObservation> {
  public:
    RequestObservation(MetricsRegistry &registry, std::string method, std::string endpoint, std::uint64_t bytesIn);

    ~RequestObservation();

    void complete(unsigned statusCode, std::uint64_t bytesOut, const std::string &errorType = "");

    double latencyMs() const;

    const std::string &method() const { return method_; }
    const std::string &endpoint() const { return endpoint_; }
    unsigned statusCode() const { return statusCode_; }

  private:
    MetricsRegistry &registry_;
    std::string method_;
    std::string endpoint_;
    std::uint64_t bytesIn_;
    std::chrono::steady_clock::time_point start_;
    std::atomic<bool> completed_{false};
    double latencyMs_{0.0};
    unsigned statusCode_{0};
};

}  // namespace infstore::core

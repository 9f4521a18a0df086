#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace infstore {

// Telegram refuses documents above 50 MB.
inline constexpr std::size_t kTransportItemCeilingBytes = 50 * 1000 * 1000;
// getFile only hands out download paths for documents up to 20 MB.
inline constexpr std::size_t kTransportDownloadCeilingBytes = 20 * 1000 * 1000;

struct PipelineConfig {
    std::size_t chunkSizeBytes{kTransportDownloadCeilingBytes};
    std::size_t queueCapacity{5};
    std::size_t workerCount{1};
    std::chrono::milliseconds pacingInterval{1000};
    std::size_t maxAttempts{1};
    std::chrono::milliseconds retryBackoff{500};
    std::size_t readBufferBytes{64 * 1024};
    std::size_t bodyPipeCapacity{64};
};

struct MetadataConfig {
    std::string driver{"sqlite"};
    std::string databasePath{"data/infstore.db"};
    std::size_t connections{1};
};

struct TransportConfig {
    std::string baseUrl{"https://api.telegram.org"};
    std::string token;
    std::string chatId;
    std::chrono::milliseconds timeout{120000};
    std::chrono::milliseconds connectTimeout{10000};
    bool dryRun{false};
};

struct AppConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8081};
    bool dryRun{false};
    std::string logLevel{"info"};
    std::size_t ioThreads{0};
    std::size_t maxBodyBytes{64ULL * 1024 * 1024 * 1024};
    bool requestStream{true};
    PipelineConfig pipeline;
    MetadataConfig metadata;
    TransportConfig transport;
};

AppConfig loadAppConfig(const YAML::Node &serverConfig,
                        const YAML::Node &loggingConfig,
                        const YAML::Node &storageConfig);
void validateAppConfig(const AppConfig &config);
void applyAppConfig(const AppConfig &config);

}  // namespace infstore

#include "infstore/app_config.h"

#include "infstore/environment.h"

#include <drogon/drogon.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace infstore {
namespace {

std::uint16_t parsePort(const std::string &value, std::uint16_t fallback) {
    try {
        auto portValue = std::stoul(value);
        if (portValue == 0 || portValue > 65535U) {
            return fallback;
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception &) {
        return fallback;
    }
}

std::string resolveScalar(const YAML::Node &node, const std::string &fallback = {}) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    auto resolved = expandEnvReference(node.as<std::string>(""));
    return resolved.empty() ? fallback : resolved;
}

std::size_t parseSize(const YAML::Node &node, std::size_t fallback) {
    auto scalar = resolveScalar(node);
    if (scalar.empty()) {
        return fallback;
    }
    try {
        return static_cast<std::size_t>(std::stoull(scalar));
    } catch (const std::exception &) {
        return fallback;
    }
}

std::chrono::milliseconds parseDuration(const YAML::Node &node, std::chrono::milliseconds fallback) {
    auto scalar = resolveScalar(node);
    if (scalar.empty()) {
        return fallback;
    }
    try {
        return std::chrono::milliseconds(std::stoll(scalar));
    } catch (const std::exception &) {
        return fallback;
    }
}

void loadPipeline(const YAML::Node &node, PipelineConfig &pipeline) {
    if (!node) {
        return;
    }
    pipeline.chunkSizeBytes = parseSize(node["chunk_size_bytes"], pipeline.chunkSizeBytes);
    pipeline.queueCapacity = parseSize(node["queue_capacity"], pipeline.queueCapacity);
    pipeline.workerCount = parseSize(node["workers"], pipeline.workerCount);
    pipeline.pacingInterval = parseDuration(node["pacing_interval_ms"], pipeline.pacingInterval);
    pipeline.maxAttempts = parseSize(node["max_attempts"], pipeline.maxAttempts);
    pipeline.retryBackoff = parseDuration(node["retry_backoff_ms"], pipeline.retryBackoff);
    pipeline.readBufferBytes = parseSize(node["read_buffer_bytes"], pipeline.readBufferBytes);
    pipeline.bodyPipeCapacity = parseSize(node["body_pipe_capacity"], pipeline.bodyPipeCapacity);
}

void loadMetadata(const YAML::Node &node, MetadataConfig &metadata) {
    if (!node) {
        return;
    }
    metadata.driver = resolveScalar(node["driver"], metadata.driver);
    metadata.databasePath = resolveScalar(node["path"], metadata.databasePath);
    metadata.connections = parseSize(node["connections"], metadata.connections);
}

void loadTransport(const YAML::Node &node, TransportConfig &transport) {
    if (!node) {
        return;
    }
    transport.baseUrl = resolveScalar(node["base_url"], transport.baseUrl);
    transport.token = resolveScalar(node["token"], transport.token);
    transport.chatId = resolveScalar(node["chat_id"], transport.chatId);
    transport.timeout = parseDuration(node["timeout_ms"], transport.timeout);
    transport.connectTimeout = parseDuration(node["connect_timeout_ms"], transport.connectTimeout);
}

}  // namespace

AppConfig loadAppConfig(const YAML::Node &serverConfig,
                        const YAML::Node &loggingConfig,
                        const YAML::Node &storageConfig) {
    AppConfig config{};

    std::string defaultHost{config.host};
    std::uint16_t defaultPort{config.port};
    bool defaultDryRun{false};
    std::string defaultLogLevel{config.logLevel};

    if (serverConfig) {
        if (auto listeners = serverConfig["listeners"]; listeners && listeners.IsSequence() && listeners.size() > 0) {
            const auto listener = listeners[0];
            if (auto address = listener["address"]; address) {
                defaultHost = address.as<std::string>(defaultHost);
            }
            if (auto port = listener["port"]; port) {
                defaultPort = static_cast<std::uint16_t>(port.as<std::uint32_t>(defaultPort));
            }
        }
        if (auto appNode = serverConfig["app"]; appNode) {
            defaultDryRun = appNode["dry_run"].as<bool>(defaultDryRun);
            config.ioThreads = parseSize(appNode["threads"], config.ioThreads);
            config.maxBodyBytes = parseSize(appNode["max_body_bytes"], config.maxBodyBytes);
            config.requestStream = appNode["request_stream"].as<bool>(config.requestStream);
        }
    }

    if (loggingConfig) {
        if (auto logging = loggingConfig["logging"]; logging) {
            defaultLogLevel = logging["level"].as<std::string>(defaultLogLevel);
        }
    }

    if (storageConfig) {
        loadPipeline(storageConfig["pipeline"], config.pipeline);
        loadMetadata(storageConfig["metadata"], config.metadata);
        loadTransport(storageConfig["transport"], config.transport);
    }

    config.host = getEnvOrDefault("HOST", defaultHost);
    config.port = parsePort(getEnvOrDefault("PORT", std::to_string(defaultPort)), defaultPort);
    config.dryRun = getEnvFlag("DRY_RUN", defaultDryRun);
    config.logLevel = getEnvOrDefault("LOG_LEVEL", defaultLogLevel);

    auto &pipeline = config.pipeline;
    pipeline.chunkSizeBytes = static_cast<std::size_t>(getEnvUnsigned("CHUNK_SIZE_BYTES", pipeline.chunkSizeBytes));
    pipeline.queueCapacity = static_cast<std::size_t>(getEnvUnsigned("QUEUE_CAPACITY", pipeline.queueCapacity));
    pipeline.workerCount = static_cast<std::size_t>(getEnvUnsigned("WORKER_COUNT", pipeline.workerCount));
    pipeline.pacingInterval = getEnvMillis("WORKER_PACING_MS", pipeline.pacingInterval);

    config.metadata.databasePath = getEnvOrDefault("DATABASE_PATH", config.metadata.databasePath);
    config.transport.token = getEnvOrDefault("TOKEN", config.transport.token);
    config.transport.chatId = getEnvOrDefault("CHATID", config.transport.chatId);
    config.transport.dryRun = config.dryRun;

    return config;
}

void validateAppConfig(const AppConfig &config) {
    const auto &pipeline = config.pipeline;
    // Chunks larger than the download ceiling could be stored but never read back.
    if (pipeline.chunkSizeBytes == 0 || pipeline.chunkSizeBytes > kTransportDownloadCeilingBytes) {
        throw std::invalid_argument("pipeline.chunk_size_bytes must be between 1 and " +
                                    std::to_string(kTransportDownloadCeilingBytes));
    }
    if (pipeline.queueCapacity == 0) {
        throw std::invalid_argument("pipeline.queue_capacity must be greater than zero");
    }
    if (pipeline.workerCount == 0) {
        throw std::invalid_argument("pipeline.workers must be greater than zero");
    }
    if (pipeline.maxAttempts == 0) {
        throw std::invalid_argument("pipeline.max_attempts must be greater than zero");
    }
    if (pipeline.readBufferBytes == 0 || pipeline.bodyPipeCapacity == 0) {
        throw std::invalid_argument("pipeline read buffer and body pipe capacity must be greater than zero");
    }
    if (config.metadata.driver != "sqlite" && config.metadata.driver != "memory") {
        throw std::invalid_argument("metadata.driver must be 'sqlite' or 'memory'");
    }
    if (config.metadata.connections == 0) {
        throw std::invalid_argument("metadata.connections must be greater than zero");
    }
}

void applyAppConfig(const AppConfig &config) {
    auto &application = drogon::app();
    application.addListener(config.host, config.port);
    application.setClientMaxBodySize(config.maxBodyBytes);
    if (config.ioThreads > 0) {
        application.setThreadNum(config.ioThreads);
    }
    if (config.requestStream) {
        application.enableRequestStream(true);
    }

    if (config.dryRun) {
        LOG_WARN << "DRY_RUN mode is enabled; chunks will not reach the blob transport.";
    }
}

}  // namespace infstore

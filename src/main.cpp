#include <drogon/drogon.h>
#include <json/json.h>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>

#include "core/Metrics.hpp"
#include "http/HttpHelpers.hpp"
#include "http/HttpServer.hpp"
#include "infstore/app_config.h"
#include "infstore/environment.h"
#include "infstore/logging.h"
#include "infstore/middleware/request_id.h"
#include "pipeline/PersistenceWorkerPool.hpp"
#include "pipeline/RateLimiter.hpp"
#include "pipeline/UploadCoordinator.hpp"
#include "storage/InMemoryMetadataStore.hpp"
#include "storage/SqliteMetadataStore.hpp"
#include "transport/TelegramBlobTransport.hpp"

namespace {
std::atomic<bool> shutdownRequested{false};

void installSignalHandlers() {
    sigset_t sigset;
    sigemptyset(&sigset);
    sigaddset(&sigset, SIGINT);
    sigaddset(&sigset, SIGTERM);

    pthread_sigmask(SIG_BLOCK, &sigset, nullptr);

    std::thread([sigset]() mutable {
        int signo = 0;
        while (sigwait(&sigset, &signo) == 0) {
            if (!shutdownRequested.exchange(true)) {
                drogon::app().getLoop()->queueInLoop([]() {
                    LOG_INFO << "Shutdown signal received. Stopping server.";
                    drogon::app().quit();
                });
            }
        }
    }).detach();
}

template <typename T>
std::shared_ptr<T> getSharedAttribute(const drogon::AttributesPtr &attributes, const std::string &key) {
    if (!attributes || !attributes->find(key)) {
        return nullptr;
    }
    return attributes->get<std::shared_ptr<T>>(key);
}

std::string getStringAttribute(const drogon::AttributesPtr &attributes, const std::string &key) {
    if (!attributes || !attributes->find(key)) {
        return {};
    }
    return attributes->get<std::string>(key);
}

YAML::Node loadYaml(const std::string &path) {
    try {
        return YAML::LoadFile(path);
    } catch (const std::exception &ex) {
        std::cerr << "Failed to load " << path << ": " << ex.what() << std::endl;
    }
    return YAML::Node{};
}

std::shared_ptr<infstore::storage::IMetadataStore> openMetadataStore(const infstore::MetadataConfig &config) {
    if (config.driver == "memory") {
        LOG_WARN << "Using the in-memory metadata store; records are lost on restart.";
        return std::make_shared<infstore::storage::InMemoryMetadataStore>();
    }
    return infstore::storage::SqliteMetadataStore::open(config);
}

}  // namespace

int main() {
    using namespace drogon;

    infstore::loadDotEnv(".env");

    auto serverConfig = loadYaml("config/server.yaml");
    auto loggingConfig = loadYaml("config/logging.yaml");
    auto storageConfig = loadYaml("config/storage.yaml");

    infstore::AppConfig config;
    try {
        config = infstore::loadAppConfig(serverConfig, loggingConfig, storageConfig);
        infstore::validateAppConfig(config);
    } catch (const std::exception &ex) {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }

    infstore::initializeLogging(config.logLevel, loggingConfig);

    auto &application = drogon::app();
    application.enableServerHeader(false);
    application.enableDateHeader(true);

    infstore::applyAppConfig(config);

    application.registerFilter(std::make_shared<infstore::middleware::RequestIdMiddleware>());

    application.registerPostHandlingAdvice([](const HttpRequestPtr &req, const HttpResponsePtr &resp) {
        auto requestId = infstore::http::getRequestId(req);
        if (resp && !requestId.empty()) {
            resp->addHeader("X-Request-ID", requestId);
        }

        auto attributes = req->attributes();
        auto metricsContext = getSharedAttribute<infstore::core::RequestObservation>(attributes, "observability.metrics");
        const std::string endpoint = getStringAttribute(attributes, "observability.endpoint");

        const auto statusCode = resp ? static_cast<unsigned>(resp->getStatusCode()) : 0U;
        const auto bytesOut = resp ? static_cast<std::uint64_t>(resp->body().size()) : 0ULL;

        if (metricsContext) {
            metricsContext->complete(statusCode, bytesOut);
        }

        infstore::LogContext context = infstore::currentLogContext();
        context.requestId = requestId;
        if (!endpoint.empty()) {
            context.endpoint = endpoint;
        }
        context.status = static_cast<int>(statusCode);
        context.latencyMs = metricsContext ? metricsContext->latencyMs() : 0.0;
        context.hasRequest = true;
        infstore::updateLogContext(context);
        LOG_INFO << "request complete";

        infstore::clearLogContext();
    });

    std::shared_ptr<infstore::storage::IMetadataStore> store;
    try {
        store = openMetadataStore(config.metadata);
    } catch (const std::exception &ex) {
        LOG_FATAL << "Could not open the metadata store: " << ex.what();
        return 1;
    }

    auto transport = std::make_shared<infstore::transport::TelegramBlobTransport>(config.transport);
    auto queue = std::make_shared<infstore::pipeline::ChunkQueue>(config.pipeline.queueCapacity);
    infstore::pipeline::IntervalRateLimiter limiter(config.pipeline.pacingInterval);

    infstore::pipeline::CoordinatorOptions coordinatorOptions;
    coordinatorOptions.chunkSize = config.pipeline.chunkSizeBytes;
    coordinatorOptions.readSize = config.pipeline.readBufferBytes;

    auto services = std::make_shared<infstore::http::Services>();
    services->store = store;
    services->transport = transport;
    services->queue = queue;
    services->coordinator = std::make_shared<infstore::pipeline::UploadCoordinator>(*store, *queue, coordinatorOptions);

    infstore::pipeline::WorkerOptions workerOptions;
    workerOptions.workerCount = config.pipeline.workerCount;
    workerOptions.maxAttempts = config.pipeline.maxAttempts;
    workerOptions.retryBackoff = config.pipeline.retryBackoff;
    infstore::pipeline::PersistenceWorkerPool workers(*queue, *transport, *store, limiter, workerOptions);

    const std::string version = "0.1.0";
    const auto startTime = std::chrono::system_clock::now();
    const auto filter = infstore::middleware::RequestIdMiddleware::classTypeName();

    application.registerHandler(
        "/",
        [](const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback) {
            auto response = HttpResponse::newHttpResponse();
            response->setStatusCode(k200OK);
            callback(response);
        },
        {Get, filter});

    application.registerHandler(
        "/health",
        [version, startTime, queue](const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback) {
            Json::Value payload(Json::objectValue);
            payload["status"] = "ok";
            payload["service"] = "infstore_server";
            payload["version"] = version;
            payload["queue_depth"] = static_cast<Json::UInt64>(queue->size());
            payload["uptime_seconds"] = static_cast<Json::Int64>(
                std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - startTime).count());

            auto response = HttpResponse::newHttpJsonResponse(payload);
            response->setStatusCode(k200OK);
            callback(response);
        },
        {Get, filter});

    application.registerHandler(
        "/metrics",
        [](const HttpRequestPtr &, std::function<void(const HttpResponsePtr &)> &&callback) {
            auto body = infstore::core::MetricsRegistry::instance().renderPrometheus();
            auto response = HttpResponse::newHttpResponse();
            response->setStatusCode(k200OK);
            response->setContentTypeString("text/plain; version=0.0.4");
            response->setBody(std::move(body));
            callback(response);
        },
        {Get, filter});

    infstore::http::HttpServer::registerRoutes(config, services);

    installSignalHandlers();
    workers.start();

    LOG_INFO << "Starting infstore_server on " << config.host << ':' << config.port << " (chunk size "
             << config.pipeline.chunkSizeBytes << " bytes, " << config.pipeline.workerCount << " worker(s))";

    application.run();
    LOG_INFO << "Server stopped. Draining " << queue->size() << " queued chunk(s).";

    infstore::http::HttpServer::abortInFlightUploads();
    workers.stop();
    LOG_INFO << "Shutdown complete.";

    return 0;
}

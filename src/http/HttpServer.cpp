#include "http/HttpServer.hpp"

#include "http/FileRoutes.hpp"

namespace infstore::http {

void HttpServer::registerRoutes(const AppConfig &config, std::shared_ptr<Services> services) {
    registerFileRoutes(config, services);
}

void HttpServer::abortInFlightUploads() {
    closeInFlightUploads();
}

}  // namespace infstore::http

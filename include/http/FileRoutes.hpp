#pragma once

#include "http/HttpServer.hpp"

#include <memory>

namespace infstore::http {

void registerFileRoutes(const AppConfig &config, const std::shared_ptr<Services> &services);

void closeInFlightUploads();

}  // namespace infstore::http

#pragma once

#include "infstore/app_config.h"
#include "pipeline/ChunkQueue.hpp"
#include "pipeline/UploadCoordinator.hpp"
#include "storage/IMetadataStore.hpp"
#include "transport/IBlobTransport.hpp"

#include <memory>

namespace infstore::http {

// Process-wide collaborators shared by the route handlers. Handlers keep the struct
// alive while an upload thread still uses it.
struct Services {
    std::shared_ptr<storage::IMetadataStore> store;
    std::shared_ptr<transport::IBlobTransport> transport;
    std::shared_ptr<pipeline::ChunkQueue> queue;
    std::shared_ptr<pipeline::UploadCoordinator> coordinator;
};

class HttpServer {
  public:
    static void registerRoutes(const AppConfig &config, std::shared_ptr<Services> services);

    // Ends the request bodies of uploads still in flight and waits for their threads to
    // return. Must run before the worker pool and the services are torn down.
    static void abortInFlightUploads();
};

}  // namespace infstore::http

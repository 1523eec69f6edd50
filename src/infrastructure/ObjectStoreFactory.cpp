#include "infrastructure/ObjectStoreFactory.hpp"
#include "infrastructure/FileSystemObjectStore.hpp"
#include "infrastructure/HttpObjectStore.hpp"
#include "infrastructure/StoreRouting.hpp"
#include <iostream>
#include <stdexcept>

namespace pixelorigin::infrastructure {

StoreClients ObjectStoreFactory::Build(const application::ServiceConfig& config) {
    StoreClients clients;

    if (config.storeBackend == "filesystem") {
        auto store = std::make_shared<FileSystemObjectStore>(config.storageRoot);
        clients.source = store;
        clients.cache = store;
        std::cout << "[ObjectStoreFactory] Using filesystem store at " << config.storageRoot << std::endl;
        return clients;
    }

    if (config.storeBackend != "s3") {
        throw std::invalid_argument("Unknown storeBackend: " + config.storeBackend);
    }

    if (!config.storeEndpoint.empty()) {
        auto store = std::make_shared<HttpObjectStore>(config.storeEndpoint, HttpObjectStore::Addressing::PathStyle);
        clients.source = store;
        clients.cache = store;
        std::cout << "[ObjectStoreFactory] Using custom S3 endpoint " << config.storeEndpoint << std::endl;
    } else if (config.usesMultiRegionEndpoints()) {
        clients.source = std::make_shared<HttpObjectStore>(
            StoreRouting::MrapEndpoint(config.originalMrapArn), HttpObjectStore::Addressing::AccessPoint);
        clients.cache = std::make_shared<HttpObjectStore>(
            StoreRouting::MrapEndpoint(config.transformedMrapArn), HttpObjectStore::Addressing::AccessPoint);
        std::cout << "[ObjectStoreFactory] Using MRAP endpoints" << std::endl;
    } else {
        auto store = std::make_shared<HttpObjectStore>(
            StoreRouting::RegionalEndpoint(config.awsRegion), HttpObjectStore::Addressing::PathStyle);
        clients.source = store;
        clients.cache = store;
        std::cout << "[ObjectStoreFactory] Using standard S3 endpoints (non-MRAP)" << std::endl;
    }
    return clients;
}

} // namespace pixelorigin::infrastructure

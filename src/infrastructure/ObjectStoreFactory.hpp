/**
 * @file ObjectStoreFactory.hpp
 * @brief Builds the source and cache store clients from configuration.
 */

#pragma once
#include "application/ServiceConfig.hpp"
#include "domain/ObjectStore.hpp"
#include <memory>

namespace pixelorigin::infrastructure {

struct StoreClients {
    std::shared_ptr<domain::ObjectStore> source;
    std::shared_ptr<domain::ObjectStore> cache;
};

class ObjectStoreFactory {
public:
    /**
     * @brief Chooses backend and endpoints.
     *
     * `filesystem`: one directory store for both buckets.
     * `s3`: a custom endpoint when configured; otherwise per-store
     * multi-region endpoints when both ARNs are set, or one shared regional
     * client.
     * @throws std::invalid_argument for an unknown backend.
     */
    static StoreClients Build(const application::ServiceConfig& config);
};

} // namespace pixelorigin::infrastructure

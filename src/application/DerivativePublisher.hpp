/**
 * @file DerivativePublisher.hpp
 * @brief Writes derivatives to the cache store.
 */

#pragma once

#include "domain/DerivativeArtifact.hpp"
#include "domain/ObjectStore.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/TransformRequest.hpp"
#include <memory>
#include <optional>
#include <string>

namespace pixelorigin::application {

/**
 * @class DerivativePublisher
 * @brief Stores a derivative under its cache key with provenance metadata.
 *
 * Failures are returned, never thrown: the response does not depend on
 * the cache write.
 */
class DerivativePublisher {
public:
    DerivativePublisher(std::shared_ptr<domain::ObjectStore> store,
                        std::string bucketId,
                        std::string region,
                        std::string cacheControl);

    /**
     * @brief Writes @p derivative to the cache store.
     * @return The failure, or nullopt when the object was written.
     */
    std::optional<domain::PublishError> publish(const domain::DerivativeArtifact& derivative,
                                                const domain::TransformRequest& request) const;

    /** @brief Builds the put request without sending it. */
    domain::PutObjectRequest buildPutRequest(const domain::DerivativeArtifact& derivative,
                                             const domain::TransformRequest& request) const;

private:
    std::shared_ptr<domain::ObjectStore> m_store;
    std::string m_bucketId;
    std::string m_region;
    std::string m_cacheControl;
};

} // namespace pixelorigin::application

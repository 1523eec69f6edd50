/**
 * @file DerivativePublisher.cpp
 * @brief Implementation of DerivativePublisher.
 */

#include "application/DerivativePublisher.hpp"
#include <iostream>

namespace pixelorigin::application {

DerivativePublisher::DerivativePublisher(std::shared_ptr<domain::ObjectStore> store,
                                         std::string bucketId,
                                         std::string region,
                                         std::string cacheControl)
    : m_store(std::move(store))
    , m_bucketId(std::move(bucketId))
    , m_region(std::move(region))
    , m_cacheControl(std::move(cacheControl))
{}

domain::PutObjectRequest DerivativePublisher::buildPutRequest(const domain::DerivativeArtifact& derivative,
                                                              const domain::TransformRequest& request) const {
    domain::PutObjectRequest put;
    put.key = derivative.cacheKey;
    put.bytes = derivative.bytes;
    put.contentType = derivative.contentType;
    put.cacheControl = m_cacheControl;
    put.tags = {{"transformedIn", m_region}};
    put.metadata = {
        {"original-image-key", request.sourceKey},
        {"transformations", request.operationsString},
        {"transformedIn", m_region}
    };
    return put;
}

std::optional<domain::PublishError> DerivativePublisher::publish(const domain::DerivativeArtifact& derivative,
                                                                 const domain::TransformRequest& request) const {
    std::cout << "[DerivativePublisher] Uploading transformed image to bucket/ARN '" << m_bucketId
              << "' with key '" << derivative.cacheKey << "' using endpoint '" << m_store->describe()
              << "'" << std::endl;
    try {
        m_store->put(m_bucketId, buildPutRequest(derivative, request));
    } catch (const domain::StoreError& e) {
        return domain::PublishError(domain::StoreError::KindToString(e.kind()) + " uploading '" +
                                    derivative.cacheKey + "': " + e.what());
    } catch (const std::exception& e) {
        return domain::PublishError("Unexpected error uploading '" + derivative.cacheKey + "': " + e.what());
    }
    return std::nullopt;
}

} // namespace pixelorigin::application

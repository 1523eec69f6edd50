/**
 * @file ArtifactFetcher.cpp
 * @brief Implementation of ArtifactFetcher.
 */

#include "application/ArtifactFetcher.hpp"
#include "domain/PipelineErrors.hpp"
#include <iostream>

namespace pixelorigin::application {

ArtifactFetcher::ArtifactFetcher(std::shared_ptr<domain::ObjectStore> store, std::string bucketId)
    : m_store(std::move(store)), m_bucketId(std::move(bucketId)) {}

domain::SourceArtifact ArtifactFetcher::fetch(const std::string& sourceKey) const {
    std::cout << "[ArtifactFetcher] Fetching original image '" << sourceKey << "' from bucket/ARN '"
              << m_bucketId << "' using endpoint '" << m_store->describe() << "'" << std::endl;
    try {
        auto object = m_store->get(m_bucketId, sourceKey);
        std::cout << "[ArtifactFetcher] Successfully downloaded " << sourceKey
                  << " (" << object.bytes.size() << " bytes)" << std::endl;
        domain::SourceArtifact artifact(std::move(object.bytes), std::move(object.contentType));
        if (artifact.isVector()) {
            std::cout << "[ArtifactFetcher] SVG image detected, returning as-is" << std::endl;
        }
        return artifact;
    } catch (const domain::StoreError& e) {
        throw domain::FetchError(domain::StoreError::KindToString(e.kind()) + " fetching '" +
                                 sourceKey + "': " + e.what());
    }
}

} // namespace pixelorigin::application

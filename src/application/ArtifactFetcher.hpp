/**
 * @file ArtifactFetcher.hpp
 * @brief Retrieves original images from the source store.
 */

#pragma once

#include "domain/ObjectStore.hpp"
#include "domain/SourceArtifact.hpp"
#include <memory>
#include <string>

namespace pixelorigin::application {

/**
 * @class ArtifactFetcher
 * @brief Reads the source artifact for a request. No retries.
 */
class ArtifactFetcher {
public:
    /**
     * @param store Source store client (shared across requests).
     * @param bucketId Bucket name or multi-region access point ARN.
     */
    ArtifactFetcher(std::shared_ptr<domain::ObjectStore> store, std::string bucketId);

    /**
     * @brief Downloads @p sourceKey.
     * @throws domain::FetchError on any store failure.
     */
    domain::SourceArtifact fetch(const std::string& sourceKey) const;

private:
    std::shared_ptr<domain::ObjectStore> m_store;
    std::string m_bucketId;
};

} // namespace pixelorigin::application

/**
 * @file ServiceConfig.hpp
 * @brief Process-wide configuration, built once at startup and never mutated.
 */

#pragma once

#include <string>

namespace pixelorigin::application {

/**
 * @struct ServiceConfig
 * @brief Store identifiers, cache policy and listener settings.
 *
 * Loaded by infrastructure::ConfigLoader and passed by const reference (or
 * copied) into every component that needs it.
 */
struct ServiceConfig {
    std::string originalBucket;      ///< Source bucket name.
    std::string transformedBucket;   ///< Cache bucket name; empty disables publishing.
    std::string originalMrapArn;     ///< Multi-region access point for the source bucket.
    std::string transformedMrapArn;  ///< Multi-region access point for the cache bucket.
    long long cacheTtlSeconds = 31536000;
    std::string region = "local";    ///< Provenance label sent in x-transformed-in.
    int defaultQuality = 75;
    int maxDimension = 4000;         ///< Upper bound for width/height; 0 disables it.

    std::string awsRegion = "us-east-1";
    std::string storeBackend = "filesystem"; ///< "s3" or "filesystem".
    std::string storeEndpoint;               ///< Overrides the derived S3 endpoint.
    std::string storageRoot = "./buckets";   ///< Root of the filesystem backend.

    std::string listenHost = "0.0.0.0";
    int listenPort = 8080;
    bool rewriteQueryOperations = true;

    /** @brief Access point ARN when configured, otherwise the bucket name. */
    std::string sourceBucketId() const {
        return originalMrapArn.empty() ? originalBucket : originalMrapArn;
    }

    /** @brief Access point ARN when configured, otherwise the bucket name. */
    std::string cacheBucketId() const {
        return transformedMrapArn.empty() ? transformedBucket : transformedMrapArn;
    }

    /** @brief Multi-region endpoints are used only when both ARNs are set. */
    bool usesMultiRegionEndpoints() const {
        return !originalMrapArn.empty() && !transformedMrapArn.empty();
    }

    bool publishingEnabled() const { return !transformedBucket.empty(); }

    std::string cacheControl() const { return "max-age=" + std::to_string(cacheTtlSeconds); }
};

} // namespace pixelorigin::application

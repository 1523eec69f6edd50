/**
 * @file DerivativeArtifact.hpp
 * @brief Transformed image bytes together with their cache identity.
 */

#pragma once
#include <string>

namespace pixelorigin::domain {

/**
 * @brief Builds the cache-store key of a derivative.
 *
 * The operations string is used verbatim: reordering the operations yields a
 * different key.
 */
inline std::string MakeCacheKey(const std::string& sourceKey, const std::string& operationsString) {
    return sourceKey + "/" + operationsString;
}

/**
 * @struct EncodedImage
 * @brief Output of the transform engine before it is bound to a cache key.
 */
struct EncodedImage {
    std::string bytes;
    std::string contentType;
};

/**
 * @struct DerivativeArtifact
 * @brief A derivative ready to be published and returned.
 */
struct DerivativeArtifact {
    std::string bytes;       ///< Encoded image.
    std::string contentType; ///< Resolved MIME type of @ref bytes.
    std::string cacheKey;    ///< See MakeCacheKey().
};

} // namespace pixelorigin::domain

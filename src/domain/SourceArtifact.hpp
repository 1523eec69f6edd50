/**
 * @file SourceArtifact.hpp
 * @brief Domain entity representing a source image fetched from the origin store.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>

namespace pixelorigin::domain {

/**
 * @class SourceArtifact
 * @brief Raw bytes and content-type of an original image, owned by one request.
 */
class SourceArtifact {
public:
    std::string bytes;                      ///< Fully buffered object body.
    std::optional<std::string> contentType; ///< Content-Type reported by the store, if any.

    SourceArtifact() = default;
    SourceArtifact(std::string body, std::optional<std::string> type)
        : bytes(std::move(body)), contentType(std::move(type)) {}

    /** @brief True when the store reported a vector (SVG) content-type. */
    bool isVector() const;
};

} // namespace pixelorigin::domain

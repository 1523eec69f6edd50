/**
 * @file TransformPlan.hpp
 * @brief Typed, validated view of the operations attached to a request.
 */

#pragma once

#include "domain/ImageFormat.hpp"
#include "domain/TransformRequest.hpp"
#include <optional>

namespace pixelorigin::domain {

/**
 * @struct ImageSize
 * @brief Width and height in pixels.
 */
struct ImageSize {
    int width = 0;
    int height = 0;

    bool operator==(const ImageSize& other) const {
        return width == other.width && height == other.height;
    }
};

/**
 * @struct TransformPlan
 * @brief Resolved transformation parameters.
 *
 * Built from an OperationMap by FromOperations(); malformed values are
 * treated as absent (dimensions) or replaced by the default (quality).
 */
struct TransformPlan {
    std::optional<int> targetWidth;
    std::optional<int> targetHeight;
    std::optional<ImageFormat> format; ///< Absent: keep the source's native format.
    int quality = 75;                  ///< Always within [kMinQuality, kMaxQuality].
    bool autoOrient = false;           ///< Set by the engine once EXIF orientation is known.

    static constexpr int kMinQuality = 1;
    static constexpr int kMaxQuality = 100;

    /**
     * @brief Validates raw operations into a plan.
     * @param operations Parsed key=value pairs; unknown keys are ignored.
     * @param defaultQuality Quality used when `quality` is absent or malformed.
     *
     * Dimensions are taken as given: both present means exactly that size.
     */
    static TransformPlan FromOperations(const OperationMap& operations, int defaultQuality);

    bool requestsResize() const { return targetWidth.has_value() || targetHeight.has_value(); }
};

/**
 * @brief Computes the output size for a source of size @p original.
 *
 * Both dimensions given: exactly those. One given: the other is scaled
 * linearly from the original aspect ratio and rounded. None: nullopt.
 */
std::optional<ImageSize> ResolveTargetSize(const TransformPlan& plan, const ImageSize& original);

/** @brief Parses a base-10 integer occupying the whole string. */
std::optional<int> ParseStrictInt(const std::string& text);

} // namespace pixelorigin::domain

/**
 * @file ImageFormat.hpp
 * @brief Raster output formats and the encoding traits the engine dispatches on.
 */

#pragma once

#include <optional>
#include <string>

namespace pixelorigin::domain {

/**
 * @enum ImageFormat
 * @brief Output formats the transform engine can encode.
 */
enum class ImageFormat {
    Jpeg,
    Png,
    Gif,
    Webp,
    Avif
};

/**
 * @struct FormatTraits
 * @brief Encoding properties of one output format.
 */
struct FormatTraits {
    ImageFormat format;
    const char* name;        ///< Operation value, e.g. "webp".
    const char* contentType; ///< MIME type sent to clients.
    bool supportsAlpha;      ///< False means alpha is flattened before encoding.
    bool acceptsQuality;     ///< Whether the encoder takes a quality parameter.
    bool isLossy;            ///< Lossy encoders here never carry transparency.
};

/** @brief Whether alpha must be flattened before encoding into @p traits' format. */
inline bool RequiresOpaque(const FormatTraits& traits) {
    return traits.isLossy || !traits.supportsAlpha;
}

/** @brief Returns the table entry for @p format. */
const FormatTraits& TraitsOf(ImageFormat format);

/** @brief Looks up a format by its operation name (case-sensitive). */
std::optional<ImageFormat> FormatFromName(const std::string& name);

/**
 * @brief Resolves a requested `format` operation value.
 * Unrecognized values fall back to JPEG.
 */
ImageFormat ResolveRequestedFormat(const std::string& value);

/** @brief Format used when neither the request nor the source names one. */
constexpr ImageFormat kDefaultRasterFormat = ImageFormat::Png;

/** @brief Format substituted for unrecognized `format` values. */
constexpr ImageFormat kFallbackFormat = ImageFormat::Jpeg;

} // namespace pixelorigin::domain

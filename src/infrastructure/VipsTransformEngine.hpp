/**
 * @file VipsTransformEngine.hpp
 * @brief libvips implementation of the transform engine.
 */

#pragma once
#include "domain/ImageFormat.hpp"
#include "domain/TransformEngine.hpp"
#include <vips/vips8>
#include <string>

namespace pixelorigin::infrastructure {

/**
 * @class VipsTransformEngine
 * @brief Decodes with libvips, resizes, corrects EXIF orientation and encodes.
 *
 * libvips must be initialized (VIPS_INIT) before the first call. The engine
 * holds no state; per-thread libvips caches are released after each call.
 */
class VipsTransformEngine : public domain::TransformEngine {
public:
    /** @see domain::TransformEngine::transform */
    domain::EncodedImage transform(const domain::SourceArtifact& source, const domain::TransformPlan& plan) override;

    /**
     * @brief Loads and fully decodes an image buffer.
     * @throws domain::DecodeError for unsupported or corrupt data.
     */
    static vips::VImage Decode(const std::string& bytes);

    /**
     * @brief Resize, then orientation correction.
     * Sets @p plan.autoOrient from the image's EXIF orientation.
     */
    static vips::VImage ApplyGeometry(vips::VImage image, domain::TransformPlan& plan);

    /** @brief Flattens alpha for formats without transparency and normalizes to 8-bit sRGB/B_W. */
    static vips::VImage PrepareForFormat(vips::VImage image, const domain::FormatTraits& traits);

    /** @brief Encodes into @p traits' format. Quality is passed only where accepted. */
    static std::string Encode(const vips::VImage& image, const domain::FormatTraits& traits, int quality);

    /** @brief Format of the loader that decoded @p image, or the raster default. */
    static domain::ImageFormat NativeFormat(const vips::VImage& image);

    /** @brief EXIF orientation 1-8; 1 when absent. */
    static int ExifOrientation(const vips::VImage& image);
};

} // namespace pixelorigin::infrastructure

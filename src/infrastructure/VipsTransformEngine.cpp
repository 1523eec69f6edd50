/**
 * @file VipsTransformEngine.cpp
 * @brief Implementation of VipsTransformEngine.
 */

#include "infrastructure/VipsTransformEngine.hpp"
#include "domain/PipelineErrors.hpp"
#include <iostream>
#include <vector>

namespace pixelorigin::infrastructure {

using vips::VImage;

namespace {

/// Releases libvips per-request data and threads when a transform returns or throws.
struct VipsRequestScope {
    ~VipsRequestScope() {
        vips_error_clear();
        vips_thread_shutdown();
    }
};

std::string TakeBlob(VipsBlob* blob) {
    size_t length = 0;
    const void* data = vips_blob_get(blob, &length);
    std::string bytes(static_cast<const char*>(data), length);
    vips_area_unref(reinterpret_cast<VipsArea*>(blob));
    return bytes;
}

bool StartsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string VipsMessage(const vips::VError& err) {
    const char* what = err.what();
    return (what && what[0]) ? what : "Unknown error";
}

} // namespace

VImage VipsTransformEngine::Decode(const std::string& bytes) {
    if (bytes.empty()) {
        throw domain::DecodeError("Empty image buffer");
    }
    try {
        VImage image = VImage::new_from_buffer(bytes.data(), bytes.size(), "");
        // Force pixel decoding now so truncated files fail here rather than at encode time.
        return image.copy_memory();
    } catch (const vips::VError& err) {
        throw domain::DecodeError(VipsMessage(err));
    }
}

int VipsTransformEngine::ExifOrientation(const VImage& image) {
    if (image.get_typeof(VIPS_META_ORIENTATION) == 0) return 1;
    int orientation = image.get_int(VIPS_META_ORIENTATION);
    return (orientation >= 1 && orientation <= 8) ? orientation : 1;
}

domain::ImageFormat VipsTransformEngine::NativeFormat(const VImage& image) {
    if (image.get_typeof(VIPS_META_LOADER) == 0) return domain::kDefaultRasterFormat;
    std::string loader = image.get_string(VIPS_META_LOADER);
    if (StartsWith(loader, "jpegload")) return domain::ImageFormat::Jpeg;
    if (StartsWith(loader, "pngload")) return domain::ImageFormat::Png;
    if (StartsWith(loader, "gifload")) return domain::ImageFormat::Gif;
    if (StartsWith(loader, "webpload")) return domain::ImageFormat::Webp;
    if (StartsWith(loader, "heifload")) return domain::ImageFormat::Avif;
    return domain::kDefaultRasterFormat;
}

VImage VipsTransformEngine::ApplyGeometry(VImage image, domain::TransformPlan& plan) {
    plan.autoOrient = ExifOrientation(image) != 1;

    auto target = domain::ResolveTargetSize(plan, {image.width(), image.height()});
    if (target) {
        double hscale = static_cast<double>(target->width) / image.width();
        double vscale = static_cast<double>(target->height) / image.height();

        // Premultiply so transparent pixels do not bleed into their neighbours.
        bool alpha = image.has_alpha();
        VipsBandFormat bandFormat = image.format();
        if (alpha) image = image.premultiply();
        image = image.resize(hscale, VImage::option()->set("vscale", vscale));
        if (alpha) image = image.unpremultiply().cast(bandFormat);

        // resize() rounds each axis independently; pin the exact requested size.
        if (image.width() != target->width || image.height() != target->height) {
            image = image.embed(0, 0, target->width, target->height,
                                VImage::option()->set("extend", VIPS_EXTEND_COPY));
        }
    }

    if (plan.autoOrient) {
        image = image.autorot();
    }
    return image;
}

VImage VipsTransformEngine::PrepareForFormat(VImage image, const domain::FormatTraits& traits) {
    bool flattened = false;
    if (domain::RequiresOpaque(traits) && image.has_alpha()) {
        // One background value per colour band: grey+alpha flattens onto {255}.
        std::vector<double> background(static_cast<size_t>(image.bands() - 1), 255.0);
        image = image.flatten(VImage::option()->set("background", background));
        flattened = true;
    }

    VipsInterpretation interpretation = image.interpretation();
    if (flattened || (interpretation != VIPS_INTERPRETATION_sRGB && interpretation != VIPS_INTERPRETATION_B_W)) {
        image = image.colourspace(VIPS_INTERPRETATION_sRGB);
    }
    if (image.format() != VIPS_FORMAT_UCHAR) {
        image = image.cast(VIPS_FORMAT_UCHAR);
    }
    return image;
}

std::string VipsTransformEngine::Encode(const VImage& image, const domain::FormatTraits& traits, int quality) {
    auto options = VImage::option()->set("strip", true);
    if (traits.acceptsQuality) {
        options->set("Q", quality);
    }

    switch (traits.format) {
        case domain::ImageFormat::Jpeg:
            return TakeBlob(image.jpegsave_buffer(options));
        case domain::ImageFormat::Png:
            return TakeBlob(image.pngsave_buffer(options));
        case domain::ImageFormat::Gif:
            return TakeBlob(image.gifsave_buffer(options));
        case domain::ImageFormat::Webp:
            return TakeBlob(image.webpsave_buffer(options));
        case domain::ImageFormat::Avif:
            return TakeBlob(image.heifsave_buffer(options->set("compression", VIPS_FOREIGN_HEIF_COMPRESSION_AV1)));
    }
    throw domain::EncodeError(std::string("No encoder for ") + traits.name);
}

domain::EncodedImage VipsTransformEngine::transform(const domain::SourceArtifact& source, const domain::TransformPlan& plan) {
    VipsRequestScope scope;

    VImage image = Decode(source.bytes);
    domain::TransformPlan resolved = plan;
    domain::ImageFormat nativeFormat = NativeFormat(image);

    try {
        image = ApplyGeometry(image, resolved);
        const auto& traits = domain::TraitsOf(resolved.format.value_or(nativeFormat));
        image = PrepareForFormat(image, traits);

        domain::EncodedImage encoded;
        encoded.bytes = Encode(image, traits, resolved.quality);
        encoded.contentType = traits.contentType;
        std::cout << "[VipsTransformEngine] Successfully transformed image to format: " << traits.name
                  << " (" << image.width() << "x" << image.height() << ", " << encoded.bytes.size()
                  << " bytes)" << std::endl;
        return encoded;
    } catch (const vips::VError& err) {
        throw domain::EncodeError(VipsMessage(err));
    }
}

} // namespace pixelorigin::infrastructure

/**
 * @file ImageFormat.cpp
 * @brief Format lookup table.
 */

#include "domain/ImageFormat.hpp"
#include <array>

namespace pixelorigin::domain {

namespace {
// Adding a format means adding a row here and an encoder branch in the engine.
const std::array<FormatTraits, 5> kFormatTable = {{
    {ImageFormat::Jpeg, "jpeg", "image/jpeg", false, true,  true},
    {ImageFormat::Png,  "png",  "image/png",  true,  false, false},
    {ImageFormat::Gif,  "gif",  "image/gif",  true,  false, false},
    {ImageFormat::Webp, "webp", "image/webp", false, true,  true},
    {ImageFormat::Avif, "avif", "image/avif", false, true,  true},
}};
}

const FormatTraits& TraitsOf(ImageFormat format) {
    for (const auto& traits : kFormatTable) {
        if (traits.format == format) return traits;
    }
    return kFormatTable[0];
}

std::optional<ImageFormat> FormatFromName(const std::string& name) {
    for (const auto& traits : kFormatTable) {
        if (name == traits.name) return traits.format;
    }
    return std::nullopt;
}

ImageFormat ResolveRequestedFormat(const std::string& value) {
    return FormatFromName(value).value_or(kFallbackFormat);
}

} // namespace pixelorigin::domain

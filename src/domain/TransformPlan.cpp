/**
 * @file TransformPlan.cpp
 * @brief Operation validation and resize arithmetic.
 */

#include "domain/TransformPlan.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>

namespace pixelorigin::domain {

namespace {

std::optional<int> PositiveDimension(const OperationMap& operations, const char* key) {
    auto it = operations.find(key);
    if (it == operations.end()) return std::nullopt;
    auto value = ParseStrictInt(it->second);
    if (!value || *value <= 0) return std::nullopt;
    return value;
}

int ScaleDimension(int originalOther, int given, int originalGiven) {
    double scaled = static_cast<double>(originalOther) * given / originalGiven;
    return std::max(1, static_cast<int>(std::lround(scaled)));
}

} // namespace

std::optional<int> ParseStrictInt(const std::string& text) {
    if (text.empty()) return std::nullopt;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') ++first;
    int value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

TransformPlan TransformPlan::FromOperations(const OperationMap& operations, int defaultQuality) {
    TransformPlan plan;
    plan.targetWidth = PositiveDimension(operations, "width");
    plan.targetHeight = PositiveDimension(operations, "height");

    auto format = operations.find("format");
    if (format != operations.end()) {
        plan.format = ResolveRequestedFormat(format->second);
    }

    int quality = defaultQuality;
    auto rawQuality = operations.find("quality");
    if (rawQuality != operations.end()) {
        if (auto parsed = ParseStrictInt(rawQuality->second)) quality = *parsed;
    }
    plan.quality = std::clamp(quality, kMinQuality, kMaxQuality);
    return plan;
}

std::optional<ImageSize> ResolveTargetSize(const TransformPlan& plan, const ImageSize& original) {
    if (!plan.requestsResize()) return std::nullopt;
    if (plan.targetWidth && plan.targetHeight) {
        return ImageSize{*plan.targetWidth, *plan.targetHeight};
    }
    if (original.width <= 0 || original.height <= 0) return std::nullopt;
    if (plan.targetWidth) {
        return ImageSize{*plan.targetWidth, ScaleDimension(original.height, *plan.targetWidth, original.width)};
    }
    return ImageSize{ScaleDimension(original.width, *plan.targetHeight, original.height), *plan.targetHeight};
}

} // namespace pixelorigin::domain

/**
 * @file QueryRewriter.cpp
 * @brief Implementation of QueryRewriter.
 */

#include "application/QueryRewriter.hpp"
#include "domain/TransformPlan.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace pixelorigin::application {

namespace {

const std::array<const char*, 7> kSupportedFormats = {"auto", "jpeg", "webp", "avif", "png", "svg", "gif"};

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool IsSupportedFormat(const std::string& format) {
    return std::find(kSupportedFormats.begin(), kSupportedFormats.end(), format) != kSupportedFormats.end();
}

} // namespace

QueryRewriter::QueryRewriter(int maxDimension) : m_maxDimension(maxDimension) {}

int QueryRewriter::ParsePositiveInt(const std::string& value, int max) {
    auto parsed = domain::ParseStrictInt(value);
    if (!parsed || *parsed <= 0) return 0;
    return max > 0 ? std::min(*parsed, max) : *parsed;
}

std::string QueryRewriter::NegotiateFormat(const std::string& acceptHeader) {
    if (acceptHeader.find("image/webp") != std::string::npos) return "webp";
    return "jpeg";
}

std::string QueryRewriter::rewrite(const std::string& path, const QueryParams& query, const std::string& acceptHeader) const {
    std::string format;
    int quality = 0;
    int width = 0;
    int height = 0;

    for (const auto& [name, value] : query) {
        auto operation = ToLower(name);
        if (operation == "format") {
            auto requested = ToLower(value);
            if (IsSupportedFormat(requested)) {
                format = requested == "auto" ? "" : requested;
            }
        } else if (operation == "width") {
            if (int parsed = ParsePositiveInt(value, m_maxDimension)) width = parsed;
        } else if (operation == "height") {
            if (int parsed = ParsePositiveInt(value, m_maxDimension)) height = parsed;
        } else if (operation == "quality") {
            if (int parsed = ParsePositiveInt(value, 100)) quality = parsed;
        }
    }

    if (format.empty()) format = NegotiateFormat(acceptHeader);

    std::vector<std::string> operations;
    operations.push_back("format=" + format);
    if (quality) operations.push_back("quality=" + std::to_string(quality));
    if (width) operations.push_back("width=" + std::to_string(width));
    if (height) operations.push_back("height=" + std::to_string(height));

    std::string joined;
    for (const auto& op : operations) {
        if (!joined.empty()) joined += ',';
        joined += op;
    }
    return path + "/" + joined;
}

} // namespace pixelorigin::application

/**
 * @file TransformRequest.hpp
 * @brief Value object produced by parsing a derivative request path.
 */

#pragma once
#include <map>
#include <string>

namespace pixelorigin::domain {

/// Operation name -> raw string value, e.g. {"width": "100"}.
using OperationMap = std::map<std::string, std::string>;

/**
 * @struct TransformRequest
 * @brief Identifies a source image and the operations requested on it.
 */
struct TransformRequest {
    std::string sourceKey;        ///< Object key of the original image (no leading slash).
    std::string operationsString; ///< Final path segment, kept verbatim.
    OperationMap operations;      ///< Parsed key=value pairs. Unknown keys are kept.
};

} // namespace pixelorigin::domain

/**
 * @file ResponseEnvelope.hpp
 * @brief Outward response produced for every request.
 */

#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pixelorigin::domain {

/// Stage name and its duration in milliseconds.
using StageTiming = std::pair<std::string, long long>;

struct ResponseEnvelope {
    int statusCode = 200;
    std::map<std::string, std::string> headers;
    std::string body;
    std::vector<StageTiming> timingBreakdown; ///< In execution order.
};

} // namespace pixelorigin::domain

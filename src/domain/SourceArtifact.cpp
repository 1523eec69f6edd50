/**
 * @file SourceArtifact.cpp
 * @brief Implementation of SourceArtifact.
 */

#include "domain/SourceArtifact.hpp"
#include <algorithm>
#include <cctype>

namespace pixelorigin::domain {

bool SourceArtifact::isVector() const {
    if (!contentType) return false;
    std::string lowered = *contentType;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("svg") != std::string::npos;
}

} // namespace pixelorigin::domain

/**
 * @file ResponseAssembler.hpp
 * @brief Builds success and failure envelopes.
 */

#pragma once

#include "domain/ResponseEnvelope.hpp"
#include <string>
#include <vector>

namespace pixelorigin::application {

constexpr const char* kProvenanceHeader = "x-transformed-in";
constexpr const char* kServerTimingHeader = "Server-Timing";

/**
 * @class ResponseAssembler
 * @brief Adds cache lifetime, provenance and timing headers to responses.
 */
class ResponseAssembler {
public:
    ResponseAssembler(std::string region, std::string cacheControl);

    /** @brief 200 with body, content-type, cache lifetime, provenance and Server-Timing. */
    domain::ResponseEnvelope success(std::string body,
                                     const std::string& contentType,
                                     std::vector<domain::StageTiming> timings) const;

    /**
     * @brief Error envelope: status, short text body and the provenance header only.
     * @param message Fixed client-facing text. Never pass library error detail.
     */
    domain::ResponseEnvelope failure(int statusCode, const std::string& message) const;

    /** @brief Formats `stage;dur=ms,stage;dur=ms`. */
    static std::string FormatServerTiming(const std::vector<domain::StageTiming>& timings);

private:
    std::string m_region;
    std::string m_cacheControl;
};

} // namespace pixelorigin::application

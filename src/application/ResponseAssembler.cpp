/**
 * @file ResponseAssembler.cpp
 * @brief Implementation of ResponseAssembler.
 */

#include "application/ResponseAssembler.hpp"
#include <sstream>

namespace pixelorigin::application {

ResponseAssembler::ResponseAssembler(std::string region, std::string cacheControl)
    : m_region(std::move(region)), m_cacheControl(std::move(cacheControl)) {}

domain::ResponseEnvelope ResponseAssembler::success(std::string body,
                                                    const std::string& contentType,
                                                    std::vector<domain::StageTiming> timings) const {
    domain::ResponseEnvelope envelope;
    envelope.statusCode = 200;
    envelope.body = std::move(body);
    envelope.headers["Content-Type"] = contentType;
    envelope.headers["Cache-Control"] = m_cacheControl;
    envelope.headers[kProvenanceHeader] = m_region;
    envelope.headers[kServerTimingHeader] = FormatServerTiming(timings);
    envelope.timingBreakdown = std::move(timings);
    return envelope;
}

domain::ResponseEnvelope ResponseAssembler::failure(int statusCode, const std::string& message) const {
    domain::ResponseEnvelope envelope;
    envelope.statusCode = statusCode;
    envelope.body = message;
    envelope.headers[kProvenanceHeader] = m_region;
    return envelope;
}

std::string ResponseAssembler::FormatServerTiming(const std::vector<domain::StageTiming>& timings) {
    std::ostringstream out;
    for (size_t i = 0; i < timings.size(); ++i) {
        if (i > 0) out << ',';
        out << timings[i].first << ";dur=" << timings[i].second;
    }
    return out.str();
}

} // namespace pixelorigin::application

/**
 * @file DerivativePipeline.cpp
 * @brief Implementation of DerivativePipeline.
 */

#include "application/DerivativePipeline.hpp"
#include "application/OperationParser.hpp"
#include "application/StageTimer.hpp"
#include "domain/DerivativeArtifact.hpp"
#include "domain/TransformPlan.hpp"
#include <iostream>

namespace pixelorigin::application {

namespace {
constexpr const char* kInvalidMethodMessage = "Only GET method is supported";
constexpr const char* kFetchFailedMessage = "Error downloading original image";
constexpr const char* kDecodeFailedMessage = "Error opening original image";
constexpr const char* kTransformFailedMessage = "Error transforming image";
}

DerivativePipeline::DerivativePipeline(ServiceConfig config,
                                       std::shared_ptr<domain::ObjectStore> sourceStore,
                                       std::shared_ptr<domain::ObjectStore> cacheStore,
                                       std::shared_ptr<domain::TransformEngine> engine)
    : m_config(std::move(config))
    , m_fetcher(std::move(sourceStore), m_config.sourceBucketId())
    , m_engine(std::move(engine))
    , m_assembler(m_config.region, m_config.cacheControl())
{
    if (m_config.publishingEnabled() && cacheStore) {
        m_publisher.emplace(std::move(cacheStore), m_config.cacheBucketId(),
                            m_config.region, m_config.cacheControl());
    }
}

domain::ResponseEnvelope DerivativePipeline::fail(int statusCode, const std::string& message,
                                                  const domain::PipelineError& error) const {
    std::cerr << "[DerivativePipeline] " << message << " - "
              << domain::StageToString(error.stage()) << " error: " << error.what() << std::endl;
    return m_assembler.failure(statusCode, message);
}

domain::ResponseEnvelope DerivativePipeline::handle(const std::string& method, const std::string& path) const {
    domain::TransformRequest request;
    try {
        request = OperationParser::Parse(method, path);
    } catch (const domain::InvalidRequestError& e) {
        return fail(400, kInvalidMethodMessage, e);
    }

    std::vector<domain::StageTiming> timings;
    StageTimer timer;

    domain::SourceArtifact source;
    try {
        source = m_fetcher.fetch(request.sourceKey);
    } catch (const domain::FetchError& e) {
        return fail(500, kFetchFailedMessage, e);
    }
    timings.emplace_back("img-download", timer.elapsedMs());

    if (source.isVector()) {
        std::string contentType = *source.contentType;
        return m_assembler.success(std::move(source.bytes), contentType, std::move(timings));
    }

    timer.restart();
    auto plan = domain::TransformPlan::FromOperations(request.operations, m_config.defaultQuality);
    domain::EncodedImage encoded;
    try {
        encoded = m_engine->transform(source, plan);
    } catch (const domain::DecodeError& e) {
        return fail(500, kDecodeFailedMessage, e);
    } catch (const domain::EncodeError& e) {
        return fail(500, kTransformFailedMessage, e);
    }
    timings.emplace_back("img-transform", timer.elapsedMs());

    domain::DerivativeArtifact derivative{
        std::move(encoded.bytes),
        encoded.contentType,
        domain::MakeCacheKey(request.sourceKey, request.operationsString)
    };

    if (m_publisher) {
        timer.restart();
        if (auto error = m_publisher->publish(derivative, request)) {
            std::cerr << "[DerivativePipeline] Could not upload transformed image - Error: "
                      << error->what() << std::endl;
        } else {
            timings.emplace_back("img-upload", timer.elapsedMs());
        }
    }

    return m_assembler.success(std::move(derivative.bytes), derivative.contentType, std::move(timings));
}

} // namespace pixelorigin::application

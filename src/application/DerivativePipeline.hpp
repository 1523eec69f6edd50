/**
 * @file DerivativePipeline.hpp
 * @brief Request handler: parse, fetch, transform, publish, respond.
 */

#pragma once

#include "application/ArtifactFetcher.hpp"
#include "application/DerivativePublisher.hpp"
#include "application/ResponseAssembler.hpp"
#include "application/ServiceConfig.hpp"
#include "domain/ObjectStore.hpp"
#include "domain/PipelineErrors.hpp"
#include "domain/ResponseEnvelope.hpp"
#include "domain/TransformEngine.hpp"
#include <memory>
#include <optional>
#include <string>

namespace pixelorigin::application {

/**
 * @class DerivativePipeline
 * @brief Runs one request end to end on the calling thread.
 *
 * Holds no mutable state, so a single instance serves all request threads.
 */
class DerivativePipeline {
public:
    /**
     * @param config Immutable service configuration.
     * @param sourceStore Store holding original images.
     * @param cacheStore Store receiving derivatives; may be null.
     * @param engine Raster transform backend.
     */
    DerivativePipeline(ServiceConfig config,
                       std::shared_ptr<domain::ObjectStore> sourceStore,
                       std::shared_ptr<domain::ObjectStore> cacheStore,
                       std::shared_ptr<domain::TransformEngine> engine);

    /** @brief Handles a request. Never throws for pipeline failures. */
    domain::ResponseEnvelope handle(const std::string& method, const std::string& path) const;

    const ServiceConfig& config() const { return m_config; }

private:
    domain::ResponseEnvelope fail(int statusCode, const std::string& message,
                                  const domain::PipelineError& error) const;

    ServiceConfig m_config;
    ArtifactFetcher m_fetcher;
    std::shared_ptr<domain::TransformEngine> m_engine;
    std::optional<DerivativePublisher> m_publisher;
    ResponseAssembler m_assembler;
};

} // namespace pixelorigin::application

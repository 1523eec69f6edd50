/**
 * @file TransformEngine.hpp
 * @brief Interface for decoding, transforming and re-encoding raster images.
 */

#pragma once
#include "domain/DerivativeArtifact.hpp"
#include "domain/SourceArtifact.hpp"
#include "domain/TransformPlan.hpp"

namespace pixelorigin::domain {

/**
 * @class TransformEngine
 * @brief Abstract image backend used by the pipeline.
 */
class TransformEngine {
public:
    virtual ~TransformEngine() = default;

    /**
     * @brief Applies @p plan to a raster source.
     * @throws DecodeError if the bytes are not a supported raster format.
     * @throws EncodeError if resizing or encoding fails.
     */
    virtual EncodedImage transform(const SourceArtifact& source, const TransformPlan& plan) = 0;
};

} // namespace pixelorigin::domain

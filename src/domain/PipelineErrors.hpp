/**
 * @file PipelineErrors.hpp
 * @brief Tagged error types raised by each stage of the derivative pipeline.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace pixelorigin::domain {

/**
 * @enum PipelineStage
 * @brief Stage that produced an error.
 */
enum class PipelineStage {
    Request,
    Fetch,
    Decode,
    Encode,
    Publish
};

inline std::string StageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Request: return "Request";
        case PipelineStage::Fetch: return "Fetch";
        case PipelineStage::Decode: return "Decode";
        case PipelineStage::Encode: return "Encode";
        case PipelineStage::Publish: return "Publish";
        default: return "Unknown";
    }
}

/**
 * @class PipelineError
 * @brief Base of all stage errors. what() holds internal detail for logs only.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(PipelineStage stage, const std::string& detail)
        : std::runtime_error(detail), m_stage(stage) {}

    PipelineStage stage() const { return m_stage; }

private:
    PipelineStage m_stage;
};

/** @brief The request was rejected before any store access (non-GET method). */
class InvalidRequestError : public PipelineError {
public:
    explicit InvalidRequestError(const std::string& detail)
        : PipelineError(PipelineStage::Request, detail) {}
};

/** @brief The source store could not deliver the original image. */
class FetchError : public PipelineError {
public:
    explicit FetchError(const std::string& detail)
        : PipelineError(PipelineStage::Fetch, detail) {}
};

/** @brief The source bytes are not a supported raster image. */
class DecodeError : public PipelineError {
public:
    explicit DecodeError(const std::string& detail)
        : PipelineError(PipelineStage::Decode, detail) {}
};

/** @brief Resizing or encoding into the target format failed. */
class EncodeError : public PipelineError {
public:
    explicit EncodeError(const std::string& detail)
        : PipelineError(PipelineStage::Encode, detail) {}
};

/** @brief The cache store rejected the derivative. Never surfaced to clients. */
class PublishError : public PipelineError {
public:
    explicit PublishError(const std::string& detail)
        : PipelineError(PipelineStage::Publish, detail) {}
};

} // namespace pixelorigin::domain

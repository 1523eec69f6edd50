/**
 * @file OperationParser.hpp
 * @brief Turns a request path into a TransformRequest.
 */

#pragma once

#include "domain/TransformRequest.hpp"
#include <string>

namespace pixelorigin::application {

/**
 * @class OperationParser
 * @brief Stateless parser for `/<source-key>/<operations>` paths.
 */
class OperationParser {
public:
    /**
     * @brief Parses a request.
     * @param method HTTP method; anything but GET is rejected.
     * @param path Request path, e.g. `/images/rio/1.png/format=jpeg,width=100`.
     * @throws domain::InvalidRequestError if @p method is not GET.
     */
    static domain::TransformRequest Parse(const std::string& method, const std::string& path);

    /**
     * @brief Splits `k=v,k=v` into a map. Pairs without '=' are dropped and a
     * repeated key keeps its last value.
     */
    static domain::OperationMap ParseOperations(const std::string& operationsString);
};

} // namespace pixelorigin::application

/**
 * @file OperationParser.cpp
 * @brief Implementation of OperationParser.
 */

#include "application/OperationParser.hpp"
#include "domain/PipelineErrors.hpp"
#include <sstream>
#include <vector>

namespace pixelorigin::application {

namespace {

std::vector<std::string> Split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

domain::TransformRequest OperationParser::Parse(const std::string& method, const std::string& path) {
    if (method != "GET") {
        throw domain::InvalidRequestError("Unsupported method: " + method);
    }

    auto segments = Split(path, '/');
    domain::TransformRequest request;
    request.operationsString = segments.back();
    segments.pop_back();

    if (!segments.empty() && segments.front().empty()) {
        segments.erase(segments.begin());
    }

    std::ostringstream key;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) key << '/';
        key << segments[i];
    }
    request.sourceKey = key.str();
    request.operations = ParseOperations(request.operationsString);
    return request;
}

domain::OperationMap OperationParser::ParseOperations(const std::string& operationsString) {
    domain::OperationMap operations;
    for (const auto& pair : Split(operationsString, ',')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) continue;
        operations[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return operations;
}

} // namespace pixelorigin::application

/**
 * @file QueryRewriter.hpp
 * @brief Normalizes query-string operations into a path operations segment.
 *
 * Lets clients request `/images/a.jpg?format=webp&width=300` and negotiates
 * the format from the Accept header when none (or `auto`) is given. The
 * emitted order is fixed so equivalent queries share one cache key.
 */

#pragma once

#include <map>
#include <string>

namespace pixelorigin::application {

class QueryRewriter {
public:
    using QueryParams = std::multimap<std::string, std::string>;

    explicit QueryRewriter(int maxDimension);

    /**
     * @brief Returns `path + "/" + operations` built from @p query.
     * Unsupported keys and invalid values are dropped.
     */
    std::string rewrite(const std::string& path, const QueryParams& query, const std::string& acceptHeader) const;

    /** @brief `webp` when the Accept header lists image/webp, else `jpeg`. */
    static std::string NegotiateFormat(const std::string& acceptHeader);

    /** @brief Positive integer clamped to @p max (0 = no bound). Returns 0 when invalid. */
    static int ParsePositiveInt(const std::string& value, int max);

private:
    int m_maxDimension;
};

} // namespace pixelorigin::application

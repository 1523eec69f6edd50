// StoreRouting Header
#pragma once
#include <string>

namespace pixelorigin::infrastructure {

/**
 * @brief Endpoint derivation for S3-compatible stores.
 *
 * Multi-region access points are addressed through a global host built from
 * the alias at the end of the ARN.
 */
class StoreRouting {
public:
    /** @brief `arn:aws:s3::123:accesspoint/abc.mrap` -> `abc.mrap`. */
    static std::string MrapAlias(const std::string& mrapArn);

    /** @brief `https://<alias>.accesspoint.s3-global.amazonaws.com`. */
    static std::string MrapEndpoint(const std::string& mrapArn);

    /** @brief `https://s3.<region>.amazonaws.com`. */
    static std::string RegionalEndpoint(const std::string& awsRegion);

    /** @brief Percent-encodes an object key, leaving '/' intact. */
    static std::string EncodeKey(const std::string& key);

    /** @brief Percent-encodes a query/tag component ('/' included). */
    static std::string EncodeComponent(const std::string& value);

    /**
     * @brief Makes @p value safe as an HTTP header value.
     * Control characters, non-ASCII bytes and '%' are percent-encoded; other
     * printable ASCII is kept.
     */
    static std::string EncodeHeaderValue(const std::string& value);
};

} // namespace pixelorigin::infrastructure

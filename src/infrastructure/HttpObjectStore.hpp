/**
 * @file HttpObjectStore.hpp
 * @brief S3-compatible object store client over plain HTTP(S).
 */

#pragma once
#include "domain/ObjectStore.hpp"
#include <string>
#include <utility>
#include <vector>

namespace pixelorigin::infrastructure {

/**
 * @class HttpObjectStore
 * @brief Implements ObjectStore with GET/PUT requests against an S3-style endpoint.
 *
 * Request signing is left to a fronting proxy or a pre-authorized endpoint.
 * A new connection is opened per call, so one instance is shared freely
 * across request threads.
 */
class HttpObjectStore : public domain::ObjectStore {
public:
    enum class Addressing {
        PathStyle,   ///< `/<bucket>/<key>` on a regional or custom endpoint.
        AccessPoint  ///< `/<key>`; the endpoint host already names the access point.
    };

    /**
     * @param endpoint Scheme, host and optional port, e.g. `https://s3.eu-west-1.amazonaws.com`.
     * @param addressing How the bucket is encoded into the request.
     * @param timeoutSeconds Connect/read/write timeout.
     */
    HttpObjectStore(std::string endpoint, Addressing addressing, int timeoutSeconds = 30);

    /** @brief GET the object. @see domain::ObjectStore::get */
    domain::StoredObject get(const std::string& bucket, const std::string& key) override;

    /** @brief PUT with Cache-Control, x-amz-tagging and x-amz-meta-* headers. @see domain::ObjectStore::put */
    void put(const std::string& bucket, const domain::PutObjectRequest& request) override;

    std::string describe() const override { return m_endpoint; }

    /** @brief Request path for @p key in @p bucket. */
    std::string objectPath(const std::string& bucket, const std::string& key) const;

    /**
     * @brief Headers sent with a PUT (content-type excluded).
     * Metadata values are header-encoded since they carry request-derived text.
     */
    static std::vector<std::pair<std::string, std::string>> PutHeaders(const domain::PutObjectRequest& request);

private:
    std::string m_endpoint;
    Addressing m_addressing;
    int m_timeoutSeconds;
};

} // namespace pixelorigin::infrastructure

#include "infrastructure/HttpObjectStore.hpp"
#include "infrastructure/StoreRouting.hpp"
#include <httplib.h>

namespace pixelorigin::infrastructure {

using domain::StoreError;

namespace {

StoreError ErrorForStatus(int status, const std::string& what) {
    if (status == 404) return StoreError(StoreError::Kind::NotFound, what + ": HTTP 404");
    if (status == 403) return StoreError(StoreError::Kind::AccessDenied, what + ": HTTP 403");
    return StoreError(StoreError::Kind::Transport, what + ": HTTP " + std::to_string(status));
}

} // namespace

HttpObjectStore::HttpObjectStore(std::string endpoint, Addressing addressing, int timeoutSeconds)
    : m_endpoint(std::move(endpoint)), m_addressing(addressing), m_timeoutSeconds(timeoutSeconds) {}

std::string HttpObjectStore::objectPath(const std::string& bucket, const std::string& key) const {
    if (m_addressing == Addressing::AccessPoint) {
        return "/" + StoreRouting::EncodeKey(key);
    }
    return "/" + StoreRouting::EncodeComponent(bucket) + "/" + StoreRouting::EncodeKey(key);
}

std::vector<std::pair<std::string, std::string>> HttpObjectStore::PutHeaders(const domain::PutObjectRequest& request) {
    std::vector<std::pair<std::string, std::string>> headers;
    headers.emplace_back("Cache-Control", StoreRouting::EncodeHeaderValue(request.cacheControl));

    std::string tagging;
    for (const auto& [name, value] : request.tags) {
        if (!tagging.empty()) tagging += '&';
        tagging += StoreRouting::EncodeComponent(name) + "=" + StoreRouting::EncodeComponent(value);
    }
    if (!tagging.empty()) headers.emplace_back("x-amz-tagging", tagging);

    for (const auto& [name, value] : request.metadata) {
        headers.emplace_back("x-amz-meta-" + StoreRouting::EncodeComponent(name),
                             StoreRouting::EncodeHeaderValue(value));
    }
    return headers;
}

domain::StoredObject HttpObjectStore::get(const std::string& bucket, const std::string& key) {
    httplib::Client cli(m_endpoint);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    auto res = cli.Get(objectPath(bucket, key));
    if (!res) {
        throw StoreError(StoreError::Kind::Transport,
                         "GET " + key + " connection failed: " + std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200) {
        throw ErrorForStatus(res->status, "GET " + key);
    }

    domain::StoredObject object;
    object.bytes = std::move(res->body);
    if (res->has_header("Content-Type")) {
        object.contentType = res->get_header_value("Content-Type");
    }
    return object;
}

void HttpObjectStore::put(const std::string& bucket, const domain::PutObjectRequest& request) {
    httplib::Client cli(m_endpoint);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_write_timeout(m_timeoutSeconds);

    httplib::Headers headers;
    for (auto& [name, value] : PutHeaders(request)) {
        headers.emplace(std::move(name), std::move(value));
    }

    auto res = cli.Put(objectPath(bucket, request.key), headers, request.bytes, request.contentType);
    if (!res) {
        throw StoreError(StoreError::Kind::Transport,
                         "PUT " + request.key + " connection failed: " + std::to_string(static_cast<int>(res.error())));
    }
    if (res->status != 200 && res->status != 201 && res->status != 204) {
        throw ErrorForStatus(res->status, "PUT " + request.key);
    }
}

} // namespace pixelorigin::infrastructure

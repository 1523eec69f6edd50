/**
 * @file ObjectStore.hpp
 * @brief Interface for the S3-compatible stores holding originals and derivatives.
 */

#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace pixelorigin::domain {

/**
 * @struct StoredObject
 * @brief Body and content-type returned by ObjectStore::get().
 */
struct StoredObject {
    std::string bytes;
    std::optional<std::string> contentType;
};

/**
 * @struct PutObjectRequest
 * @brief Everything written alongside an object body.
 */
struct PutObjectRequest {
    std::string key;
    std::string bytes;
    std::string contentType;
    std::string cacheControl;
    std::map<std::string, std::string> tags;
    std::map<std::string, std::string> metadata;
};

/**
 * @class StoreError
 * @brief Failure reported by a store adapter.
 */
class StoreError : public std::runtime_error {
public:
    enum class Kind { NotFound, AccessDenied, Transport, Io };

    StoreError(Kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

    static std::string KindToString(Kind kind) {
        switch (kind) {
            case Kind::NotFound: return "NotFound";
            case Kind::AccessDenied: return "AccessDenied";
            case Kind::Transport: return "Transport";
            case Kind::Io: return "Io";
        }
        return "Io";
    }

private:
    Kind m_kind;
};

/**
 * @class ObjectStore
 * @brief Abstract get/put contract over a bucket-addressed object store.
 *
 * @p bucket is either a bucket name or a multi-region access point ARN.
 * Implementations must be safe to call from several request threads.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Reads an object.
     * @throws StoreError on any failure, including a missing key.
     */
    virtual StoredObject get(const std::string& bucket, const std::string& key) = 0;

    /**
     * @brief Writes an object atomically; the last writer wins.
     * @throws StoreError on any failure.
     */
    virtual void put(const std::string& bucket, const PutObjectRequest& request) = 0;

    /** @brief Human-readable endpoint, for logs. */
    virtual std::string describe() const = 0;
};

} // namespace pixelorigin::domain

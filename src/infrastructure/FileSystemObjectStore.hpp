/**
 * @file FileSystemObjectStore.hpp
 * @brief Directory-backed ObjectStore for local development and tests.
 */

#pragma once
#include "domain/ObjectStore.hpp"
#include <filesystem>
#include <string>

namespace pixelorigin::infrastructure {

/**
 * @class FileSystemObjectStore
 * @brief Maps `bucket/key` onto `root/<bucket>/<key>`.
 *
 * Object attributes (content-type, cache-control, tags, metadata) live in a
 * JSON sidecar `<key>.meta.json`. Writes go through a temp file followed by
 * a rename so readers never see a partial object.
 */
class FileSystemObjectStore : public domain::ObjectStore {
public:
    explicit FileSystemObjectStore(const std::string& root);

    /** @brief Reads the object and its sidecar. @see domain::ObjectStore::get */
    domain::StoredObject get(const std::string& bucket, const std::string& key) override;

    /** @brief Atomically writes object and sidecar. @see domain::ObjectStore::put */
    void put(const std::string& bucket, const domain::PutObjectRequest& request) override;

    std::string describe() const override { return "file://" + m_root.string(); }

    /** @brief Filesystem location of an object. @throws domain::StoreError for keys escaping the bucket. */
    std::filesystem::path objectPath(const std::string& bucket, const std::string& key) const;

    /** @brief Content-type inferred from the key's extension, used when no sidecar exists. */
    static std::string GuessContentType(const std::string& key);

private:
    void writeAtomically(const std::filesystem::path& finalPath, const std::string& content) const;

    std::filesystem::path m_root;
};

} // namespace pixelorigin::infrastructure

/**
 * @file FileSystemObjectStore.cpp
 * @brief Implementation of FileSystemObjectStore.
 */

#include "infrastructure/FileSystemObjectStore.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

namespace pixelorigin::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;
using domain::StoreError;

namespace {

const char* kSidecarSuffix = ".meta.json";

std::string BucketDirectory(const std::string& bucket) {
    // ARNs contain ':' and '/', neither of which may name a single directory.
    std::string dir = bucket;
    std::replace(dir.begin(), dir.end(), '/', '_');
    std::replace(dir.begin(), dir.end(), ':', '_');
    return dir;
}

fs::path SidecarPath(const fs::path& objectPath) {
    fs::path sidecar = objectPath;
    sidecar += kSidecarSuffix;
    return sidecar;
}

} // namespace

FileSystemObjectStore::FileSystemObjectStore(const std::string& root) : m_root(root) {}

fs::path FileSystemObjectStore::objectPath(const std::string& bucket, const std::string& key) const {
    if (bucket.empty() || key.empty()) {
        throw StoreError(StoreError::Kind::NotFound, "Empty bucket or key");
    }
    fs::path relative = fs::path(key).lexically_normal();
    if (relative.is_absolute() || (!relative.empty() && *relative.begin() == "..")) {
        throw StoreError(StoreError::Kind::AccessDenied, "Key escapes bucket: " + key);
    }
    return m_root / BucketDirectory(bucket) / relative;
}

std::string FileSystemObjectStore::GuessContentType(const std::string& key) {
    static const std::map<std::string, std::string> kByExtension = {
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"},
        {".gif", "image/gif"}, {".webp", "image/webp"}, {".avif", "image/avif"},
        {".svg", "image/svg+xml"}
    };
    std::string ext = fs::path(key).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kByExtension.find(ext);
    return it != kByExtension.end() ? it->second : "application/octet-stream";
}

domain::StoredObject FileSystemObjectStore::get(const std::string& bucket, const std::string& key) {
    fs::path path = objectPath(bucket, key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw StoreError(StoreError::Kind::NotFound, "No such key: " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StoreError(StoreError::Kind::AccessDenied, "Cannot open: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    domain::StoredObject object;
    object.bytes = buffer.str();
    object.contentType = GuessContentType(key);

    fs::path sidecar = SidecarPath(path);
    if (fs::exists(sidecar, ec)) {
        try {
            std::ifstream f(sidecar);
            json j;
            f >> j;
            if (j.contains("contentType")) {
                object.contentType = j["contentType"].get<std::string>();
            }
        } catch (const json::exception& e) {
            throw StoreError(StoreError::Kind::Io, "Corrupt sidecar " + sidecar.string() + ": " + e.what());
        }
    }
    return object;
}

void FileSystemObjectStore::put(const std::string& bucket, const domain::PutObjectRequest& request) {
    fs::path path = objectPath(bucket, request.key);

    json sidecar = {
        {"contentType", request.contentType},
        {"cacheControl", request.cacheControl},
        {"tags", request.tags},
        {"metadata", request.metadata}
    };

    // Keys come from percent-decoded paths and may hold invalid UTF-8.
    std::string sidecarText;
    try {
        sidecarText = sidecar.dump(4, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        throw StoreError(StoreError::Kind::Io, "Cannot serialize sidecar for " + request.key + ": " + e.what());
    }

    // Sidecar first: a reader that finds the object always finds its attributes.
    writeAtomically(SidecarPath(path), sidecarText);
    writeAtomically(path, request.bytes);
}

void FileSystemObjectStore::writeAtomically(const fs::path& finalPath, const std::string& content) const {
    // Unique per writer so concurrent puts of one key never share a temp file.
    std::ostringstream suffix;
    suffix << "." << std::chrono::steady_clock::now().time_since_epoch().count()
           << "." << std::this_thread::get_id() << ".tmp";
    fs::path tempPath = finalPath;
    tempPath += suffix.str();

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw StoreError(StoreError::Kind::Io, "Error creating directories: " + ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            throw StoreError(StoreError::Kind::Io, "Failed to open temp file: " + tempPath.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw StoreError(StoreError::Kind::Io, "Write failed: " + tempPath.string());
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw StoreError(StoreError::Kind::Io, "Rename failed: " + ec.message());
    }
}

} // namespace pixelorigin::infrastructure

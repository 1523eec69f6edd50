#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "infrastructure/FileSystemObjectStore.hpp"
#include "infrastructure/HttpObjectStore.hpp"
#include "infrastructure/ObjectStoreFactory.hpp"
#include "infrastructure/StoreRouting.hpp"

using namespace pixelorigin;
using namespace pixelorigin::infrastructure;
using domain::StoreError;
namespace fs = std::filesystem;

namespace {

StoreError::Kind KindOfGet(FileSystemObjectStore& store, const std::string& bucket, const std::string& key) {
    try {
        store.get(bucket, key);
    } catch (const StoreError& e) {
        return e.kind();
    }
    throw std::logic_error("expected StoreError for " + key);
}

void TestPutGet(const fs::path& root) {
    FileSystemObjectStore store(root.string());

    domain::PutObjectRequest request;
    request.key = "images/rio/1.jpeg/format=webp,width=100";
    request.bytes = std::string("RIFF\0\0WEBP", 10);
    request.contentType = "image/webp";
    request.cacheControl = "max-age=60";
    request.tags = {{"transformedIn", "eu-west-1"}};
    request.metadata = {{"original-image-key", "images/rio/1.jpeg"}};
    store.put("derivatives", request);

    auto object = store.get("derivatives", request.key);
    assert(object.bytes == request.bytes);
    assert(object.contentType && *object.contentType == "image/webp");

    fs::path sidecarPath = store.objectPath("derivatives", request.key);
    sidecarPath += ".meta.json";
    std::ifstream in(sidecarPath);
    auto sidecar = nlohmann::json::parse(in);
    assert(sidecar["cacheControl"] == "max-age=60");
    assert(sidecar["tags"]["transformedIn"] == "eu-west-1");
    assert(sidecar["metadata"]["original-image-key"] == "images/rio/1.jpeg");

    // Overwrite leaves no temp files behind.
    request.bytes = "second";
    store.put("derivatives", request);
    assert(store.get("derivatives", request.key).bytes == "second");
    for (const auto& entry : fs::directory_iterator(store.objectPath("derivatives", request.key).parent_path())) {
        assert(entry.path().extension() != ".tmp");
    }
    std::cout << "[PASS] put/get with sidecar" << std::endl;
}

void TestSourceWithoutSidecar(const fs::path& root) {
    FileSystemObjectStore store(root.string());
    fs::path path = store.objectPath("originals", "photos/a.PNG");
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << "png-bytes";

    auto object = store.get("originals", "photos/a.PNG");
    assert(object.bytes == "png-bytes");
    assert(*object.contentType == "image/png");
    std::cout << "[PASS] content type guessed from extension" << std::endl;
}

void TestErrors(const fs::path& root) {
    FileSystemObjectStore store(root.string());
    assert(KindOfGet(store, "originals", "missing.jpg") == StoreError::Kind::NotFound);
    assert(KindOfGet(store, "originals", "../derivatives/x.jpg") == StoreError::Kind::AccessDenied);
    assert(KindOfGet(store, "originals", "a/../../x.jpg") == StoreError::Kind::AccessDenied);
    assert(KindOfGet(store, "originals", "/etc/passwd") == StoreError::Kind::AccessDenied);
    std::cout << "[PASS] not found and traversal" << std::endl;
}

void TestBucketDirectory(const fs::path& root) {
    FileSystemObjectStore store(root.string());
    auto path = store.objectPath("arn:aws:s3::123:accesspoint/abc.mrap", "k.jpg");
    assert(path == root / "arn_aws_s3__123_accesspoint_abc.mrap" / "k.jpg");

    assert(FileSystemObjectStore::GuessContentType("a/b.JPG") == "image/jpeg");
    assert(FileSystemObjectStore::GuessContentType("logo.svg") == "image/svg+xml");
    assert(FileSystemObjectStore::GuessContentType("noext") == "application/octet-stream");
    std::cout << "[PASS] bucket directory naming" << std::endl;
}

void TestRouting() {
    const std::string arn = "arn:aws:s3::123456789012:accesspoint/mfzwi23gnjvgw.mrap";
    assert(StoreRouting::MrapAlias(arn) == "mfzwi23gnjvgw.mrap");
    assert(StoreRouting::MrapEndpoint(arn) == "https://mfzwi23gnjvgw.mrap.accesspoint.s3-global.amazonaws.com");
    assert(StoreRouting::RegionalEndpoint("eu-west-1") == "https://s3.eu-west-1.amazonaws.com");
    assert(StoreRouting::EncodeKey("a b/c=d,e") == "a%20b/c%3Dd%2Ce");
    assert(StoreRouting::EncodeComponent("a/b") == "a%2Fb");

    HttpObjectStore pathStyle("http://localhost:9000", HttpObjectStore::Addressing::PathStyle);
    assert(pathStyle.objectPath("originals", "images/1.jpg") == "/originals/images/1.jpg");

    HttpObjectStore accessPoint(StoreRouting::MrapEndpoint(arn), HttpObjectStore::Addressing::AccessPoint);
    assert(accessPoint.objectPath(arn, "images/1.jpg/width=10") == "/images/1.jpg/width%3D10");
    std::cout << "[PASS] endpoint routing" << std::endl;
}

void TestPutHeadersAreSafe() {
    domain::PutObjectRequest request;
    request.key = "images/a.png/width=1\r\nX-Evil: 1";
    request.cacheControl = "max-age=60";
    request.tags = {{"transformedIn", "eu west/1"}};
    request.metadata = {
        {"original-image-key", "images/caf\xC3\xA9.png"},
        {"transformations", "width=1\r\nX-Evil: 1"},
        {"transformedIn", "eu-west-1"}
    };

    std::map<std::string, std::string> headers;
    for (const auto& [name, value] : HttpObjectStore::PutHeaders(request)) {
        for (unsigned char c : name + value) {
            assert(c >= 0x20 && c < 0x7F);
        }
        headers[name] = value;
    }
    assert(headers.count("X-Evil") == 0);
    assert(headers.at("Cache-Control") == "max-age=60");
    assert(headers.at("x-amz-tagging") == "transformedIn=eu%20west%2F1");
    assert(headers.at("x-amz-meta-transformations") == "width=1%0D%0AX-Evil: 1");
    assert(headers.at("x-amz-meta-original-image-key") == "images/caf%C3%A9.png");
    assert(headers.at("x-amz-meta-transformedIn") == "eu-west-1");
    assert(StoreRouting::EncodeHeaderValue("100%") == "100%25");
    std::cout << "[PASS] put headers carry no raw control or non-ASCII bytes" << std::endl;
}

void TestFactory(const fs::path& root) {
    application::ServiceConfig config;
    config.storageRoot = root.string();
    auto local = ObjectStoreFactory::Build(config);
    assert(local.source == local.cache);
    assert(local.source->describe() == "file://" + root.string());

    config.storeBackend = "s3";
    config.awsRegion = "eu-west-1";
    auto regional = ObjectStoreFactory::Build(config);
    assert(regional.source->describe() == "https://s3.eu-west-1.amazonaws.com");

    config.originalMrapArn = "arn:aws:s3::1:accesspoint/src.mrap";
    config.transformedMrapArn = "arn:aws:s3::1:accesspoint/dst.mrap";
    auto mrap = ObjectStoreFactory::Build(config);
    assert(mrap.source->describe() == "https://src.mrap.accesspoint.s3-global.amazonaws.com");
    assert(mrap.cache->describe() == "https://dst.mrap.accesspoint.s3-global.amazonaws.com");

    config.storeEndpoint = "http://minio:9000";
    auto custom = ObjectStoreFactory::Build(config);
    assert(custom.source->describe() == "http://minio:9000");

    config.storeBackend = "ftp";
    bool threw = false;
    try {
        ObjectStoreFactory::Build(config);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] store factory" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting FileSystemObjectStore Test..." << std::endl;
    fs::path root = fs::temp_directory_path() / "pixelorigin_store_test";
    fs::remove_all(root);

    TestPutGet(root);
    TestSourceWithoutSidecar(root);
    TestErrors(root);
    TestBucketDirectory(root);
    TestRouting();
    TestPutHeadersAreSafe();
    TestFactory(root);

    fs::remove_all(root);
    std::cout << "[PASS] FileSystemObjectStore Test." << std::endl;
    return 0;
}

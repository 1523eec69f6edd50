/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/TransformPlan.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace pixelorigin::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

const char* GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

void EnvString(const char* name, std::string& target) {
    if (const char* value = GetEnv(name)) target = value;
}

template <typename T>
void EnvNumber(const char* name, T& target) {
    const char* value = GetEnv(name);
    if (!value) return;
    auto parsed = domain::ParseStrictInt(value);
    if (!parsed) {
        std::cerr << "[ConfigLoader] Ignoring malformed " << name << "='" << value << "'" << std::endl;
        return;
    }
    target = static_cast<T>(*parsed);
}

} // namespace

void ConfigLoader::ApplyJson(const json& j, application::ServiceConfig& config) {
    ReadKey(j, "originalImageBucketName", config.originalBucket);
    ReadKey(j, "transformedImageBucketName", config.transformedBucket);
    ReadKey(j, "originalBucketMRAPArn", config.originalMrapArn);
    ReadKey(j, "transformedBucketMRAPArn", config.transformedMrapArn);
    ReadKey(j, "transformedImageCacheTTL", config.cacheTtlSeconds);
    ReadKey(j, "transformedRegion", config.region);
    ReadKey(j, "defaultImageQuality", config.defaultQuality);
    ReadKey(j, "maxDimension", config.maxDimension);
    ReadKey(j, "awsRegion", config.awsRegion);
    ReadKey(j, "storeBackend", config.storeBackend);
    ReadKey(j, "storeEndpoint", config.storeEndpoint);
    ReadKey(j, "storageRoot", config.storageRoot);
    ReadKey(j, "listenHost", config.listenHost);
    ReadKey(j, "listenPort", config.listenPort);
    ReadKey(j, "rewriteQueryOperations", config.rewriteQueryOperations);
}

void ConfigLoader::ApplyEnvironment(application::ServiceConfig& config) {
    EnvString("originalImageBucketName", config.originalBucket);
    EnvString("transformedImageBucketName", config.transformedBucket);
    EnvString("originalBucketMRAPArn", config.originalMrapArn);
    EnvString("transformedBucketMRAPArn", config.transformedMrapArn);
    EnvNumber("transformedImageCacheTTL", config.cacheTtlSeconds);
    EnvString("transformedRegion", config.region);
    EnvNumber("defaultImageQuality", config.defaultQuality);
    EnvNumber("maxDimension", config.maxDimension);
    EnvString("AWS_REGION", config.awsRegion);
    EnvString("storeBackend", config.storeBackend);
    EnvString("storeEndpoint", config.storeEndpoint);
    EnvString("storageRoot", config.storageRoot);
    EnvString("listenHost", config.listenHost);
    EnvNumber("listenPort", config.listenPort);
}

application::ServiceConfig ConfigLoader::Load(const std::string& settingsPath) {
    application::ServiceConfig config;

    std::filesystem::path configPath = settingsPath;
    if (!settingsPath.empty() && std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            json j;
            f >> j;
            ApplyJson(j, config);
            std::cout << "[ConfigLoader] Loaded " << configPath.string() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << configPath.string() << ": " << e.what() << std::endl;
        }
    } else if (!settingsPath.empty()) {
        std::cout << "[ConfigLoader] " << settingsPath << " not found, using defaults and environment" << std::endl;
    }

    ApplyEnvironment(config);
    return config;
}

} // namespace pixelorigin::infrastructure

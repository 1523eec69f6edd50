/**
 * @file OriginServer.cpp
 * @brief Implementation of the OriginServer class.
 */
#include "app/OriginServer.hpp"

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ObjectStoreFactory.hpp"
#include "infrastructure/VipsTransformEngine.hpp"

#include <httplib.h>
#include <vips/vips8>

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace pixelorigin::app {

OriginServer::OriginServer(std::string settingsPath) : m_settingsPath(std::move(settingsPath)) {}

OriginServer::~OriginServer() {
    Shutdown();
}

bool OriginServer::Init() {
    m_config = infrastructure::ConfigLoader::Load(m_settingsPath);

    if (VIPS_INIT("pixelorigin") != 0) {
        std::cerr << "[OriginServer] libvips initialization failed: " << vips_error_buffer() << std::endl;
        return false;
    }
    m_vipsInitialized = true;

    infrastructure::StoreClients stores;
    try {
        stores = infrastructure::ObjectStoreFactory::Build(m_config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[OriginServer] " << e.what() << std::endl;
        return false;
    }

    auto engine = std::make_shared<infrastructure::VipsTransformEngine>();
    m_pipeline = std::make_unique<application::DerivativePipeline>(m_config, stores.source, stores.cache, engine);
    m_rewriter = std::make_unique<application::QueryRewriter>(m_config.maxDimension);

    std::cout << "[OriginServer] Region '" << m_config.region << "', source '" << m_config.sourceBucketId()
              << "', cache '" << (m_config.publishingEnabled() ? m_config.cacheBucketId() : "<disabled>")
              << "', max-age " << m_config.cacheTtlSeconds << std::endl;
    return true;
}

void OriginServer::Shutdown() {
    if (m_server) {
        m_server->stop();
        m_server.reset();
    }
    m_pipeline.reset();
    if (m_vipsInitialized) {
        vips_shutdown();
        m_vipsInitialized = false;
    }
}

void OriginServer::HandleRequest(const httplib::Request& req, httplib::Response& res) const {
    std::string path = req.path;
    if (m_config.rewriteQueryOperations && !req.params.empty()) {
        path = m_rewriter->rewrite(path, req.params, req.get_header_value("Accept"));
    }

    auto envelope = m_pipeline->handle(req.method, path);

    res.status = envelope.statusCode;
    std::string contentType = "text/plain";
    for (const auto& [name, value] : envelope.headers) {
        if (name == "Content-Type") {
            contentType = value;
        } else {
            res.set_header(name, value);
        }
    }
    res.set_content(envelope.body, contentType);
}

int OriginServer::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    m_server = std::make_unique<httplib::Server>();
    auto handler = [this](const httplib::Request& req, httplib::Response& res) { HandleRequest(req, res); };
    m_server->Get(".*", handler);
    m_server->Post(".*", handler);
    m_server->Put(".*", handler);
    m_server->Patch(".*", handler);
    m_server->Delete(".*", handler);
    m_server->Options(".*", handler);

    std::cout << "[OriginServer] Listening on " << m_config.listenHost << ":" << m_config.listenPort << std::endl;
    bool ok = m_server->listen(m_config.listenHost, m_config.listenPort);
    if (!ok) {
        std::cerr << "[OriginServer] Could not listen on " << m_config.listenHost << ":" << m_config.listenPort << std::endl;
    }
    Shutdown();
    return ok ? 0 : 1;
}

int OriginServer::RenderOnce(const std::string& path, const std::string& outFile) {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    auto envelope = m_pipeline->handle("GET", path);
    std::cout << "[OriginServer] " << path << " -> " << envelope.statusCode << std::endl;
    for (const auto& [name, value] : envelope.headers) {
        std::cout << "  " << name << ": " << value << std::endl;
    }

    int exitCode = envelope.statusCode == 200 ? 0 : 1;
    std::ofstream out(outFile, std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "[OriginServer] Cannot write " << outFile << std::endl;
        exitCode = 1;
    } else {
        out.write(envelope.body.data(), static_cast<std::streamsize>(envelope.body.size()));
    }

    Shutdown();
    return exitCode;
}

} // namespace pixelorigin::app

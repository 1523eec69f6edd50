/**
 * @file OriginServer.hpp
 * @brief HTTP front end serving derivatives through the pipeline.
 */

#pragma once

#include "application/DerivativePipeline.hpp"
#include "application/QueryRewriter.hpp"
#include "application/ServiceConfig.hpp"
#include <memory>
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace pixelorigin::app {

/**
 * @class OriginServer
 * @brief Orchestrates the service lifecycle: configuration, libvips, stores, listener.
 */
class OriginServer {
public:
    /** @param settingsPath JSON settings file; environment variables override it. */
    explicit OriginServer(std::string settingsPath);
    ~OriginServer();

    /**
     * @brief Listens until the process is stopped.
     * @return Exit code (0 for success).
     */
    int Run();

    /**
     * @brief Runs a single GET through the pipeline and writes the body to @p outFile.
     * @return 0 when the pipeline answered 200.
     */
    int RenderOnce(const std::string& path, const std::string& outFile);

    /** @brief Translates one HTTP exchange. Public for embedding in other servers. */
    void HandleRequest(const httplib::Request& req, httplib::Response& res) const;

private:
    bool Init();
    void Shutdown();

    std::string m_settingsPath;
    application::ServiceConfig m_config;
    std::unique_ptr<application::DerivativePipeline> m_pipeline;
    std::unique_ptr<application::QueryRewriter> m_rewriter;
    std::unique_ptr<httplib::Server> m_server;
    bool m_vipsInitialized = false;
};

} // namespace pixelorigin::app

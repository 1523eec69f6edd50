#include <cstdlib>
#include <iostream>
#include <string>

#include "app/OriginServer.hpp"

using namespace pixelorigin;

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " [--config settings.json]\n"
              << "  " << argv0 << " [--config settings.json] --render <request-path> <out-file>\n"
              << "Example:\n"
              << "  " << argv0 << " --render /images/rio/1.png/format=jpeg,width=100 out.jpg" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::string settingsPath = "settings.json";
    if (const char* env = std::getenv("PIXELORIGIN_CONFIG")) {
        settingsPath = env;
    }

    std::string renderPath;
    std::string renderOut;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            settingsPath = argv[++i];
        } else if (arg == "--render" && i + 2 < argc) {
            renderPath = argv[++i];
            renderOut = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 2;
        }
    }

    app::OriginServer server(settingsPath);
    if (!renderPath.empty()) {
        return server.RenderOnce(renderPath, renderOut);
    }
    return server.Run();
}

#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

std::filesystem::path defaultConfigDir() {
    if (const char* dir = std::getenv("FLEETWATCH_CONFIG_DIR")) {
        return dir;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(xdg) / "fleetwatch";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "fleetwatch";
    }
    return "fleetwatch";
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config-dir DIR]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path configDir = defaultConfigDir();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config-dir" && i + 1 < argc) {
            configDir = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    try {
        fleetwatch::app::Application app(configDir);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

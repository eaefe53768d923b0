#include "infrastructure/network/NeighborTableReader.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>

namespace fleetwatch::infra {

namespace {

struct PipeCloser {
    void operator()(FILE* pipe) const {
        if (pipe) {
            pclose(pipe);
        }
    }
};

std::string runCommand(const std::string& command) {
    std::unique_ptr<FILE, PipeCloser> pipe(popen((command + " 2>/dev/null").c_str(), "r"));
    if (!pipe) {
        return {};
    }
    std::string output;
    std::array<char, 4096> buffer{};
    size_t count = 0;
    while ((count = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        output.append(buffer.data(), count);
    }
    return output;
}

} // namespace

NeighborTableReader::NeighborTableReader(std::filesystem::path arpPath,
                                         std::string fallbackCommand)
    : arpPath_(std::move(arpPath)), fallbackCommand_(std::move(fallbackCommand)) {}

core::NeighborTable NeighborTableReader::read() {
    std::ifstream file(arpPath_);
    if (file) {
        std::stringstream content;
        content << file.rdbuf();
        auto table = core::NeighborTable::fromProcNetArp(content.str());
        if (!table.empty()) {
            spdlog::debug("Neighbor cache: {} entries from {}", table.size(), arpPath_.string());
            return table;
        }
    }

    if (fallbackCommand_.empty()) {
        return {};
    }

    auto table = core::NeighborTable::fromIpNeigh(runCommand(fallbackCommand_));
    spdlog::debug("Neighbor cache: {} entries from '{}'", table.size(), fallbackCommand_);
    return table;
}

} // namespace fleetwatch::infra

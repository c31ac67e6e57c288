// src/oracle/move_oracle.cpp
#include "chessmancer/oracle/move_oracle.h"
#include "chessmancer/oracle/random_move_oracle.h"
#include "chessmancer/oracle/uci_engine_oracle.h"
#include <spdlog/spdlog.h>

namespace chessmancer {
namespace oracle {

std::unique_ptr<MoveOracle> MoveOracle::create(const config::EngineConfig& config) {
    auto enginePath = UciEngineOracle::locateEngine(config.enginePath);
    if (!enginePath) {
        if (config.enginePath.empty()) {
            spdlog::warn("MoveOracle: No UCI engine found in the working directory or on PATH");
        } else {
            spdlog::warn("MoveOracle: Engine '{}' not found", config.enginePath);
        }
        spdlog::warn("MoveOracle: Falling back to random legal moves");
        return std::make_unique<RandomMoveOracle>(config.seed);
    }

    auto engine = std::make_unique<UciEngineOracle>(
        *enginePath, config.skillLevel, std::chrono::milliseconds(config.handshakeTimeoutMs));
    if (!engine->start()) {
        spdlog::warn("MoveOracle: Engine {} failed to start, falling back to random legal moves",
                     *enginePath);
        return std::make_unique<RandomMoveOracle>(config.seed);
    }

    return engine;
}

} // namespace oracle
} // namespace chessmancer

// src/config/engine_config.cpp
#include "chessmancer/config/engine_config.h"
#include "chessmancer/chess/notation.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace chessmancer {
namespace config {

using json = nlohmann::json;

chess::PieceColor parseColor(const std::string& text) {
    std::string value = cli::CommandParser::toLower(text);
    if (value == "white") return chess::PieceColor::WHITE;
    if (value == "black") return chess::PieceColor::BLACK;
    if (value == "none") return chess::PieceColor::NONE;
    throw std::invalid_argument("Unknown color '" + text + "', expected white, black or none");
}

void EngineConfig::clamp() {
    skillLevel = std::clamp(skillLevel, MIN_SKILL_LEVEL, MAX_SKILL_LEVEL);
    moveTimeMs = std::max(moveTimeMs, 1);
    handshakeTimeoutMs = std::max(handshakeTimeoutMs, 1);
}

void EngineConfig::mergeJson(const std::string& jsonText) {
    try {
        json j = json::parse(jsonText);

        enginePath = j.value("engine_path", enginePath);
        skillLevel = j.value("skill_level", skillLevel);
        moveTimeMs = j.value("move_time_ms", moveTimeMs);
        handshakeTimeoutMs = j.value("handshake_timeout_ms", handshakeTimeoutMs);
        seed = j.value("seed", seed);
        logLevel = j.value("log_level", logLevel);

        if (j.contains("ai_color")) {
            aiColor = parseColor(j["ai_color"].get<std::string>());
        }

        if (j.contains("draw_rules")) {
            const json& rules = j["draw_rules"];
            drawRules.insufficientMaterial = rules.value("insufficient_material", drawRules.insufficientMaterial);
            drawRules.fiftyMove = rules.value("fifty_move", drawRules.fiftyMove);
            drawRules.repetition = rules.value("repetition", drawRules.repetition);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse config JSON: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid config value: " + std::string(e.what()));
    }

    clamp();
}

void EngineConfig::mergeFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    mergeJson(buffer.str());
}

void EngineConfig::mergeFlags(const cli::FlagMap& flags) {
    using cli::CommandParser;

    enginePath = CommandParser::getFlagValue(flags, "engine", enginePath);
    skillLevel = CommandParser::getFlagValueInt(flags, "skill", skillLevel);
    moveTimeMs = CommandParser::getFlagValueInt(flags, "movetime", moveTimeMs);
    handshakeTimeoutMs = CommandParser::getFlagValueInt(flags, "handshake-timeout", handshakeTimeoutMs);
    seed = static_cast<unsigned>(CommandParser::getFlagValueInt(flags, "seed", static_cast<int>(seed)));
    logLevel = CommandParser::getFlagValue(flags, "log-level", logLevel);

    if (CommandParser::hasFlag(flags, "ai")) {
        aiColor = parseColor(CommandParser::getFlagValue(flags, "ai"));
    }

    if (CommandParser::getFlagValueBool(flags, "no-draw-rules", false)) {
        drawRules = chess::DrawRules{false, false, false};
    }

    clamp();
}

std::string EngineConfig::toJson() const {
    json j;
    j["engine_path"] = enginePath;
    j["skill_level"] = skillLevel;
    j["move_time_ms"] = moveTimeMs;
    j["handshake_timeout_ms"] = handshakeTimeoutMs;
    j["ai_color"] = chess::colorToString(aiColor);
    j["seed"] = seed;
    j["log_level"] = logLevel;
    j["draw_rules"] = {
        {"insufficient_material", drawRules.insufficientMaterial},
        {"fifty_move", drawRules.fiftyMove},
        {"repetition", drawRules.repetition}
    };
    return j.dump(4);
}

} // namespace config
} // namespace chessmancer

// include/chessmancer/config/engine_config.h
#ifndef CHESSMANCER_ENGINE_CONFIG_H
#define CHESSMANCER_ENGINE_CONFIG_H

#include <string>
#include "chessmancer/chess/chess_types.h"
#include "chessmancer/cli/command_parser.h"

namespace chessmancer {
namespace config {

constexpr int MIN_SKILL_LEVEL = 1;
constexpr int MAX_SKILL_LEVEL = 20;

/**
 * @brief Settings for a game session and its move oracle
 *
 * Layered as built-in defaults, then an optional JSON file, then command
 * line flags.
 */
struct EngineConfig {
    std::string enginePath;        // empty: search the working directory and PATH
    int skillLevel = 10;
    int moveTimeMs = 100;
    int handshakeTimeoutMs = 2000;
    chess::PieceColor aiColor = chess::PieceColor::BLACK;  // NONE: no automatic replies
    unsigned seed = 0;             // 0: seed from the clock
    std::string logLevel = "info";
    chess::DrawRules drawRules;

    /**
     * @brief Bring values into their valid ranges
     *
     * Skill is clamped to [1, 20], time limits to at least 1 ms.
     */
    void clamp();

    /**
     * @brief Overlay values from a JSON document
     *
     * Keys not present keep their current value.
     *
     * @throws std::runtime_error on malformed JSON or wrongly typed values
     */
    void mergeJson(const std::string& jsonText);

    /**
     * @brief Overlay values from a JSON file
     *
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    void mergeFile(const std::string& path);

    /**
     * @brief Overlay values from command line flags
     *
     * Recognized: engine, skill, movetime, handshake-timeout, ai, seed,
     * log-level, no-draw-rules.
     *
     * @throws std::invalid_argument on malformed values
     */
    void mergeFlags(const cli::FlagMap& flags);

    std::string toJson() const;
};

/**
 * @brief Parse "white", "black" or "none"
 *
 * @throws std::invalid_argument for anything else
 */
chess::PieceColor parseColor(const std::string& text);

} // namespace config
} // namespace chessmancer

#endif // CHESSMANCER_ENGINE_CONFIG_H

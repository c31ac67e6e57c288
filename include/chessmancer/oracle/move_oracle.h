// include/chessmancer/oracle/move_oracle.h
#ifndef CHESSMANCER_MOVE_ORACLE_H
#define CHESSMANCER_MOVE_ORACLE_H

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "chessmancer/chess/board_state.h"
#include "chessmancer/config/engine_config.h"

namespace chessmancer {
namespace oracle {

/**
 * @brief Source of suggested moves
 *
 * An oracle proposes a move for the side to move. Its answers are only
 * suggestions: callers check them against the rules core before applying.
 */
class MoveOracle {
public:
    virtual ~MoveOracle() = default;

    /**
     * @brief Suggest a move for the side to move
     *
     * @param board Position to analyse
     * @param timeBudget Thinking time
     * @return A move, or nullopt if the oracle cannot answer
     */
    virtual std::optional<chess::ChessMove> bestMove(const chess::BoardState& board,
                                                     std::chrono::milliseconds timeBudget) = 0;

    /**
     * @brief Whether the oracle can currently answer queries
     */
    virtual bool isAvailable() const = 0;

    virtual std::string getName() const = 0;

    /**
     * @brief Change the playing strength
     *
     * @param level Skill in [1, 20]
     * @return false if the oracle has no notion of skill
     */
    virtual bool setSkillLevel(int /*level*/) { return false; }

    /**
     * @brief Create the oracle described by a configuration
     *
     * Starts the external UCI engine; if it cannot be found or does not
     * complete the handshake, a RandomMoveOracle is returned instead.
     *
     * @param config Engine settings
     * @return Oracle instance, never null
     */
    static std::unique_ptr<MoveOracle> create(const config::EngineConfig& config);
};

} // namespace oracle
} // namespace chessmancer

#endif // CHESSMANCER_MOVE_ORACLE_H

// include/chessmancer/session/game_session.h
#ifndef CHESSMANCER_GAME_SESSION_H
#define CHESSMANCER_GAME_SESSION_H

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include "chessmancer/chess/chess_game.h"
#include "chessmancer/config/engine_config.h"
#include "chessmancer/oracle/move_oracle.h"
#include "chessmancer/oracle/random_move_oracle.h"

namespace chessmancer {
namespace session {

/**
 * @brief An oracle query in flight
 *
 * Tagged with the game generation and ply count it was issued against so
 * that its answer can be recognized as stale.
 */
struct OracleQuery {
    uint64_t generation = 0;
    size_t ply = 0;
    std::future<std::optional<chess::ChessMove>> response;
};

/**
 * @brief A game between a player and a move oracle
 *
 * Owns the live game and the oracle. The board is only read or changed
 * under a lock; oracle queries run on a snapshot. When the oracle gives no
 * usable answer a uniformly random legal move is played instead.
 */
class GameSession {
public:
    /**
     * @brief Constructor
     *
     * @param oracle Move oracle; if null a random oracle is used
     * @param config Session settings (AI color, move time, draw rules, seed)
     */
    GameSession(std::unique_ptr<oracle::MoveOracle> oracle, const config::EngineConfig& config);

    /**
     * @brief Snapshot of the current board
     */
    chess::BoardState board() const;

    chess::GameResult status() const;
    uint64_t generation() const;

    /**
     * @brief Legal destinations for a square in the current position
     */
    std::vector<chess::Square> legalMoves(chess::Square square) const;

    /**
     * @brief Play a move for the side to move
     *
     * @return The new board or the reason the move was refused
     */
    chess::MoveResult playMove(chess::Square from, chess::Square to);

    /**
     * @brief Ask the oracle for a move and play it
     *
     * Blocks for up to the configured move time plus engine timeouts.
     *
     * @return The move played, or nullopt if the game is over
     */
    std::optional<chess::ChessMove> playOracleMove();

    /**
     * @brief Start an oracle query on a snapshot of the current board
     *
     * The session must outlive the returned query.
     */
    OracleQuery requestOracleMove();

    /**
     * @brief Wait for a query and play its move if it still applies
     *
     * @return The move played, or nullopt if the answer was stale or empty
     */
    std::optional<chess::ChessMove> applyOracleResponse(OracleQuery& query);

    /**
     * @brief Whether the side to move is played by the oracle
     */
    bool isOracleTurn() const;

    /**
     * @brief Start a new game; pending oracle answers become stale
     */
    void reset();

    /**
     * @brief Replace the board, e.g. after loading a record
     */
    void loadBoard(chess::BoardState board);

    void setMoveTime(int moveTimeMs);
    bool setSkillLevel(int level);
    void setOracleColor(chess::PieceColor color);

    std::string getOracleName() const;
    const config::EngineConfig& getConfig() const { return config_; }

private:
    mutable std::mutex gameMutex_;
    std::mutex oracleMutex_;
    chess::ChessGame game_;
    std::unique_ptr<oracle::MoveOracle> oracle_;
    oracle::RandomMoveOracle fallback_;
    config::EngineConfig config_;

    std::optional<chess::ChessMove> chooseMove(const chess::BoardState& snapshot);
};

} // namespace session
} // namespace chessmancer

#endif // CHESSMANCER_GAME_SESSION_H

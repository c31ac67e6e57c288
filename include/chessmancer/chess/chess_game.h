// include/chessmancer/chess/chess_game.h
#ifndef CHESSMANCER_CHESS_GAME_H
#define CHESSMANCER_CHESS_GAME_H

#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include "chessmancer/chess/board_state.h"

namespace chessmancer {
namespace chess {

/**
 * @brief Why a move was refused
 */
struct IllegalMoveError {
    Square from;
    Square to;
    std::string reason;

    std::string toString() const;
};

/**
 * @brief Outcome of tryMove: the new board or the reason for refusal
 */
class MoveResult {
public:
    static MoveResult success(BoardState board);
    static MoveResult failure(IllegalMoveError error);

    bool ok() const { return board_.has_value(); }
    explicit operator bool() const { return ok(); }

    /**
     * @brief The board after the move
     *
     * @throws core::GameStateException if the move was refused
     */
    const BoardState& board() const;

    /**
     * @brief The refusal
     *
     * @throws core::GameStateException if the move succeeded
     */
    const IllegalMoveError& error() const;

private:
    MoveResult() = default;

    std::optional<BoardState> board_;
    std::optional<IllegalMoveError> error_;
};

/**
 * @brief Standard starting position
 */
BoardState newGame();

/**
 * @brief Legal destinations for the piece on a square
 *
 * Empty if the square is empty, holds a piece of the side not to move, or
 * the game is over.
 */
std::vector<Square> legalMoves(const BoardState& board, Square square);

/**
 * @brief Validate and apply a move
 *
 * The input board is never modified. On success the returned board carries
 * the evaluated game result.
 *
 * @param board Current position
 * @param from Origin square
 * @param to Destination square
 * @param rules Draw rules used to evaluate the resulting position
 * @return New board, or an IllegalMoveError
 * @throws core::InvariantViolation if the resulting board does not hold one king per side
 */
MoveResult tryMove(const BoardState& board, Square from, Square to,
                   const DrawRules& rules = DrawRules());

/**
 * @brief Evaluate the result for the side to move
 * @throws core::InvariantViolation if a side does not have exactly one king
 */
GameResult status(const BoardState& board, const DrawRules& rules = DrawRules());

/**
 * @brief Discard a game and start a new one
 */
BoardState reset(const BoardState& board);

/**
 * @brief A single game with its own board
 *
 * The generation counter increases on every reset or board replacement so
 * that work started against an older board can be recognized as stale.
 */
class ChessGame {
public:
    explicit ChessGame(const DrawRules& rules = DrawRules());

    const BoardState& board() const { return board_; }
    const DrawRules& drawRules() const { return rules_; }
    uint64_t generation() const { return generation_; }

    std::vector<Square> legalMoves(Square square) const;
    GameResult status() const { return board_.result(); }
    bool isGameOver() const { return board_.isGameOver(); }

    /**
     * @brief Try a move and apply it on success
     */
    MoveResult tryMove(Square from, Square to);

    /**
     * @brief Apply a move or throw
     *
     * @throws core::IllegalMoveException if the move is not legal
     */
    void makeMove(Square from, Square to);

    void reset();

    /**
     * @brief Replace the board, e.g. after loading a record
     */
    void setBoard(BoardState board);

private:
    BoardState board_;
    DrawRules rules_;
    uint64_t generation_;
};

} // namespace chess
} // namespace chessmancer

#endif // CHESSMANCER_CHESS_GAME_H

// include/chessmancer/chess/check_validator.h
#ifndef CHESSMANCER_CHECK_VALIDATOR_H
#define CHESSMANCER_CHECK_VALIDATOR_H

#include <vector>
#include "chessmancer/chess/board_state.h"
#include "chessmancer/chess/move_generator.h"

namespace chessmancer {
namespace chess {

/**
 * @brief Attack detection and self-check filtering
 *
 * Takes a snapshot of the board's grid at construction. Moves are tried
 * out on that private copy, so the board itself is never touched. Create a
 * new validator after the board changes.
 */
class CheckValidator {
public:
    /**
     * @brief Constructor
     *
     * @param board Board to validate against; must outlive the validator
     */
    explicit CheckValidator(const BoardState& board);

    /**
     * @brief Check if a square is attacked by a color
     */
    bool isSquareAttacked(Square square, PieceColor byColor) const;

    /**
     * @brief Check if a color's king is attacked
     *
     * @return false if the color has no king
     */
    bool isKingInCheck(PieceColor color) const;

    /**
     * @brief Check if moving a piece would leave its own king in check
     *
     * The move is simulated on the validator's grid and undone before
     * returning, on every path. A pawn captured en passant is lifted for
     * the duration of the simulation.
     *
     * @param from Square of the moving piece
     * @param to Destination
     * @return true if the mover's king would be attacked afterwards
     */
    bool wouldMoveCauseSelfCheck(Square from, Square to) const;

    /**
     * @brief Remove candidates that would leave the mover's king in check
     *
     * @param from Square of the moving piece
     * @param candidates Pseudo-legal destinations
     * @return The legal subset, in the original order
     */
    std::vector<Square> filterLegal(Square from, const std::vector<Square>& candidates) const;

    /**
     * @brief Legal destinations for the piece on a square
     */
    std::vector<Square> legalMoves(Square from) const;

    /**
     * @brief Every legal move of a color
     */
    std::vector<ChessMove> allLegalMoves(PieceColor color) const;

    /**
     * @brief Check if a color has at least one legal move
     */
    bool hasAnyLegalMove(PieceColor color) const;

private:
    class ScopedMoveSimulation;

    MoveGenerator generator_;
    mutable Grid scratch_;
};

} // namespace chess
} // namespace chessmancer

#endif // CHESSMANCER_CHECK_VALIDATOR_H

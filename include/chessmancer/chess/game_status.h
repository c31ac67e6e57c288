// include/chessmancer/chess/game_status.h
#ifndef CHESSMANCER_GAME_STATUS_H
#define CHESSMANCER_GAME_STATUS_H

#include "chessmancer/chess/board_state.h"
#include "chessmancer/chess/check_validator.h"

namespace chessmancer {
namespace chess {

/**
 * @brief Terminal state detection
 *
 * Derives check, checkmate, stalemate and draw conditions from a board.
 */
class GameStatus {
public:
    /**
     * @brief Constructor
     *
     * @param board Board to evaluate; must outlive this object
     * @param rules Which draw rules to apply in evaluate()
     */
    explicit GameStatus(const BoardState& board, const DrawRules& rules = DrawRules());

    bool isInCheck(PieceColor color) const;
    bool hasAnyLegalMove(PieceColor color) const;

    /**
     * @brief In check with no legal move
     */
    bool isCheckmate(PieceColor color) const;

    /**
     * @brief Not in check but no legal move
     */
    bool isStalemate(PieceColor color) const;

    /**
     * @brief Neither side can possibly deliver mate
     *
     * True when no pawns, rooks or queens remain and either a single knight
     * is the only minor piece, or every bishop on the board (of either color)
     * stands on the same square color and there are no knights.
     */
    bool hasInsufficientMaterial() const;

    /**
     * @brief 100 plies without a pawn move or capture
     */
    bool isFiftyMoveRule() const;

    /**
     * @brief Current position has occurred three times since the last
     *        irreversible move
     */
    bool isThreefoldRepetition() const;

    /**
     * @brief Result for the side to move
     *
     * Checkmate and stalemate are checked before the draw rules.
     *
     * @throws core::InvariantViolation if a side does not have exactly one king
     */
    GameResult evaluate() const;

private:
    const BoardState& board_;
    DrawRules rules_;
    CheckValidator validator_;
};

} // namespace chess
} // namespace chessmancer

#endif // CHESSMANCER_GAME_STATUS_H

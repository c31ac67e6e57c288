// src/chess/check_validator.cpp
#include "chessmancer/chess/check_validator.h"
#include "chessmancer/chess/attacks.h"

namespace chessmancer {
namespace chess {

/**
 * Relocates a piece on the scratch grid and puts everything back when it
 * goes out of scope, including when the code in between throws.
 */
class CheckValidator::ScopedMoveSimulation {
public:
    ScopedMoveSimulation(Grid& grid, Square from, Square to)
        : grid_(grid), saved_(grid) {
        Piece moving = grid_[from.index()];

        if (moving.type == PieceType::PAWN && from.col != to.col &&
            grid_[to.index()].is_empty()) {
            grid_[Square{from.row, to.col}.index()] = Piece();
        }

        grid_[from.index()] = Piece();
        grid_[to.index()] = moving;
    }

    ~ScopedMoveSimulation() {
        grid_ = saved_;
    }

    ScopedMoveSimulation(const ScopedMoveSimulation&) = delete;
    ScopedMoveSimulation& operator=(const ScopedMoveSimulation&) = delete;

private:
    Grid& grid_;
    const Grid saved_;
};

CheckValidator::CheckValidator(const BoardState& board)
    : generator_(board),
      scratch_(board.grid()) {
}

bool CheckValidator::isSquareAttacked(Square square, PieceColor byColor) const {
    return chess::isSquareAttacked(scratch_, square, byColor);
}

bool CheckValidator::isKingInCheck(PieceColor color) const {
    auto kingSquare = findKing(scratch_, color);
    if (!kingSquare) {
        return false;
    }
    return isSquareAttacked(*kingSquare, oppositeColor(color));
}

bool CheckValidator::wouldMoveCauseSelfCheck(Square from, Square to) const {
    if (!from.isValid() || !to.isValid()) {
        return true;
    }

    const Piece& moving = pieceOn(scratch_, from);
    if (moving.is_empty()) {
        return true;
    }

    PieceColor color = moving.color;
    ScopedMoveSimulation simulation(scratch_, from, to);
    return isKingInCheck(color);
}

std::vector<Square> CheckValidator::filterLegal(Square from, const std::vector<Square>& candidates) const {
    std::vector<Square> legal;
    legal.reserve(candidates.size());

    for (const Square& to : candidates) {
        if (!wouldMoveCauseSelfCheck(from, to)) {
            legal.push_back(to);
        }
    }

    return legal;
}

std::vector<Square> CheckValidator::legalMoves(Square from) const {
    return filterLegal(from, generator_.generate(from));
}

std::vector<ChessMove> CheckValidator::allLegalMoves(PieceColor color) const {
    std::vector<ChessMove> moves;
    for (const ChessMove& move : generator_.generateAll(color)) {
        if (!wouldMoveCauseSelfCheck(move.from, move.to)) {
            moves.push_back(move);
        }
    }
    return moves;
}

bool CheckValidator::hasAnyLegalMove(PieceColor color) const {
    for (const ChessMove& move : generator_.generateAll(color)) {
        if (!wouldMoveCauseSelfCheck(move.from, move.to)) {
            return true;
        }
    }
    return false;
}

} // namespace chess
} // namespace chessmancer

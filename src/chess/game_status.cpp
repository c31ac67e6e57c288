// src/chess/game_status.cpp
#include "chessmancer/chess/game_status.h"
#include <algorithm>

namespace chessmancer {
namespace chess {

GameStatus::GameStatus(const BoardState& board, const DrawRules& rules)
    : board_(board),
      rules_(rules),
      validator_(board) {
}

bool GameStatus::isInCheck(PieceColor color) const {
    return validator_.isKingInCheck(color);
}

bool GameStatus::hasAnyLegalMove(PieceColor color) const {
    return validator_.hasAnyLegalMove(color);
}

bool GameStatus::isCheckmate(PieceColor color) const {
    return isInCheck(color) && !hasAnyLegalMove(color);
}

bool GameStatus::isStalemate(PieceColor color) const {
    return !isInCheck(color) && !hasAnyLegalMove(color);
}

bool GameStatus::hasInsufficientMaterial() const {
    int knights = 0;
    int bishops = 0;
    bool bishopOnSquareColor[2] = {false, false};

    for (int i = 0; i < NUM_SQUARES; ++i) {
        const Piece& piece = board_.grid()[i];
        switch (piece.type) {
            case PieceType::NONE:
            case PieceType::KING:
                break;
            case PieceType::PAWN:
            case PieceType::ROOK:
            case PieceType::QUEEN:
                return false;
            case PieceType::KNIGHT:
                knights++;
                break;
            case PieceType::BISHOP: {
                Square square = Square::fromIndex(i);
                bishops++;
                bishopOnSquareColor[(square.row + square.col) % 2] = true;
                break;
            }
        }
    }

    // Bishops of both sides, any number, all on one square color
    if (knights == 0) {
        return !(bishopOnSquareColor[0] && bishopOnSquareColor[1]);
    }

    // A lone knight against a bare king
    return knights == 1 && bishops == 0;
}

bool GameStatus::isFiftyMoveRule() const {
    return board_.halfmoveClock() >= 100;
}

bool GameStatus::isThreefoldRepetition() const {
    const auto& keys = board_.positionKeys();
    const uint64_t current = keys.back();

    // Positions before the last pawn move or capture cannot recur
    size_t window = std::min(keys.size(), static_cast<size_t>(board_.halfmoveClock()) + 1);
    auto count = std::count(keys.end() - static_cast<std::ptrdiff_t>(window), keys.end(), current);
    return count >= 3;
}

GameResult GameStatus::evaluate() const {
    board_.validate();

    const PieceColor toMove = board_.turn();
    GameResult result;

    if (!hasAnyLegalMove(toMove)) {
        if (isInCheck(toMove)) {
            result.outcome = GameOutcome::CHECKMATE;
            result.winner = oppositeColor(toMove);
        } else {
            result.outcome = GameOutcome::STALEMATE;
        }
        return result;
    }

    if (rules_.insufficientMaterial && hasInsufficientMaterial()) {
        result.outcome = GameOutcome::DRAW_INSUFFICIENT_MATERIAL;
    } else if (rules_.fiftyMove && isFiftyMoveRule()) {
        result.outcome = GameOutcome::DRAW_FIFTY_MOVE;
    } else if (rules_.repetition && isThreefoldRepetition()) {
        result.outcome = GameOutcome::DRAW_REPETITION;
    }

    return result;
}

} // namespace chess
} // namespace chessmancer

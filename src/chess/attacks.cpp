// src/chess/attacks.cpp
#include "chessmancer/chess/attacks.h"

namespace chessmancer {
namespace chess {

const std::vector<std::pair<int, int>> KNIGHT_MOVES = {
    {-2, -1}, {-2, 1}, {-1, -2}, {-1, 2}, {1, -2}, {1, 2}, {2, -1}, {2, 1}
};

const std::vector<std::pair<int, int>> KING_MOVES = {
    {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}
};

const std::vector<std::pair<int, int>> BISHOP_DIRECTIONS = {
    {-1, -1}, {-1, 1}, {1, -1}, {1, 1}
};

const std::vector<std::pair<int, int>> ROOK_DIRECTIONS = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1}
};

const std::vector<std::pair<int, int>> QUEEN_DIRECTIONS = {
    {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}
};

namespace {

bool isPieceAt(const Grid& grid, Square square, PieceType type, PieceColor color) {
    if (!square.isValid()) {
        return false;
    }
    const Piece& piece = pieceOn(grid, square);
    return piece.type == type && piece.color == color;
}

// Walk each ray to the first occupied square and report whether it holds
// one of the two given slider types of the attacking color.
bool isAttackedAlongRays(const Grid& grid, Square square, PieceColor byColor,
                         const std::vector<std::pair<int, int>>& directions,
                         PieceType slider, PieceType queen) {
    for (const auto& [dr, dc] : directions) {
        Square current{square.row + dr, square.col + dc};
        while (current.isValid()) {
            const Piece& piece = pieceOn(grid, current);
            if (!piece.is_empty()) {
                if (piece.color == byColor && (piece.type == slider || piece.type == queen)) {
                    return true;
                }
                break;
            }
            current.row += dr;
            current.col += dc;
        }
    }
    return false;
}

} // namespace

bool isSquareAttacked(const Grid& grid, Square square, PieceColor byColor) {
    if (!square.isValid()) {
        return false;
    }

    // An attacking pawn sits one row behind the target, from its own point of view
    int pawnRow = square.row - pawnDirection(byColor);
    if (isPieceAt(grid, {pawnRow, square.col - 1}, PieceType::PAWN, byColor) ||
        isPieceAt(grid, {pawnRow, square.col + 1}, PieceType::PAWN, byColor)) {
        return true;
    }

    for (const auto& [dr, dc] : KNIGHT_MOVES) {
        if (isPieceAt(grid, {square.row + dr, square.col + dc}, PieceType::KNIGHT, byColor)) {
            return true;
        }
    }

    for (const auto& [dr, dc] : KING_MOVES) {
        if (isPieceAt(grid, {square.row + dr, square.col + dc}, PieceType::KING, byColor)) {
            return true;
        }
    }

    if (isAttackedAlongRays(grid, square, byColor, BISHOP_DIRECTIONS,
                            PieceType::BISHOP, PieceType::QUEEN)) {
        return true;
    }

    return isAttackedAlongRays(grid, square, byColor, ROOK_DIRECTIONS,
                               PieceType::ROOK, PieceType::QUEEN);
}

std::optional<Square> findKing(const Grid& grid, PieceColor color) {
    for (int i = 0; i < NUM_SQUARES; ++i) {
        if (grid[i].type == PieceType::KING && grid[i].color == color) {
            return Square::fromIndex(i);
        }
    }
    return std::nullopt;
}

} // namespace chess
} // namespace chessmancer

// include/chessmancer/chess/attacks.h
#ifndef CHESSMANCER_ATTACKS_H
#define CHESSMANCER_ATTACKS_H

#include <vector>
#include <utility>
#include <optional>
#include "chessmancer/chess/chess_types.h"

namespace chessmancer {
namespace chess {

// (row, col) offsets shared by move generation and attack detection
extern const std::vector<std::pair<int, int>> KNIGHT_MOVES;
extern const std::vector<std::pair<int, int>> KING_MOVES;
extern const std::vector<std::pair<int, int>> BISHOP_DIRECTIONS;
extern const std::vector<std::pair<int, int>> ROOK_DIRECTIONS;
extern const std::vector<std::pair<int, int>> QUEEN_DIRECTIONS;

inline const Piece& pieceOn(const Grid& grid, Square square) {
    return grid[square.index()];
}

/**
 * @brief Check if a square is attacked by a color
 *
 * Works on board geometry and occupancy alone and never generates moves,
 * so it can be used while filtering moves for legality.
 *
 * @param grid Board grid
 * @param square Target square
 * @param byColor Attacking color
 * @return true if any piece of byColor attacks the square
 */
bool isSquareAttacked(const Grid& grid, Square square, PieceColor byColor);

/**
 * @brief Locate a color's king on a grid
 */
std::optional<Square> findKing(const Grid& grid, PieceColor color);

} // namespace chess
} // namespace chessmancer

#endif // CHESSMANCER_ATTACKS_H

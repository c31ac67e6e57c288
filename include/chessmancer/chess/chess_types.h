// include/chessmancer/chess/chess_types.h
#ifndef CHESSMANCER_CHESS_TYPES_H
#define CHESSMANCER_CHESS_TYPES_H

#include <array>
#include <string>

namespace chessmancer {
namespace chess {

constexpr int BOARD_SIZE = 8;
constexpr int NUM_SQUARES = BOARD_SIZE * BOARD_SIZE;

/**
 * @brief Chess piece types
 */
enum class PieceType {
    NONE,
    PAWN,
    KNIGHT,
    BISHOP,
    ROOK,
    QUEEN,
    KING
};

/**
 * @brief Chess piece colors
 */
enum class PieceColor {
    WHITE,
    BLACK,
    NONE
};

inline PieceColor oppositeColor(PieceColor color) {
    if (color == PieceColor::WHITE) return PieceColor::BLACK;
    if (color == PieceColor::BLACK) return PieceColor::WHITE;
    return PieceColor::NONE;
}

/**
 * @brief Forward row direction of a color's pawns
 *
 * Row 0 is black's back rank, so white pawns move toward lower rows.
 */
inline int pawnDirection(PieceColor color) {
    return color == PieceColor::WHITE ? -1 : 1;
}

/**
 * @brief A board coordinate
 *
 * Row 0 is the far rank (black's back rank), row 7 the near rank
 * (white's back rank). Column 0 is the a-file.
 */
struct Square {
    int row = 0;
    int col = 0;

    bool isValid() const {
        return row >= 0 && row < BOARD_SIZE && col >= 0 && col < BOARD_SIZE;
    }

    int index() const { return row * BOARD_SIZE + col; }

    static Square fromIndex(int index) { return Square{index / BOARD_SIZE, index % BOARD_SIZE}; }

    bool operator==(const Square& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Square& other) const {
        return !(*this == other);
    }

    bool operator<(const Square& other) const {
        return index() < other.index();
    }
};

/**
 * @brief Chess piece representation
 *
 * A piece does not know its own square; its position is the grid slot
 * that holds it.
 */
struct Piece {
    PieceType type = PieceType::NONE;
    PieceColor color = PieceColor::NONE;
    bool has_moved = false;

    bool is_empty() const { return type == PieceType::NONE; }

    bool operator==(const Piece& other) const {
        return type == other.type && color == other.color && has_moved == other.has_moved;
    }

    bool operator!=(const Piece& other) const {
        return !(*this == other);
    }
};

using Grid = std::array<Piece, NUM_SQUARES>;

/**
 * @brief A move intent: origin and destination
 *
 * Castling, en passant and promotion are inferred from the board when the
 * move is applied.
 */
struct ChessMove {
    Square from;
    Square to;

    bool operator==(const ChessMove& other) const {
        return from == other.from && to == other.to;
    }

    bool operator!=(const ChessMove& other) const {
        return !(*this == other);
    }
};

/**
 * @brief How a game ended, or that it has not
 */
enum class GameOutcome {
    IN_PROGRESS,
    CHECKMATE,
    STALEMATE,
    DRAW_INSUFFICIENT_MATERIAL,
    DRAW_FIFTY_MOVE,
    DRAW_REPETITION
};

/**
 * @brief Result of a game; winner is set only for CHECKMATE
 */
struct GameResult {
    GameOutcome outcome = GameOutcome::IN_PROGRESS;
    PieceColor winner = PieceColor::NONE;

    bool isOver() const { return outcome != GameOutcome::IN_PROGRESS; }
    bool isDraw() const { return isOver() && outcome != GameOutcome::CHECKMATE; }

    bool operator==(const GameResult& other) const {
        return outcome == other.outcome && winner == other.winner;
    }

    bool operator!=(const GameResult& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Toggles for the draw rules evaluated after each move
 */
struct DrawRules {
    bool insufficientMaterial = true;
    bool fiftyMove = true;
    bool repetition = true;
};

} // namespace chess
} // namespace chessmancer

#endif // CHESSMANCER_CHESS_TYPES_H

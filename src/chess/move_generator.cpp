// src/chess/move_generator.cpp
#include "chessmancer/chess/move_generator.h"
#include "chessmancer/chess/attacks.h"
#include <cstdlib>

namespace chessmancer {
namespace chess {

MoveGenerator::MoveGenerator(const BoardState& board)
    : board_(board) {
}

std::vector<Square> MoveGenerator::generate(Square from) const {
    std::vector<Square> moves;

    auto piece = board_.pieceAt(from);
    if (!piece) {
        return moves;
    }

    switch (piece->type) {
        case PieceType::PAWN:
            addPawnMoves(from, *piece, moves);
            break;
        case PieceType::KNIGHT:
            addStepMoves(from, *piece, KNIGHT_MOVES, moves);
            break;
        case PieceType::BISHOP:
            addSlidingMoves(from, *piece, BISHOP_DIRECTIONS, moves);
            break;
        case PieceType::ROOK:
            addSlidingMoves(from, *piece, ROOK_DIRECTIONS, moves);
            break;
        case PieceType::QUEEN:
            addSlidingMoves(from, *piece, QUEEN_DIRECTIONS, moves);
            break;
        case PieceType::KING:
            addStepMoves(from, *piece, KING_MOVES, moves);
            addCastlingMoves(from, *piece, moves);
            break;
        default:
            break;
    }

    return moves;
}

std::vector<ChessMove> MoveGenerator::generateAll(PieceColor color) const {
    std::vector<ChessMove> moves;

    for (int i = 0; i < NUM_SQUARES; ++i) {
        Square from = Square::fromIndex(i);
        const Piece& piece = board_.grid()[i];
        if (piece.is_empty() || piece.color != color) {
            continue;
        }
        for (const Square& to : generate(from)) {
            moves.push_back({from, to});
        }
    }

    return moves;
}

bool MoveGenerator::isEnemy(Square square, PieceColor color) const {
    auto piece = board_.pieceAt(square);
    return piece && piece->color != color;
}

void MoveGenerator::addPawnMoves(Square from, const Piece& pawn, std::vector<Square>& moves) const {
    const int dir = pawnDirection(pawn.color);
    const int startRow = pawn.color == PieceColor::WHITE ? 6 : 1;

    // Forward moves
    Square oneStep{from.row + dir, from.col};
    if (oneStep.isValid() && !board_.pieceAt(oneStep)) {
        moves.push_back(oneStep);

        Square twoStep{from.row + 2 * dir, from.col};
        if (from.row == startRow && twoStep.isValid() && !board_.pieceAt(twoStep)) {
            moves.push_back(twoStep);
        }
    }

    // Captures
    for (int dc : {-1, 1}) {
        Square target{from.row + dir, from.col + dc};
        if (target.isValid() && isEnemy(target, pawn.color)) {
            moves.push_back(target);
        }
    }

    // En passant against a pawn that has just advanced two squares beside us
    auto advanced = board_.lastDoublePawnAdvance();
    if (advanced && advanced->row == from.row && std::abs(advanced->col - from.col) == 1) {
        auto victim = board_.pieceAt(*advanced);
        Square target{from.row + dir, advanced->col};
        if (victim && victim->type == PieceType::PAWN && victim->color != pawn.color &&
            target.isValid() && !board_.pieceAt(target)) {
            moves.push_back(target);
        }
    }
}

void MoveGenerator::addStepMoves(Square from, const Piece& piece,
                                 const std::vector<std::pair<int, int>>& offsets,
                                 std::vector<Square>& moves) const {
    for (const auto& [dr, dc] : offsets) {
        Square target{from.row + dr, from.col + dc};
        if (!target.isValid()) {
            continue;
        }
        auto occupant = board_.pieceAt(target);
        if (!occupant || occupant->color != piece.color) {
            moves.push_back(target);
        }
    }
}

void MoveGenerator::addSlidingMoves(Square from, const Piece& piece,
                                    const std::vector<std::pair<int, int>>& directions,
                                    std::vector<Square>& moves) const {
    for (const auto& [dr, dc] : directions) {
        Square target{from.row + dr, from.col + dc};
        while (target.isValid()) {
            auto occupant = board_.pieceAt(target);
            if (!occupant) {
                moves.push_back(target);
            } else {
                if (occupant->color != piece.color) {
                    moves.push_back(target);
                }
                break;
            }
            target.row += dr;
            target.col += dc;
        }
    }
}

void MoveGenerator::addCastlingMoves(Square from, const Piece& king, std::vector<Square>& moves) const {
    if (king.has_moved) {
        return;
    }

    if (canCastle(from, king, BOARD_SIZE - 1)) {
        moves.push_back({from.row, from.col + 2});
    }
    if (canCastle(from, king, 0)) {
        moves.push_back({from.row, from.col - 2});
    }
}

bool MoveGenerator::canCastle(Square kingSquare, const Piece& king, int rookCol) const {
    auto rook = board_.pieceAt({kingSquare.row, rookCol});
    if (!rook || rook->type != PieceType::ROOK || rook->color != king.color || rook->has_moved) {
        return false;
    }

    const int step = rookCol > kingSquare.col ? 1 : -1;
    for (int col = kingSquare.col + step; col != rookCol; col += step) {
        if (board_.pieceAt({kingSquare.row, col})) {
            return false;
        }
    }

    // The king may not castle out of, through or into check
    const PieceColor enemy = oppositeColor(king.color);
    const Grid& grid = board_.grid();
    for (int i = 0; i <= 2; ++i) {
        Square square{kingSquare.row, kingSquare.col + i * step};
        if (!square.isValid() || isSquareAttacked(grid, square, enemy)) {
            return false;
        }
    }

    return true;
}

} // namespace chess
} // namespace chessmancer

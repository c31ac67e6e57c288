// include/chessmancer/chess/move_generator.h
#ifndef CHESSMANCER_MOVE_GENERATOR_H
#define CHESSMANCER_MOVE_GENERATOR_H

#include <vector>
#include <utility>
#include "chessmancer/chess/board_state.h"

namespace chessmancer {
namespace chess {

/**
 * @brief Pseudo-legal move generation
 *
 * Produces destinations that follow each piece's movement and capture
 * rules without checking whether the mover's own king is left in check.
 * That filtering is done by CheckValidator.
 */
class MoveGenerator {
public:
    /**
     * @brief Constructor
     *
     * @param board Board to generate moves on; must outlive the generator
     */
    explicit MoveGenerator(const BoardState& board);

    /**
     * @brief Pseudo-legal destinations for the piece on a square
     *
     * @param from Square of the piece
     * @return Destinations, empty if the square is empty
     */
    std::vector<Square> generate(Square from) const;

    /**
     * @brief Pseudo-legal moves of every piece of a color
     */
    std::vector<ChessMove> generateAll(PieceColor color) const;

private:
    const BoardState& board_;

    void addPawnMoves(Square from, const Piece& pawn, std::vector<Square>& moves) const;
    void addStepMoves(Square from, const Piece& piece,
                      const std::vector<std::pair<int, int>>& offsets,
                      std::vector<Square>& moves) const;
    void addSlidingMoves(Square from, const Piece& piece,
                         const std::vector<std::pair<int, int>>& directions,
                         std::vector<Square>& moves) const;
    void addCastlingMoves(Square from, const Piece& king, std::vector<Square>& moves) const;

    bool canCastle(Square kingSquare, const Piece& king, int rookCol) const;
    bool isEnemy(Square square, PieceColor color) const;
};

} // namespace chess
} // namespace chessmancer

#endif // CHESSMANCER_MOVE_GENERATOR_H

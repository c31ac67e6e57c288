// include/chessmancer/chess/board_state.h
#ifndef CHESSMANCER_BOARD_STATE_H
#define CHESSMANCER_BOARD_STATE_H

#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include "chessmancer/chess/chess_types.h"

namespace chessmancer {
namespace chess {

/**
 * @brief Canonical state of a chess game
 *
 * Holds the grid, the side to move, the move history, the en passant marker
 * and the game result. applyMove is the only operation that advances the
 * game; the setters below exist for building test and analysis positions.
 */
class BoardState {
public:
    /**
     * @brief Constructor, standard starting position
     */
    BoardState();

    /**
     * @brief Standard starting position
     */
    static BoardState standard();

    /**
     * @brief Board with no pieces, white to move
     */
    static BoardState empty();

    /**
     * @brief Get the piece on a square
     *
     * @param square Square to inspect
     * @return The piece, or nullopt if the square is empty or off the board
     */
    std::optional<Piece> pieceAt(Square square) const;

    /**
     * @brief Raw grid access (empty squares hold a NONE piece)
     */
    const Grid& grid() const { return grid_; }

    PieceColor turn() const { return turn_; }
    const std::vector<ChessMove>& moveHistory() const { return moveHistory_; }
    std::optional<Square> lastDoublePawnAdvance() const { return lastDoublePawnAdvance_; }
    int halfmoveClock() const { return halfmoveClock_; }

    /**
     * @brief FEN move number: starts at 1 and increases after each black move
     */
    int fullmoveNumber() const { return fullmoveNumber_; }

    /**
     * @brief Position keys after every ply, oldest first
     *
     * The last entry is always the key of the current position.
     */
    const std::vector<uint64_t>& positionKeys() const { return positionKeys_; }

    /**
     * @brief Zobrist key of the current position
     */
    uint64_t hash() const { return positionKeys_.back(); }

    bool isGameOver() const { return result_.isOver(); }
    const GameResult& result() const { return result_; }
    void setResult(const GameResult& result) { result_ = result; }

    /**
     * @brief Apply a move that the caller has already validated
     *
     * Handles castling rook relocation, en passant capture and promotion to
     * queen, then updates the en passant marker, history and turn. Legality
     * is not re-checked.
     *
     * @param from Origin square
     * @param to Destination square
     * @throws core::InvariantViolation if a square is off the board, the origin
     *         is empty, or a castling move has no rook to relocate. The board is
     *         unchanged when this is thrown.
     */
    void applyMove(Square from, Square to);

    // Position setup. Each of these restarts repetition tracking.
    void placePiece(Square square, PieceType type, PieceColor color, bool hasMoved = false);
    void removePiece(Square square);
    void setTurn(PieceColor color);
    void setLastDoublePawnAdvance(std::optional<Square> square);
    void setHalfmoveClock(int clock);
    void setFullmoveNumber(int number);

    /**
     * @brief Locate a color's king
     *
     * @return King square or nullopt if there is none
     */
    std::optional<Square> findKing(PieceColor color) const;

    /**
     * @brief Check structural invariants (exactly one king per color)
     *
     * @throws core::InvariantViolation on failure
     */
    void validate() const;

    /**
     * @brief ASCII diagram, white pieces upper case
     */
    std::string toString() const;

private:
    Grid grid_;
    PieceColor turn_;
    std::vector<ChessMove> moveHistory_;
    std::optional<Square> lastDoublePawnAdvance_;
    int halfmoveClock_;
    int fullmoveNumber_;
    std::vector<uint64_t> positionKeys_;
    GameResult result_;

    Piece& at(Square square) { return grid_[square.index()]; }
    const Piece& at(Square square) const { return grid_[square.index()]; }

    void initializeStartingPosition();
    uint64_t computeHash() const;
    // A pawn of the side to move stands beside the pawn that just advanced two squares
    bool hasEnPassantCapture() const;
    void restartPositionKeys();
};

} // namespace chess
} // namespace chessmancer

#endif // CHESSMANCER_BOARD_STATE_H

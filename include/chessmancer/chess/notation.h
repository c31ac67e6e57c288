// include/chessmancer/chess/notation.h
#ifndef CHESSMANCER_NOTATION_H
#define CHESSMANCER_NOTATION_H

#include <string>
#include <optional>
#include "chessmancer/chess/chess_types.h"

namespace chessmancer {
namespace chess {

class BoardState;

/**
 * @brief Convert a square to algebraic text ("e2")
 *
 * Row r maps to rank 8 - r, column c to file 'a' + c.
 */
std::string squareToString(Square square);

/**
 * @brief Parse algebraic square text
 *
 * @return The square, or nullopt if the text is not a square
 */
std::optional<Square> stringToSquare(const std::string& text);

/**
 * @brief Convert a move to coordinate notation ("e2e4")
 */
std::string moveToString(const ChessMove& move);

/**
 * @brief Parse coordinate notation
 *
 * A trailing promotion letter ("e7e8q") is accepted and ignored since
 * promotion is always to queen.
 */
std::optional<ChessMove> stringToMove(const std::string& text);

char pieceToChar(const Piece& piece);
std::string colorToString(PieceColor color);
std::string outcomeToString(GameOutcome outcome);
std::optional<GameOutcome> stringToOutcome(const std::string& text);

/**
 * @brief Human readable result ("Checkmate, white wins")
 */
std::string resultToString(const GameResult& result);

/**
 * @brief Forsyth-Edwards Notation of a position
 *
 * Castling rights are derived from the has_moved flags of kings and corner
 * rooks on their home squares.
 */
std::string toFEN(const BoardState& board);

} // namespace chess
} // namespace chessmancer

#endif // CHESSMANCER_NOTATION_H

// src/chess/chess_game.cpp
#include "chessmancer/chess/chess_game.h"
#include "chessmancer/chess/check_validator.h"
#include "chessmancer/chess/game_status.h"
#include "chessmancer/chess/notation.h"
#include "chessmancer/core/errors.h"
#include <algorithm>

namespace chessmancer {
namespace chess {

std::string IllegalMoveError::toString() const {
    return "Illegal move " + moveToString({from, to}) + ": " + reason;
}

MoveResult MoveResult::success(BoardState board) {
    MoveResult result;
    result.board_ = std::move(board);
    return result;
}

MoveResult MoveResult::failure(IllegalMoveError error) {
    MoveResult result;
    result.error_ = std::move(error);
    return result;
}

const BoardState& MoveResult::board() const {
    if (!board_) {
        throw core::GameStateException("No board in a failed move result: " + error_->toString());
    }
    return *board_;
}

const IllegalMoveError& MoveResult::error() const {
    if (!error_) {
        throw core::GameStateException("No error in a successful move result");
    }
    return *error_;
}

BoardState newGame() {
    return BoardState::standard();
}

std::vector<Square> legalMoves(const BoardState& board, Square square) {
    auto piece = board.pieceAt(square);
    if (!piece || piece->color != board.turn() || board.isGameOver()) {
        return {};
    }
    return CheckValidator(board).legalMoves(square);
}

MoveResult tryMove(const BoardState& board, Square from, Square to, const DrawRules& rules) {
    if (board.isGameOver()) {
        return MoveResult::failure({from, to, "the game is over"});
    }

    if (!from.isValid() || !to.isValid()) {
        return MoveResult::failure({from, to, "square is off the board"});
    }

    auto piece = board.pieceAt(from);
    if (!piece) {
        return MoveResult::failure({from, to, "no piece on " + squareToString(from)});
    }

    if (piece->color != board.turn()) {
        return MoveResult::failure({from, to, "it is " + colorToString(board.turn()) + "'s turn"});
    }

    auto legal = CheckValidator(board).legalMoves(from);
    if (std::find(legal.begin(), legal.end(), to) == legal.end()) {
        return MoveResult::failure({from, to, "not a legal move for this piece"});
    }

    BoardState next = board;
    next.applyMove(from, to);
    next.setResult(GameStatus(next, rules).evaluate());
    return MoveResult::success(std::move(next));
}

GameResult status(const BoardState& board, const DrawRules& rules) {
    return GameStatus(board, rules).evaluate();
}

BoardState reset(const BoardState& /*board*/) {
    return newGame();
}

ChessGame::ChessGame(const DrawRules& rules)
    : board_(newGame()),
      rules_(rules),
      generation_(0) {
}

std::vector<Square> ChessGame::legalMoves(Square square) const {
    return chess::legalMoves(board_, square);
}

MoveResult ChessGame::tryMove(Square from, Square to) {
    MoveResult result = chess::tryMove(board_, from, to, rules_);
    if (result.ok()) {
        board_ = result.board();
    }
    return result;
}

void ChessGame::makeMove(Square from, Square to) {
    MoveResult result = tryMove(from, to);
    if (!result.ok()) {
        throw core::IllegalMoveException(result.error().toString(), moveToString({from, to}));
    }
}

void ChessGame::reset() {
    board_ = chess::reset(board_);
    generation_++;
}

void ChessGame::setBoard(BoardState board) {
    board_ = std::move(board);
    generation_++;
}

} // namespace chess
} // namespace chessmancer

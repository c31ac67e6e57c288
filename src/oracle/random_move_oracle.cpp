// src/oracle/random_move_oracle.cpp
#include "chessmancer/oracle/random_move_oracle.h"
#include "chessmancer/chess/check_validator.h"

namespace chessmancer {
namespace oracle {

RandomMoveOracle::RandomMoveOracle(unsigned int seed)
    : rng_(seed != 0 ? seed : std::random_device{}()) {
}

std::optional<chess::ChessMove> RandomMoveOracle::bestMove(const chess::BoardState& board,
                                                           std::chrono::milliseconds /*timeBudget*/) {
    if (board.isGameOver()) {
        return std::nullopt;
    }

    auto moves = chess::CheckValidator(board).allLegalMoves(board.turn());
    if (moves.empty()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(rngMutex_);
    std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
    return moves[dist(rng_)];
}

} // namespace oracle
} // namespace chessmancer

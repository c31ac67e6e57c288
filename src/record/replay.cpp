// src/record/replay.cpp
#include "chessmancer/record/replay.h"
#include "chessmancer/chess/chess_game.h"
#include "chessmancer/chess/notation.h"
#include <spdlog/spdlog.h>

namespace chessmancer {
namespace record {

ReplayResult replayMoves(const std::vector<chess::ChessMove>& moves, const chess::DrawRules& rules) {
    ReplayResult result{chess::newGame(), {}};

    for (size_t i = 0; i < moves.size(); ++i) {
        const chess::ChessMove& move = moves[i];
        chess::MoveResult applied = chess::tryMove(result.board, move.from, move.to, rules);
        if (!applied.ok()) {
            spdlog::warn("MalformedReplay: skipping move {} ({}): {}",
                         i + 1, chess::moveToString(move), applied.error().reason);
            result.diagnostics.push_back({i, move, applied.error().reason});
            continue;
        }
        result.board = applied.board();
    }

    if (!result.isClean()) {
        spdlog::warn("MalformedReplay: {} of {} moves skipped", result.diagnostics.size(), moves.size());
    }

    return result;
}

} // namespace record
} // namespace chessmancer

// include/chessmancer/record/replay.h
#ifndef CHESSMANCER_REPLAY_H
#define CHESSMANCER_REPLAY_H

#include <cstddef>
#include <string>
#include <vector>
#include "chessmancer/chess/board_state.h"

namespace chessmancer {
namespace record {

/**
 * @brief A move that could not be replayed
 */
struct ReplayDiagnostic {
    size_t index;            // position in the supplied move list
    chess::ChessMove move;
    std::string reason;
};

/**
 * @brief Board reconstructed from a move list plus any skipped moves
 */
struct ReplayResult {
    chess::BoardState board;
    std::vector<ReplayDiagnostic> diagnostics;

    bool isClean() const { return diagnostics.empty(); }
};

/**
 * @brief Rebuild a game by playing moves from the starting position
 *
 * A move that is not legal in the reconstructed position is skipped and
 * reported; no other move is substituted for it. The caller decides
 * whether a replay with diagnostics is acceptable.
 *
 * @param moves Moves in play order
 * @param rules Draw rules for evaluating the positions
 * @return Final board and diagnostics
 */
ReplayResult replayMoves(const std::vector<chess::ChessMove>& moves,
                         const chess::DrawRules& rules = chess::DrawRules());

} // namespace record
} // namespace chessmancer

#endif // CHESSMANCER_REPLAY_H

// include/chessmancer/oracle/random_move_oracle.h
#ifndef CHESSMANCER_RANDOM_MOVE_ORACLE_H
#define CHESSMANCER_RANDOM_MOVE_ORACLE_H

#include <mutex>
#include <random>
#include "chessmancer/oracle/move_oracle.h"

namespace chessmancer {
namespace oracle {

/**
 * @brief Oracle that picks a uniformly random legal move
 *
 * Always available. Used on its own and as the fallback when the external
 * engine fails.
 */
class RandomMoveOracle : public MoveOracle {
public:
    /**
     * @brief Constructor
     *
     * @param seed Random seed (0 for random)
     */
    explicit RandomMoveOracle(unsigned int seed = 0);

    std::optional<chess::ChessMove> bestMove(const chess::BoardState& board,
                                             std::chrono::milliseconds timeBudget) override;

    bool isAvailable() const override { return true; }
    std::string getName() const override { return "random"; }

private:
    std::mutex rngMutex_;
    std::mt19937 rng_;
};

} // namespace oracle
} // namespace chessmancer

#endif // CHESSMANCER_RANDOM_MOVE_ORACLE_H

#include <gtest/gtest.h>
#include <algorithm>
#include "chessmancer/oracle/random_move_oracle.h"
#include "chessmancer/chess/check_validator.h"
#include "chessmancer/chess/chess_game.h"

namespace chessmancer {
namespace oracle {

using namespace chessmancer::chess;

class RandomMoveOracleTest : public ::testing::Test {
protected:
    void SetUp() override {
        oracle = std::make_unique<RandomMoveOracle>(42);
    }

    std::unique_ptr<RandomMoveOracle> oracle;
};

TEST_F(RandomMoveOracleTest, BasicProperties) {
    EXPECT_TRUE(oracle->isAvailable());
    EXPECT_EQ(oracle->getName(), "random");
    EXPECT_FALSE(oracle->setSkillLevel(5));
}

TEST_F(RandomMoveOracleTest, SuggestsLegalMoves) {
    BoardState board = newGame();
    for (int i = 0; i < 40 && !board.isGameOver(); ++i) {
        auto move = oracle->bestMove(board, std::chrono::milliseconds(10));
        ASSERT_TRUE(move.has_value());

        auto legal = CheckValidator(board).allLegalMoves(board.turn());
        EXPECT_NE(std::find(legal.begin(), legal.end(), *move), legal.end());

        MoveResult result = tryMove(board, move->from, move->to);
        ASSERT_TRUE(result.ok());
        board = result.board();
    }
}

TEST_F(RandomMoveOracleTest, SameSeedSameMoves) {
    RandomMoveOracle other(42);
    BoardState board = newGame();
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(oracle->bestMove(board, std::chrono::milliseconds(1)),
                  other.bestMove(board, std::chrono::milliseconds(1)));
    }
}

TEST_F(RandomMoveOracleTest, NoMoveWhenNoneExist) {
    BoardState board = BoardState::empty();
    board.placePiece({0, 0}, PieceType::KING, PieceColor::WHITE, true);
    board.placePiece({7, 7}, PieceType::KING, PieceColor::BLACK, true);
    board.placePiece({1, 2}, PieceType::QUEEN, PieceColor::BLACK, true);
    EXPECT_FALSE(oracle->bestMove(board, std::chrono::milliseconds(1)).has_value());

    BoardState finished = newGame();
    finished.setResult({GameOutcome::STALEMATE, PieceColor::NONE});
    EXPECT_FALSE(oracle->bestMove(finished, std::chrono::milliseconds(1)).has_value());
}

} // namespace oracle
} // namespace chessmancer

#include <gtest/gtest.h>
#include "chessmancer/chess/move_generator.h"
#include <algorithm>

namespace chessmancer {
namespace chess {

class MoveGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        board = BoardState::empty();
    }

    static bool contains(const std::vector<Square>& squares, Square square) {
        return std::find(squares.begin(), squares.end(), square) != squares.end();
    }

    std::vector<Square> movesFrom(Square square) const {
        return MoveGenerator(board).generate(square);
    }

    BoardState board;
};

TEST_F(MoveGeneratorTest, StartingPositionHasTwentyMoves) {
    BoardState start;
    EXPECT_EQ(MoveGenerator(start).generateAll(PieceColor::WHITE).size(), 20u);
    EXPECT_EQ(MoveGenerator(start).generateAll(PieceColor::BLACK).size(), 20u);
}

TEST_F(MoveGeneratorTest, EmptySquareHasNoMoves) {
    EXPECT_TRUE(movesFrom({4, 4}).empty());
}

TEST_F(MoveGeneratorTest, PawnForwardBoundary) {
    board.placePiece({6, 4}, PieceType::PAWN, PieceColor::WHITE);
    auto moves = movesFrom({6, 4});
    EXPECT_EQ(moves.size(), 2u);
    EXPECT_TRUE(contains(moves, {5, 4}));
    EXPECT_TRUE(contains(moves, {4, 4}));

    // Two-square destination blocked
    board.placePiece({4, 4}, PieceType::KNIGHT, PieceColor::BLACK);
    moves = movesFrom({6, 4});
    EXPECT_EQ(moves.size(), 1u);
    EXPECT_TRUE(contains(moves, {5, 4}));

    // Single step blocked as well
    board.placePiece({5, 4}, PieceType::KNIGHT, PieceColor::BLACK);
    EXPECT_TRUE(movesFrom({6, 4}).empty());

    // Single step blocked, two-square destination free
    board.removePiece({4, 4});
    EXPECT_TRUE(movesFrom({6, 4}).empty());
}

TEST_F(MoveGeneratorTest, BlackPawnMovesDown) {
    board.placePiece({1, 2}, PieceType::PAWN, PieceColor::BLACK);
    auto moves = movesFrom({1, 2});
    EXPECT_EQ(moves.size(), 2u);
    EXPECT_TRUE(contains(moves, {2, 2}));
    EXPECT_TRUE(contains(moves, {3, 2}));
}

TEST_F(MoveGeneratorTest, PawnNotOnStartRowMovesOneSquare) {
    board.placePiece({5, 4}, PieceType::PAWN, PieceColor::WHITE, true);
    auto moves = movesFrom({5, 4});
    ASSERT_EQ(moves.size(), 1u);
    EXPECT_EQ(moves[0], (Square{4, 4}));
}

TEST_F(MoveGeneratorTest, PawnCapturesOnlyEnemies) {
    board.placePiece({4, 4}, PieceType::PAWN, PieceColor::WHITE, true);
    board.placePiece({3, 3}, PieceType::ROOK, PieceColor::BLACK);
    board.placePiece({3, 5}, PieceType::ROOK, PieceColor::WHITE);
    auto moves = movesFrom({4, 4});
    EXPECT_TRUE(contains(moves, {3, 3}));
    EXPECT_FALSE(contains(moves, {3, 5}));
    EXPECT_TRUE(contains(moves, {3, 4}));
}

TEST_F(MoveGeneratorTest, EnPassantOnlyAgainstMarkedPawn) {
    board.placePiece({3, 4}, PieceType::PAWN, PieceColor::WHITE, true);
    board.placePiece({3, 3}, PieceType::PAWN, PieceColor::BLACK, true);
    board.placePiece({3, 5}, PieceType::PAWN, PieceColor::BLACK, true);
    board.setLastDoublePawnAdvance(Square{3, 3});

    auto moves = movesFrom({3, 4});
    EXPECT_TRUE(contains(moves, {2, 3}));
    EXPECT_FALSE(contains(moves, {2, 5}));

    board.setLastDoublePawnAdvance(std::nullopt);
    moves = movesFrom({3, 4});
    EXPECT_FALSE(contains(moves, {2, 3}));
}

TEST_F(MoveGeneratorTest, KnightInCorner) {
    board.placePiece({7, 0}, PieceType::KNIGHT, PieceColor::WHITE);
    board.placePiece({5, 1}, PieceType::PAWN, PieceColor::WHITE);
    auto moves = movesFrom({7, 0});
    ASSERT_EQ(moves.size(), 1u);
    EXPECT_EQ(moves[0], (Square{6, 2}));
}

TEST_F(MoveGeneratorTest, SlidersStopAtFirstPiece) {
    board.placePiece({4, 4}, PieceType::ROOK, PieceColor::WHITE);
    board.placePiece({4, 6}, PieceType::PAWN, PieceColor::BLACK);
    board.placePiece({2, 4}, PieceType::PAWN, PieceColor::WHITE);
    auto moves = movesFrom({4, 4});

    EXPECT_TRUE(contains(moves, {4, 5}));
    EXPECT_TRUE(contains(moves, {4, 6}));
    EXPECT_FALSE(contains(moves, {4, 7}));
    EXPECT_TRUE(contains(moves, {3, 4}));
    EXPECT_FALSE(contains(moves, {2, 4}));
    // 4 left + 2 right + 1 up + 3 down
    EXPECT_EQ(moves.size(), 10u);
}

TEST_F(MoveGeneratorTest, QueenAndBishopRays) {
    board.placePiece({4, 3}, PieceType::QUEEN, PieceColor::WHITE);
    EXPECT_EQ(movesFrom({4, 3}).size(), 27u);

    board.placePiece({0, 0}, PieceType::BISHOP, PieceColor::BLACK);
    EXPECT_EQ(movesFrom({0, 0}).size(), 7u);
}

TEST_F(MoveGeneratorTest, CastlingCandidates) {
    board.placePiece({7, 4}, PieceType::KING, PieceColor::WHITE);
    board.placePiece({7, 7}, PieceType::ROOK, PieceColor::WHITE);
    board.placePiece({7, 0}, PieceType::ROOK, PieceColor::WHITE);

    auto moves = movesFrom({7, 4});
    EXPECT_TRUE(contains(moves, {7, 6}));
    EXPECT_TRUE(contains(moves, {7, 2}));
}

TEST_F(MoveGeneratorTest, NoCastlingWithMovedRookOrBlockedPath) {
    board.placePiece({7, 4}, PieceType::KING, PieceColor::WHITE);
    board.placePiece({7, 7}, PieceType::ROOK, PieceColor::WHITE, true);
    board.placePiece({7, 0}, PieceType::ROOK, PieceColor::WHITE);
    board.placePiece({7, 1}, PieceType::KNIGHT, PieceColor::WHITE);

    auto moves = movesFrom({7, 4});
    EXPECT_FALSE(contains(moves, {7, 6}));
    EXPECT_FALSE(contains(moves, {7, 2}));
}

TEST_F(MoveGeneratorTest, NoCastlingWithMovedKingOrEnemyRook) {
    board.placePiece({7, 4}, PieceType::KING, PieceColor::WHITE, true);
    board.placePiece({7, 7}, PieceType::ROOK, PieceColor::WHITE);
    EXPECT_FALSE(contains(movesFrom({7, 4}), {7, 6}));

    board.placePiece({7, 4}, PieceType::KING, PieceColor::WHITE);
    board.placePiece({7, 7}, PieceType::ROOK, PieceColor::BLACK);
    EXPECT_FALSE(contains(movesFrom({7, 4}), {7, 6}));
}

TEST_F(MoveGeneratorTest, NoCastlingOutOfCheck) {
    board.placePiece({7, 4}, PieceType::KING, PieceColor::WHITE);
    board.placePiece({7, 7}, PieceType::ROOK, PieceColor::WHITE);
    board.placePiece({2, 4}, PieceType::ROOK, PieceColor::BLACK);
    EXPECT_FALSE(contains(movesFrom({7, 4}), {7, 6}));
}

TEST_F(MoveGeneratorTest, QueensideCastlingIgnoresAttackOnRookSideSquare) {
    // b1 is attacked but the king never crosses it
    board.placePiece({7, 4}, PieceType::KING, PieceColor::WHITE);
    board.placePiece({7, 0}, PieceType::ROOK, PieceColor::WHITE);
    board.placePiece({2, 1}, PieceType::ROOK, PieceColor::BLACK);
    EXPECT_TRUE(contains(movesFrom({7, 4}), {7, 2}));

    board.placePiece({2, 3}, PieceType::ROOK, PieceColor::BLACK);
    EXPECT_FALSE(contains(movesFrom({7, 4}), {7, 2}));
}

} // namespace chess
} // namespace chessmancer

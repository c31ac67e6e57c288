#include <gtest/gtest.h>
#include "chessmancer/chess/game_status.h"
#include "chessmancer/chess/chess_game.h"
#include "chessmancer/chess/notation.h"
#include "chessmancer/core/errors.h"

namespace chessmancer {
namespace chess {

class GameStatusTest : public ::testing::Test {
protected:
    void SetUp() override {
        board = BoardState::empty();
    }

    void placeKings() {
        board.placePiece({7, 4}, PieceType::KING, PieceColor::WHITE);
        board.placePiece({0, 4}, PieceType::KING, PieceColor::BLACK);
    }

    BoardState board;
};

TEST_F(GameStatusTest, CheckmateInTheCorner) {
    board.placePiece({0, 7}, PieceType::KING, PieceColor::WHITE, true);
    board.placePiece({7, 0}, PieceType::KING, PieceColor::BLACK, true);
    board.placePiece({1, 6}, PieceType::ROOK, PieceColor::BLACK, true);
    board.placePiece({1, 7}, PieceType::ROOK, PieceColor::BLACK, true);
    GameStatus status(board);

    EXPECT_TRUE(status.isInCheck(PieceColor::WHITE));
    EXPECT_TRUE(status.isCheckmate(PieceColor::WHITE));
    EXPECT_FALSE(status.isStalemate(PieceColor::WHITE));

    GameResult result = status.evaluate();
    EXPECT_EQ(result.outcome, GameOutcome::CHECKMATE);
    EXPECT_EQ(result.winner, PieceColor::BLACK);
}

TEST_F(GameStatusTest, StalemateIsNotCheckmate) {
    board.placePiece({0, 0}, PieceType::KING, PieceColor::WHITE, true);
    board.placePiece({7, 7}, PieceType::KING, PieceColor::BLACK, true);
    board.placePiece({1, 2}, PieceType::QUEEN, PieceColor::BLACK, true);
    GameStatus status(board);

    EXPECT_FALSE(status.isInCheck(PieceColor::WHITE));
    EXPECT_TRUE(legalMoves(board, {0, 0}).empty());
    EXPECT_FALSE(status.isCheckmate(PieceColor::WHITE));
    EXPECT_TRUE(status.isStalemate(PieceColor::WHITE));
    EXPECT_EQ(status.evaluate().outcome, GameOutcome::STALEMATE);
    EXPECT_EQ(status.evaluate().winner, PieceColor::NONE);
}

TEST_F(GameStatusTest, StartingPositionInProgress) {
    BoardState start;
    GameStatus status(start);
    EXPECT_FALSE(status.isInCheck(PieceColor::WHITE));
    EXPECT_TRUE(status.hasAnyLegalMove(PieceColor::WHITE));
    EXPECT_FALSE(status.hasInsufficientMaterial());
    EXPECT_EQ(status.evaluate().outcome, GameOutcome::IN_PROGRESS);
}

TEST_F(GameStatusTest, InsufficientMaterial) {
    placeKings();
    EXPECT_TRUE(GameStatus(board).hasInsufficientMaterial());

    board.placePiece({5, 5}, PieceType::KNIGHT, PieceColor::WHITE);
    EXPECT_TRUE(GameStatus(board).hasInsufficientMaterial());

    board.removePiece({5, 5});
    board.placePiece({5, 5}, PieceType::BISHOP, PieceColor::BLACK);
    EXPECT_TRUE(GameStatus(board).hasInsufficientMaterial());

    // Bishops on squares of the same color
    board.placePiece({5, 3}, PieceType::BISHOP, PieceColor::WHITE);
    EXPECT_TRUE(GameStatus(board).hasInsufficientMaterial());
    EXPECT_EQ(GameStatus(board).evaluate().outcome, GameOutcome::DRAW_INSUFFICIENT_MATERIAL);

    // Opposite colored bishops can still mate
    board.removePiece({5, 3});
    board.placePiece({5, 4}, PieceType::BISHOP, PieceColor::WHITE);
    EXPECT_FALSE(GameStatus(board).hasInsufficientMaterial());
}

TEST_F(GameStatusTest, SameColoredBishopsOfAnyNumber) {
    placeKings();
    // All on dark squares: (row + col) odd
    board.placePiece({5, 2}, PieceType::BISHOP, PieceColor::WHITE);
    board.placePiece({4, 3}, PieceType::BISHOP, PieceColor::WHITE);
    EXPECT_TRUE(GameStatus(board).hasInsufficientMaterial());

    board.placePiece({2, 5}, PieceType::BISHOP, PieceColor::BLACK);
    EXPECT_TRUE(GameStatus(board).hasInsufficientMaterial());
    EXPECT_EQ(GameStatus(board).evaluate().outcome, GameOutcome::DRAW_INSUFFICIENT_MATERIAL);

    board.placePiece({2, 2}, PieceType::BISHOP, PieceColor::BLACK);
    EXPECT_FALSE(GameStatus(board).hasInsufficientMaterial());
}

TEST_F(GameStatusTest, KnightsWithOtherMinorPieces) {
    placeKings();
    board.placePiece({5, 5}, PieceType::KNIGHT, PieceColor::WHITE);
    board.placePiece({2, 2}, PieceType::BISHOP, PieceColor::BLACK);
    EXPECT_FALSE(GameStatus(board).hasInsufficientMaterial());

    board.removePiece({2, 2});
    board.placePiece({2, 2}, PieceType::KNIGHT, PieceColor::BLACK);
    EXPECT_FALSE(GameStatus(board).hasInsufficientMaterial());
}

TEST_F(GameStatusTest, SufficientMaterial) {
    placeKings();
    board.placePiece({6, 0}, PieceType::PAWN, PieceColor::WHITE);
    EXPECT_FALSE(GameStatus(board).hasInsufficientMaterial());

    board.removePiece({6, 0});
    board.placePiece({5, 5}, PieceType::KNIGHT, PieceColor::WHITE);
    board.placePiece({5, 6}, PieceType::KNIGHT, PieceColor::WHITE);
    EXPECT_FALSE(GameStatus(board).hasInsufficientMaterial());
}

TEST_F(GameStatusTest, FiftyMoveRule) {
    placeKings();
    board.placePiece({7, 0}, PieceType::ROOK, PieceColor::WHITE);
    board.setHalfmoveClock(99);
    EXPECT_FALSE(GameStatus(board).isFiftyMoveRule());

    board.setHalfmoveClock(100);
    EXPECT_TRUE(GameStatus(board).isFiftyMoveRule());
    EXPECT_EQ(GameStatus(board).evaluate().outcome, GameOutcome::DRAW_FIFTY_MOVE);

    DrawRules noFifty;
    noFifty.fiftyMove = false;
    EXPECT_EQ(GameStatus(board, noFifty).evaluate().outcome, GameOutcome::IN_PROGRESS);
}

TEST_F(GameStatusTest, ThreefoldRepetition) {
    BoardState game;
    const ChessMove shuffle[] = {
        {{7, 6}, {5, 5}}, {{0, 6}, {2, 5}}, {{5, 5}, {7, 6}}, {{2, 5}, {0, 6}}
    };

    for (const auto& move : shuffle) {
        game.applyMove(move.from, move.to);
    }
    EXPECT_FALSE(GameStatus(game).isThreefoldRepetition());

    for (const auto& move : shuffle) {
        game.applyMove(move.from, move.to);
    }
    EXPECT_TRUE(GameStatus(game).isThreefoldRepetition());
    EXPECT_EQ(GameStatus(game).evaluate().outcome, GameOutcome::DRAW_REPETITION);

    DrawRules noRepetition;
    noRepetition.repetition = false;
    EXPECT_EQ(GameStatus(game, noRepetition).evaluate().outcome, GameOutcome::IN_PROGRESS);
}

TEST_F(GameStatusTest, RepetitionAfterDoublePawnPush) {
    BoardState game;
    const char* moves[] = {"e2e4", "g8f6", "g1f3", "f6g8", "f3g1", "g8f6", "g1f3", "f6g8", "f3g1"};
    for (const char* text : moves) {
        auto move = stringToMove(text);
        ASSERT_TRUE(move.has_value());
        game.applyMove(move->from, move->to);
    }

    EXPECT_TRUE(GameStatus(game).isThreefoldRepetition());
    EXPECT_EQ(GameStatus(game).evaluate().outcome, GameOutcome::DRAW_REPETITION);
}

TEST_F(GameStatusTest, MissingKingIsAnInvariantViolation) {
    board.placePiece({0, 4}, PieceType::KING, PieceColor::BLACK);
    board.placePiece({7, 0}, PieceType::ROOK, PieceColor::WHITE);
    EXPECT_THROW(GameStatus(board).evaluate(), core::InvariantViolation);
    EXPECT_THROW(status(board), core::InvariantViolation);
}

TEST_F(GameStatusTest, SecondKingIsAnInvariantViolation) {
    BoardState start;
    start.placePiece({4, 4}, PieceType::KING, PieceColor::WHITE);
    EXPECT_THROW(GameStatus(start).evaluate(), core::InvariantViolation);
}

TEST_F(GameStatusTest, CheckmateTakesPrecedenceOverDraws) {
    board.placePiece({0, 7}, PieceType::KING, PieceColor::WHITE, true);
    board.placePiece({7, 0}, PieceType::KING, PieceColor::BLACK, true);
    board.placePiece({1, 6}, PieceType::ROOK, PieceColor::BLACK, true);
    board.placePiece({1, 7}, PieceType::ROOK, PieceColor::BLACK, true);
    board.setHalfmoveClock(120);
    EXPECT_EQ(GameStatus(board).evaluate().outcome, GameOutcome::CHECKMATE);
}

} // namespace chess
} // namespace chessmancer

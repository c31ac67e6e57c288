#include <gtest/gtest.h>
#include <atomic>
#include "chessmancer/session/game_session.h"
#include "chessmancer/chess/chess_game.h"

namespace chessmancer {
namespace session {

using namespace chessmancer::chess;

namespace {

// Oracle that always answers with the same move, legal or not
class FixedMoveOracle : public oracle::MoveOracle {
public:
    explicit FixedMoveOracle(std::optional<ChessMove> move) : move_(move) {}

    std::optional<ChessMove> bestMove(const BoardState& /*board*/,
                                      std::chrono::milliseconds /*timeBudget*/) override {
        calls_++;
        return move_;
    }

    bool isAvailable() const override { return true; }
    std::string getName() const override { return "fixed"; }

    int calls() const { return calls_; }

private:
    std::optional<ChessMove> move_;
    std::atomic<int> calls_{0};
};

} // namespace

class GameSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        engineConfig.aiColor = PieceColor::BLACK;
        engineConfig.seed = 99;
        engineConfig.moveTimeMs = 5;
    }

    std::unique_ptr<GameSession> makeSession(std::optional<ChessMove> oracleMove) {
        auto oracle = std::make_unique<FixedMoveOracle>(oracleMove);
        fixed = oracle.get();
        return std::make_unique<GameSession>(std::move(oracle), engineConfig);
    }

    config::EngineConfig engineConfig;
    FixedMoveOracle* fixed = nullptr;
};

TEST_F(GameSessionTest, NullOracleUsesRandom) {
    GameSession session(nullptr, engineConfig);
    EXPECT_EQ(session.getOracleName(), "random");
    EXPECT_FALSE(session.setSkillLevel(3));
    EXPECT_EQ(session.getConfig().skillLevel, 3);
}

TEST_F(GameSessionTest, PlayMoveAndOracleReply) {
    auto session = makeSession(ChessMove{{1, 4}, {3, 4}});

    EXPECT_FALSE(session->isOracleTurn());
    ASSERT_TRUE(session->playMove({6, 4}, {4, 4}).ok());
    EXPECT_TRUE(session->isOracleTurn());

    auto reply = session->playOracleMove();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, (ChessMove{{1, 4}, {3, 4}}));
    EXPECT_EQ(fixed->calls(), 1);

    BoardState board = session->board();
    EXPECT_EQ(board.moveHistory().size(), 2u);
    EXPECT_EQ(board.turn(), PieceColor::WHITE);
    EXPECT_FALSE(session->isOracleTurn());
}

TEST_F(GameSessionTest, RejectedPlayerMove) {
    auto session = makeSession(std::nullopt);
    MoveResult result = session->playMove({6, 4}, {3, 4});
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(session->board().moveHistory().empty());
}

TEST_F(GameSessionTest, IllegalSuggestionFallsBackToLegalMove) {
    // Rook through its own pawn
    auto session = makeSession(ChessMove{{0, 0}, {4, 0}});
    ASSERT_TRUE(session->playMove({6, 4}, {4, 4}).ok());

    auto reply = session->playOracleMove();
    ASSERT_TRUE(reply.has_value());
    EXPECT_NE(*reply, (ChessMove{{0, 0}, {4, 0}}));

    BoardState board = session->board();
    EXPECT_EQ(board.moveHistory().size(), 2u);
    EXPECT_EQ(board.moveHistory().back(), *reply);
}

TEST_F(GameSessionTest, MissingSuggestionFallsBackToLegalMove) {
    auto session = makeSession(std::nullopt);
    ASSERT_TRUE(session->playMove({6, 3}, {4, 3}).ok());

    auto reply = session->playOracleMove();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(session->board().moveHistory().size(), 2u);
}

TEST_F(GameSessionTest, StaleAnswerAfterResetIsDiscarded) {
    auto session = makeSession(ChessMove{{1, 4}, {3, 4}});
    ASSERT_TRUE(session->playMove({6, 4}, {4, 4}).ok());

    OracleQuery query = session->requestOracleMove();
    EXPECT_EQ(query.generation, 0u);
    EXPECT_EQ(query.ply, 1u);

    session->reset();
    EXPECT_EQ(session->generation(), 1u);

    EXPECT_FALSE(session->applyOracleResponse(query).has_value());
    EXPECT_TRUE(session->board().moveHistory().empty());
}

TEST_F(GameSessionTest, StaleAnswerAfterMoveIsDiscarded) {
    auto session = makeSession(ChessMove{{1, 4}, {3, 4}});
    session->setOracleColor(PieceColor::NONE);

    OracleQuery query = session->requestOracleMove();
    ASSERT_TRUE(session->playMove({6, 3}, {4, 3}).ok());

    EXPECT_FALSE(session->applyOracleResponse(query).has_value());
    EXPECT_EQ(session->board().moveHistory().size(), 1u);
}

TEST_F(GameSessionTest, LoadBoardInvalidatesQueries) {
    auto session = makeSession(ChessMove{{6, 4}, {4, 4}});
    OracleQuery query = session->requestOracleMove();

    session->loadBoard(newGame());
    EXPECT_FALSE(session->applyOracleResponse(query).has_value());

    OracleQuery fresh = session->requestOracleMove();
    auto move = session->applyOracleResponse(fresh);
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(session->board().moveHistory().size(), 1u);
}

TEST_F(GameSessionTest, NoOracleMoveAfterGameOver) {
    auto session = makeSession(std::nullopt);
    ASSERT_TRUE(session->playMove({6, 5}, {5, 5}).ok());
    ASSERT_TRUE(session->playMove({1, 4}, {3, 4}).ok());
    ASSERT_TRUE(session->playMove({6, 6}, {4, 6}).ok());
    ASSERT_TRUE(session->playMove({0, 3}, {4, 7}).ok());

    EXPECT_EQ(session->status().outcome, GameOutcome::CHECKMATE);
    EXPECT_FALSE(session->isOracleTurn());
    EXPECT_FALSE(session->playOracleMove().has_value());
    EXPECT_EQ(fixed->calls(), 0);
}

TEST_F(GameSessionTest, SettingsAreClamped) {
    auto session = makeSession(std::nullopt);
    session->setMoveTime(0);
    EXPECT_EQ(session->getConfig().moveTimeMs, 1);
    session->setSkillLevel(50);
    EXPECT_EQ(session->getConfig().skillLevel, config::MAX_SKILL_LEVEL);
}

} // namespace session
} // namespace chessmancer

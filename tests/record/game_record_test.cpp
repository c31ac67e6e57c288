#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "chessmancer/record/game_record.h"
#include "chessmancer/chess/chess_game.h"

namespace chessmancer {
namespace record {

using json = nlohmann::json;
using namespace chessmancer::chess;

class GameRecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        ChessGame game;
        game.makeMove({6, 5}, {5, 5});
        game.makeMove({1, 4}, {3, 4});
        game.makeMove({6, 6}, {4, 6});
        game.makeMove({0, 3}, {4, 7});
        finished = game.board();
    }

    BoardState finished;
};

TEST_F(GameRecordTest, FromBoard) {
    GameRecord record = GameRecord::fromBoard(finished);
    EXPECT_EQ(record.getMoves().size(), 4u);
    EXPECT_EQ(record.getMoves()[3], (ChessMove{{0, 3}, {4, 7}}));
    EXPECT_EQ(record.getResult().outcome, GameOutcome::CHECKMATE);
    EXPECT_EQ(record.getResult().winner, PieceColor::BLACK);
}

TEST_F(GameRecordTest, JsonLayout) {
    json j = json::parse(GameRecord::fromBoard(finished).toJson());

    EXPECT_EQ(j["format"], "chessmancer-record");
    EXPECT_EQ(j["version"], 1);
    EXPECT_EQ(j["result"], "checkmate");
    EXPECT_EQ(j["winner"], "black");
    ASSERT_EQ(j["moves"].size(), 4u);
    EXPECT_EQ(j["moves"][0]["from"], "f2");
    EXPECT_EQ(j["moves"][0]["to"], "f3");
    EXPECT_EQ(j["moves"][3]["to"], "h4");
    EXPECT_TRUE(j["timestamp"].is_string());
}

TEST_F(GameRecordTest, InProgressHasNoWinner) {
    GameRecord record;
    record.addMove({{6, 4}, {4, 4}});
    json j = json::parse(record.toJson());
    EXPECT_EQ(j["result"], "in_progress");
    EXPECT_TRUE(j["winner"].is_null());
}

TEST_F(GameRecordTest, ParseRecord) {
    GameRecord original = GameRecord::fromBoard(finished);
    GameRecord parsed = GameRecord::fromJson(original.toJson());

    EXPECT_EQ(parsed.getMoves(), original.getMoves());
    EXPECT_EQ(parsed.getResult(), original.getResult());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(parsed.getTimestamp()),
              std::chrono::system_clock::to_time_t(original.getTimestamp()));
}

TEST_F(GameRecordTest, RejectsForeignDocuments) {
    EXPECT_THROW(GameRecord::fromJson("not json"), RecordError);
    EXPECT_THROW(GameRecord::fromJson(R"({"format":"other","version":1,"moves":[]})"), RecordError);
    EXPECT_THROW(GameRecord::fromJson(R"({"format":"chessmancer-record","version":2,"moves":[]})"),
                 RecordError);
    EXPECT_THROW(GameRecord::fromJson(R"({"format":"chessmancer-record","version":1})"), RecordError);
    EXPECT_THROW(GameRecord::fromJson(
                     R"({"format":"chessmancer-record","version":1,"moves":[{"from":"z9","to":"e4"}]})"),
                 RecordError);
    EXPECT_THROW(GameRecord::fromJson(
                     R"({"format":"chessmancer-record","version":1,"result":"won","moves":[]})"),
                 RecordError);
}

TEST_F(GameRecordTest, SaveAndLoadFile) {
    std::string path = (std::filesystem::temp_directory_path() / "chessmancer_record_test.json").string();
    GameRecord::fromBoard(finished).saveToFile(path);

    GameRecord loaded = GameRecord::loadFromFile(path);
    EXPECT_EQ(loaded.getMoves(), finished.moveHistory());
    EXPECT_EQ(loaded.getResult().outcome, GameOutcome::CHECKMATE);

    std::remove(path.c_str());
    EXPECT_THROW(GameRecord::loadFromFile(path), RecordError);
}

} // namespace record
} // namespace chessmancer

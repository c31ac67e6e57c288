// include/chessmancer/record/game_record.h
#ifndef CHESSMANCER_GAME_RECORD_H
#define CHESSMANCER_GAME_RECORD_H

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include "chessmancer/chess/board_state.h"

namespace chessmancer {
namespace record {

/**
 * @brief Failure to read, parse or write a game record
 */
class RecordError : public std::runtime_error {
public:
    explicit RecordError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Record of a played game
 *
 * Stored as JSON:
 * {"format": "chessmancer-record", "version": 1, "timestamp": "...",
 *  "result": "checkmate", "winner": "white",
 *  "moves": [{"from": "e2", "to": "e4"}, ...]}
 */
class GameRecord {
public:
    static constexpr const char* FORMAT_NAME = "chessmancer-record";
    static constexpr int FORMAT_VERSION = 1;

    GameRecord();

    /**
     * @brief Record of a board's history and result
     */
    static GameRecord fromBoard(const chess::BoardState& board);

    void addMove(const chess::ChessMove& move);
    const std::vector<chess::ChessMove>& getMoves() const { return moves_; }

    void setResult(const chess::GameResult& result) { result_ = result; }
    const chess::GameResult& getResult() const { return result_; }

    std::chrono::system_clock::time_point getTimestamp() const { return timestamp_; }

    std::string toJson() const;

    /**
     * @brief Parse a record
     *
     * @throws RecordError on malformed JSON, a foreign format or bad squares
     */
    static GameRecord fromJson(const std::string& jsonStr);

    /**
     * @brief Write the record
     *
     * @throws RecordError if the file cannot be written
     */
    void saveToFile(const std::string& filename) const;

    /**
     * @brief Read a record
     *
     * @throws RecordError if the file cannot be read or parsed
     */
    static GameRecord loadFromFile(const std::string& filename);

private:
    std::vector<chess::ChessMove> moves_;
    chess::GameResult result_;
    std::chrono::system_clock::time_point timestamp_;
};

} // namespace record
} // namespace chessmancer

#endif // CHESSMANCER_GAME_RECORD_H

// src/record/game_record.cpp
#include "chessmancer/record/game_record.h"
#include "chessmancer/chess/notation.h"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

namespace chessmancer {
namespace record {

using json = nlohmann::json;

namespace {

chess::Square parseSquare(const json& value) {
    std::string text = value.get<std::string>();
    auto square = chess::stringToSquare(text);
    if (!square) {
        throw RecordError("Invalid square '" + text + "' in game record");
    }
    return *square;
}

std::chrono::system_clock::time_point parseTimestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) {
        return std::chrono::system_clock::now();
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace

GameRecord::GameRecord()
    : timestamp_(std::chrono::system_clock::now()) {
}

GameRecord GameRecord::fromBoard(const chess::BoardState& board) {
    GameRecord record;
    record.moves_ = board.moveHistory();
    record.result_ = board.result();
    return record;
}

void GameRecord::addMove(const chess::ChessMove& move) {
    moves_.push_back(move);
}

std::string GameRecord::toJson() const {
    json j;
    j["format"] = FORMAT_NAME;
    j["version"] = FORMAT_VERSION;

    auto time = std::chrono::system_clock::to_time_t(timestamp_);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%FT%TZ");
    j["timestamp"] = ss.str();

    j["result"] = chess::outcomeToString(result_.outcome);
    if (result_.outcome == chess::GameOutcome::CHECKMATE) {
        j["winner"] = chess::colorToString(result_.winner);
    } else {
        j["winner"] = nullptr;
    }

    json movesJson = json::array();
    for (const auto& move : moves_) {
        movesJson.push_back({
            {"from", chess::squareToString(move.from)},
            {"to", chess::squareToString(move.to)}
        });
    }
    j["moves"] = movesJson;

    return j.dump(4);
}

GameRecord GameRecord::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        if (j.value("format", std::string()) != FORMAT_NAME) {
            throw RecordError("Not a chessmancer game record");
        }
        int version = j.value("version", 0);
        if (version != FORMAT_VERSION) {
            throw RecordError("Unsupported record version " + std::to_string(version));
        }

        GameRecord record;
        if (j.contains("timestamp")) {
            record.timestamp_ = parseTimestamp(j["timestamp"].get<std::string>());
        }

        std::string outcomeText = j.value("result", std::string("in_progress"));
        auto outcome = chess::stringToOutcome(outcomeText);
        if (!outcome) {
            throw RecordError("Unknown result '" + outcomeText + "'");
        }
        record.result_.outcome = *outcome;
        if (*outcome == chess::GameOutcome::CHECKMATE && j["winner"].is_string()) {
            std::string winner = j["winner"].get<std::string>();
            record.result_.winner = winner == "white" ? chess::PieceColor::WHITE : chess::PieceColor::BLACK;
        }

        for (const auto& moveJson : j.at("moves")) {
            record.moves_.push_back({parseSquare(moveJson.at("from")), parseSquare(moveJson.at("to"))});
        }

        return record;
    } catch (const json::exception& e) {
        throw RecordError("Failed to parse game record: " + std::string(e.what()));
    }
}

void GameRecord::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw RecordError("Could not open file for writing: " + filename);
    }

    file << toJson();
    if (!file) {
        throw RecordError("Failed to write game record: " + filename);
    }
}

GameRecord GameRecord::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw RecordError("Could not open file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

} // namespace record
} // namespace chessmancer

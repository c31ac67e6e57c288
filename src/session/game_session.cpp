// src/session/game_session.cpp
#include "chessmancer/session/game_session.h"
#include "chessmancer/chess/notation.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace chessmancer {
namespace session {

GameSession::GameSession(std::unique_ptr<oracle::MoveOracle> oracle, const config::EngineConfig& config)
    : game_(config.drawRules),
      oracle_(std::move(oracle)),
      fallback_(config.seed),
      config_(config) {
    config_.clamp();
    if (!oracle_) {
        oracle_ = std::make_unique<oracle::RandomMoveOracle>(config.seed);
    }
    spdlog::info("GameSession: Using oracle '{}', oracle plays {}",
                 oracle_->getName(), chess::colorToString(config_.aiColor));
}

chess::BoardState GameSession::board() const {
    std::lock_guard<std::mutex> lock(gameMutex_);
    return game_.board();
}

chess::GameResult GameSession::status() const {
    std::lock_guard<std::mutex> lock(gameMutex_);
    return game_.status();
}

uint64_t GameSession::generation() const {
    std::lock_guard<std::mutex> lock(gameMutex_);
    return game_.generation();
}

std::vector<chess::Square> GameSession::legalMoves(chess::Square square) const {
    std::lock_guard<std::mutex> lock(gameMutex_);
    return game_.legalMoves(square);
}

chess::MoveResult GameSession::playMove(chess::Square from, chess::Square to) {
    std::lock_guard<std::mutex> lock(gameMutex_);
    chess::MoveResult result = game_.tryMove(from, to);
    if (result.ok()) {
        spdlog::debug("GameSession: Played {}", chess::moveToString({from, to}));
        if (game_.isGameOver()) {
            spdlog::info("GameSession: Game over: {}", chess::resultToString(game_.status()));
        }
    } else {
        spdlog::debug("GameSession: Rejected {}", result.error().toString());
    }
    return result;
}

std::optional<chess::ChessMove> GameSession::playOracleMove() {
    OracleQuery query;
    std::optional<chess::BoardState> snapshot;
    {
        std::lock_guard<std::mutex> lock(gameMutex_);
        if (game_.isGameOver()) {
            return std::nullopt;
        }
        query.generation = game_.generation();
        query.ply = game_.board().moveHistory().size();
        snapshot = game_.board();
    }

    std::promise<std::optional<chess::ChessMove>> answer;
    answer.set_value(chooseMove(*snapshot));
    query.response = answer.get_future();
    return applyOracleResponse(query);
}

OracleQuery GameSession::requestOracleMove() {
    OracleQuery query;
    chess::BoardState snapshot = [this, &query]() {
        std::lock_guard<std::mutex> lock(gameMutex_);
        query.generation = game_.generation();
        query.ply = game_.board().moveHistory().size();
        return game_.board();
    }();

    query.response = std::async(std::launch::async, [this, snapshot]() {
        return chooseMove(snapshot);
    });
    return query;
}

std::optional<chess::ChessMove> GameSession::applyOracleResponse(OracleQuery& query) {
    if (!query.response.valid()) {
        return std::nullopt;
    }
    std::optional<chess::ChessMove> move = query.response.get();

    std::lock_guard<std::mutex> lock(gameMutex_);
    if (query.generation != game_.generation() ||
        query.ply != game_.board().moveHistory().size()) {
        spdlog::info("GameSession: Discarding stale oracle answer (generation {}, ply {})",
                     query.generation, query.ply);
        return std::nullopt;
    }

    if (!move) {
        return std::nullopt;
    }

    chess::MoveResult result = game_.tryMove(move->from, move->to);
    if (!result.ok()) {
        // chooseMove only returns moves legal on the snapshot, which equals the live board here
        spdlog::error("GameSession: Oracle move rejected: {}", result.error().toString());
        return std::nullopt;
    }

    spdlog::debug("GameSession: Oracle played {}", chess::moveToString(*move));
    if (game_.isGameOver()) {
        spdlog::info("GameSession: Game over: {}", chess::resultToString(game_.status()));
    }
    return move;
}

std::optional<chess::ChessMove> GameSession::chooseMove(const chess::BoardState& snapshot) {
    if (snapshot.isGameOver()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(oracleMutex_);
    const std::chrono::milliseconds budget(config_.moveTimeMs);

    auto suggestion = oracle_->bestMove(snapshot, budget);
    if (suggestion) {
        auto legal = chess::legalMoves(snapshot, suggestion->from);
        if (std::find(legal.begin(), legal.end(), suggestion->to) != legal.end()) {
            return suggestion;
        }
        spdlog::warn("OracleUnavailable: '{}' suggested illegal move {}, substituting a random move",
                     oracle_->getName(), chess::moveToString(*suggestion));
    } else {
        spdlog::warn("OracleUnavailable: '{}' gave no move, substituting a random move",
                     oracle_->getName());
    }

    return fallback_.bestMove(snapshot, budget);
}

bool GameSession::isOracleTurn() const {
    std::lock_guard<std::mutex> lock(gameMutex_);
    return !game_.isGameOver() && game_.board().turn() == config_.aiColor;
}

void GameSession::reset() {
    std::lock_guard<std::mutex> lock(gameMutex_);
    game_.reset();
    spdlog::info("GameSession: New game (generation {})", game_.generation());
}

void GameSession::loadBoard(chess::BoardState board) {
    std::lock_guard<std::mutex> lock(gameMutex_);
    game_.setBoard(std::move(board));
}

void GameSession::setMoveTime(int moveTimeMs) {
    std::lock_guard<std::mutex> lock(oracleMutex_);
    config_.moveTimeMs = moveTimeMs;
    config_.clamp();
}

bool GameSession::setSkillLevel(int level) {
    std::lock_guard<std::mutex> lock(oracleMutex_);
    config_.skillLevel = level;
    config_.clamp();
    return oracle_->setSkillLevel(config_.skillLevel);
}

void GameSession::setOracleColor(chess::PieceColor color) {
    std::lock_guard<std::mutex> lock(gameMutex_);
    config_.aiColor = color;
}

std::string GameSession::getOracleName() const {
    return oracle_->getName();
}

} // namespace session
} // namespace chessmancer

// src/cli/cli_interface.cpp
#include "chessmancer/cli/cli_interface.h"
#include "chessmancer/cli/command_parser.h"
#include "chessmancer/chess/check_validator.h"
#include "chessmancer/chess/notation.h"
#include "chessmancer/config/engine_config.h"
#include "chessmancer/record/game_record.h"
#include "chessmancer/record/replay.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace chessmancer {
namespace cli {

namespace {

// Accepts "e2e4" or "e2 e4"
std::optional<chess::ChessMove> parseMoveArgs(const std::vector<std::string>& args) {
    if (args.size() == 1) {
        return chess::stringToMove(args[0]);
    }
    if (args.size() == 2) {
        auto from = chess::stringToSquare(args[0]);
        auto to = chess::stringToSquare(args[1]);
        if (from && to) {
            return chess::ChessMove{*from, *to};
        }
    }
    return std::nullopt;
}

} // namespace

CLIInterface::CLIInterface(std::unique_ptr<session::GameSession> session)
    : session_(std::move(session)),
      running_(false) {

    outputCallback_ = [](const std::string& message) {
        std::cout << message << std::endl;
    };

    inputCallback_ = []() -> std::optional<std::string> {
        std::string line;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        return line;
    };

    registerCommands();
}

int CLIInterface::run() {
    output("Chessmancer");
    output("===========");
    output("Type 'help' for a list of commands.");
    cmdShow({});
    playOracleReplies();

    running_ = true;
    while (running_) {
        std::cout << "> " << std::flush;

        auto line = input();
        if (!line) {
            break;
        }

        std::vector<std::string> tokens = CommandParser::tokenize(*line);
        if (tokens.empty()) {
            continue;
        }

        std::string command = tokens[0];
        std::vector<std::string> args(tokens.begin() + 1, tokens.end());

        if (!hasCommand(command)) {
            output("Unknown command: " + command);
            output("Type 'help' for a list of commands.");
            continue;
        }

        executeCommand(command, args);
    }

    return 0;
}

bool CLIInterface::hasCommand(const std::string& command) const {
    return commands_.count(CommandParser::toLower(command)) > 0;
}

bool CLIInterface::executeCommand(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(CommandParser::toLower(command));
    if (it == commands_.end()) {
        return false;
    }
    return it->second(args);
}

void CLIInterface::setOutputCallback(std::function<void(const std::string&)> callback) {
    if (callback) {
        outputCallback_ = callback;
    }
}

void CLIInterface::setInputCallback(std::function<std::optional<std::string>()> callback) {
    if (callback) {
        inputCallback_ = callback;
    }
}

void CLIInterface::registerCommands() {
    commands_["help"] = [this](const std::vector<std::string>& args) { return cmdHelp(args); };
    commandHelp_["help"] = "Display help information. Usage: help [command]";

    commands_["new"] = [this](const std::vector<std::string>& args) { return cmdNew(args); };
    commandHelp_["new"] = "Start a new game. Usage: new [white|black|none] (color played by the engine)";

    commands_["play"] = [this](const std::vector<std::string>& args) { return cmdPlay(args); };
    commandHelp_["play"] = "Make a move. Usage: play <from><to> (e.g. play e2e4)";

    commands_["moves"] = [this](const std::vector<std::string>& args) { return cmdMoves(args); };
    commandHelp_["moves"] = "List legal moves. Usage: moves [square]";

    commands_["aimove"] = [this](const std::vector<std::string>& args) { return cmdAiMove(args); };
    commandHelp_["aimove"] = "Let the engine move for the side to move. Usage: aimove";

    commands_["show"] = [this](const std::vector<std::string>& args) { return cmdShow(args); };
    commandHelp_["show"] = "Show the current board. Usage: show";

    commands_["status"] = [this](const std::vector<std::string>& args) { return cmdStatus(args); };
    commandHelp_["status"] = "Show the game status. Usage: status";
    commands_["info"] = commands_["status"];
    commandHelp_["info"] = commandHelp_["status"];

    commands_["history"] = [this](const std::vector<std::string>& args) { return cmdHistory(args); };
    commandHelp_["history"] = "Show the moves played so far. Usage: history";

    commands_["setoption"] = [this](const std::vector<std::string>& args) { return cmdSetOption(args); };
    commandHelp_["setoption"] = "Set an option. Usage: setoption <skill|movetime|ai> <value>";

    commands_["save"] = [this](const std::vector<std::string>& args) { return cmdSave(args); };
    commandHelp_["save"] = "Save the current game. Usage: save <filename>";

    commands_["load"] = [this](const std::vector<std::string>& args) { return cmdLoad(args); };
    commandHelp_["load"] = "Load a saved game. Usage: load <filename>";

    commands_["quit"] = [this](const std::vector<std::string>& args) { return cmdQuit(args); };
    commandHelp_["quit"] = "Quit the program. Usage: quit";
    commands_["exit"] = commands_["quit"];
    commandHelp_["exit"] = commandHelp_["quit"];
}

void CLIInterface::output(const std::string& message) {
    outputCallback_(message);
}

std::optional<std::string> CLIInterface::input() {
    return inputCallback_();
}

void CLIInterface::reportGameOver() {
    chess::GameResult result = session_->status();
    if (result.isOver()) {
        output("Game over: " + chess::resultToString(result));
    }
}

void CLIInterface::playOracleReplies() {
    while (session_->isOracleTurn()) {
        auto start = std::chrono::steady_clock::now();
        auto move = session_->playOracleMove();
        if (!move) {
            break;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        std::ostringstream ss;
        ss << "Engine plays " << chess::moveToString(*move) << " (" << elapsed.count() << " ms)";
        output(ss.str());
        cmdShow({});
        reportGameOver();
    }
}

bool CLIInterface::cmdHelp(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Available commands:");
        for (const auto& [name, help] : commandHelp_) {
            output("  " + name + " - " + help);
        }
        return true;
    }

    auto it = commandHelp_.find(CommandParser::toLower(args[0]));
    if (it == commandHelp_.end()) {
        output("Unknown command: " + args[0]);
        return false;
    }
    output(it->second);
    return true;
}

bool CLIInterface::cmdNew(const std::vector<std::string>& args) {
    if (!args.empty()) {
        try {
            session_->setOracleColor(config::parseColor(args[0]));
        } catch (const std::invalid_argument& e) {
            output(e.what());
            return false;
        }
    }

    session_->reset();
    output("New game started. Engine plays " +
           chess::colorToString(session_->getConfig().aiColor) + ".");
    cmdShow({});
    playOracleReplies();
    return true;
}

bool CLIInterface::cmdPlay(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing move. Usage: play <from><to>");
        return false;
    }

    auto move = parseMoveArgs(args);
    if (!move) {
        output("Invalid move: " + args[0]);
        return false;
    }

    chess::MoveResult result = session_->playMove(move->from, move->to);
    if (!result.ok()) {
        output(result.error().toString());
        return false;
    }

    output("Move played: " + chess::moveToString(*move));
    cmdShow({});
    reportGameOver();
    playOracleReplies();
    return true;
}

bool CLIInterface::cmdMoves(const std::vector<std::string>& args) {
    chess::BoardState board = session_->board();

    if (args.empty()) {
        auto moves = chess::CheckValidator(board).allLegalMoves(board.turn());
        std::ostringstream ss;
        ss << moves.size() << " legal moves:";
        for (const auto& move : moves) {
            ss << " " << chess::moveToString(move);
        }
        output(ss.str());
        return true;
    }

    auto square = chess::stringToSquare(args[0]);
    if (!square) {
        output("Invalid square: " + args[0]);
        return false;
    }

    auto targets = session_->legalMoves(*square);
    if (targets.empty()) {
        output("No legal moves from " + args[0]);
        return true;
    }

    std::ostringstream ss;
    ss << "Legal moves from " << chess::squareToString(*square) << ":";
    for (const auto& target : targets) {
        ss << " " << chess::squareToString(target);
    }
    output(ss.str());
    return true;
}

bool CLIInterface::cmdAiMove(const std::vector<std::string>& /*args*/) {
    if (session_->status().isOver()) {
        output("Game is already over.");
        return false;
    }

    output("Engine thinking...");
    auto move = session_->playOracleMove();
    if (!move) {
        output("Engine could not find a move.");
        return false;
    }

    output("Engine plays " + chess::moveToString(*move));
    cmdShow({});
    reportGameOver();
    return true;
}

bool CLIInterface::cmdShow(const std::vector<std::string>& /*args*/) {
    chess::BoardState board = session_->board();
    output(board.toString());
    output("FEN: " + chess::toFEN(board));
    return true;
}

bool CLIInterface::cmdStatus(const std::vector<std::string>& /*args*/) {
    chess::BoardState board = session_->board();
    chess::CheckValidator validator(board);

    std::ostringstream ss;
    ss << "Status: " << chess::resultToString(board.result()) << std::endl;
    ss << "To move: " << chess::colorToString(board.turn());
    if (!board.isGameOver() && validator.isKingInCheck(board.turn())) {
        ss << " (in check)";
    }
    ss << std::endl;
    ss << "Plies played: " << board.moveHistory().size() << std::endl;
    ss << "Halfmove clock: " << board.halfmoveClock() << std::endl;
    ss << "Engine: " << session_->getOracleName()
       << " playing " << chess::colorToString(session_->getConfig().aiColor)
       << ", skill " << session_->getConfig().skillLevel
       << ", " << session_->getConfig().moveTimeMs << " ms per move";
    output(ss.str());
    return true;
}

bool CLIInterface::cmdHistory(const std::vector<std::string>& /*args*/) {
    const auto history = session_->board().moveHistory();
    if (history.empty()) {
        output("No moves played yet.");
        return true;
    }

    std::ostringstream ss;
    for (size_t i = 0; i < history.size(); ++i) {
        if (i % 2 == 0) {
            if (i > 0) {
                ss << std::endl;
            }
            ss << (i / 2 + 1) << ". ";
        }
        ss << chess::moveToString(history[i]) << " ";
    }
    output(ss.str());
    return true;
}

bool CLIInterface::cmdSetOption(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        output("Missing option name or value. Usage: setoption <name> <value>");
        output("Available options: skill, movetime, ai");
        return false;
    }

    std::string name = CommandParser::toLower(args[0]);
    const std::string& value = args[1];

    try {
        if (name == "skill") {
            int level = std::stoi(value);
            if (!session_->setSkillLevel(level)) {
                output("The current engine has no skill setting.");
                return false;
            }
            output("Skill level set to " + std::to_string(session_->getConfig().skillLevel));
        } else if (name == "movetime") {
            session_->setMoveTime(std::stoi(value));
            output("Move time set to " + std::to_string(session_->getConfig().moveTimeMs) + " ms");
        } else if (name == "ai") {
            session_->setOracleColor(config::parseColor(value));
            output("Engine now plays " + chess::colorToString(session_->getConfig().aiColor));
            playOracleReplies();
        } else {
            output("Unknown option: " + name);
            output("Available options: skill, movetime, ai");
            return false;
        }
    } catch (const std::logic_error&) {
        output("Invalid value for " + name + ": " + value);
        return false;
    }

    return true;
}

bool CLIInterface::cmdSave(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing filename. Usage: save <filename>");
        return false;
    }

    try {
        record::GameRecord::fromBoard(session_->board()).saveToFile(args[0]);
    } catch (const record::RecordError& e) {
        output(e.what());
        return false;
    }

    output("Game saved to " + args[0]);
    return true;
}

bool CLIInterface::cmdLoad(const std::vector<std::string>& args) {
    if (args.empty()) {
        output("Missing filename. Usage: load <filename>");
        return false;
    }

    record::GameRecord gameRecord;
    try {
        gameRecord = record::GameRecord::loadFromFile(args[0]);
    } catch (const record::RecordError& e) {
        output(e.what());
        return false;
    }

    record::ReplayResult replay = record::replayMoves(gameRecord.getMoves(), session_->getConfig().drawRules);
    for (const auto& diagnostic : replay.diagnostics) {
        output("Skipped move " + std::to_string(diagnostic.index + 1) + " (" +
               chess::moveToString(diagnostic.move) + "): " + diagnostic.reason);
    }

    if (replay.board.result() != gameRecord.getResult()) {
        spdlog::warn("CLIInterface: Recorded result '{}' differs from replayed result '{}'",
                     chess::resultToString(gameRecord.getResult()),
                     chess::resultToString(replay.board.result()));
    }

    session_->loadBoard(replay.board);
    output("Loaded " + std::to_string(replay.board.moveHistory().size()) + " moves from " + args[0]);
    cmdShow({});
    reportGameOver();
    return true;
}

bool CLIInterface::cmdQuit(const std::vector<std::string>& /*args*/) {
    running_ = false;
    return true;
}

} // namespace cli
} // namespace chessmancer

// src/cli/cli_main.cpp
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "chessmancer/cli/cli_interface.h"
#include "chessmancer/cli/command_parser.h"
#include "chessmancer/config/engine_config.h"
#include "chessmancer/oracle/move_oracle.h"
#include "chessmancer/session/game_session.h"

using namespace chessmancer;

void showHelp();

int main(int argc, char* argv[]) {
    std::vector<std::string> args = cli::CommandParser::fromArgv(argc, argv);
    cli::FlagMap flags = cli::CommandParser::extractFlags(args);

    if (cli::CommandParser::hasFlag(flags, "help")) {
        showHelp();
        return 0;
    }

    if (!args.empty()) {
        std::cerr << "Unexpected argument: " << args[0] << std::endl;
        showHelp();
        return 1;
    }

    config::EngineConfig engineConfig;
    try {
        std::string configPath = cli::CommandParser::getFlagValue(flags, "config");
        if (!configPath.empty()) {
            engineConfig.mergeFile(configPath);
        }
        engineConfig.mergeFlags(flags);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    spdlog::level::level_enum level = spdlog::level::from_str(engineConfig.logLevel);
    if (level == spdlog::level::off && engineConfig.logLevel != "off") {
        std::cerr << "Unknown log level '" << engineConfig.logLevel << "', using info" << std::endl;
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::debug("Configuration: {}", engineConfig.toJson());

    auto session = std::make_unique<session::GameSession>(
        oracle::MoveOracle::create(engineConfig), engineConfig);

    cli::CLIInterface cli(std::move(session));
    return cli.run();
}

void showHelp() {
    std::cout << "Usage: chessmancer_cli [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>           JSON configuration file" << std::endl;
    std::cout << "  --engine <path>           UCI engine executable (default: search for stockfish)" << std::endl;
    std::cout << "  --skill <1-20>            Engine skill level (default: 10)" << std::endl;
    std::cout << "  --movetime <ms>           Engine thinking time per move (default: 100)" << std::endl;
    std::cout << "  --handshake-timeout <ms>  Engine start-up timeout (default: 2000)" << std::endl;
    std::cout << "  --ai <white|black|none>   Color played by the engine (default: black)" << std::endl;
    std::cout << "  --seed <n>                Seed for random fallback moves (default: random)" << std::endl;
    std::cout << "  --log-level <level>       trace, debug, info, warn, err, critical or off" << std::endl;
    std::cout << "  --no-draw-rules           Only end games by checkmate or stalemate" << std::endl;
    std::cout << "  --help                    Show this help" << std::endl;
}

// include/chessmancer/oracle/uci_engine_oracle.h
#ifndef CHESSMANCER_UCI_ENGINE_ORACLE_H
#define CHESSMANCER_UCI_ENGINE_ORACLE_H

#include <sys/types.h>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "chessmancer/oracle/move_oracle.h"

namespace chessmancer {
namespace oracle {

/**
 * @brief Oracle backed by an external UCI chess engine process
 *
 * The engine runs as a child process connected through pipes. Every read
 * is bounded by a timeout. Any failure (start, crash, timeout, garbled
 * reply) makes the oracle unavailable and bestMove returns nullopt.
 */
class UciEngineOracle : public MoveOracle {
public:
    /**
     * @brief Constructor, does not start the engine
     *
     * @param enginePath Path of the engine executable
     * @param skillLevel UCI "Skill Level", clamped to [1, 20]
     * @param handshakeTimeout Limit for each handshake step and extra slack
     *        on top of the move time when waiting for "bestmove"
     */
    UciEngineOracle(const std::string& enginePath,
                    int skillLevel = 10,
                    std::chrono::milliseconds handshakeTimeout = std::chrono::milliseconds(2000));

    /**
     * @brief Destructor, sends "quit" and reaps the process
     */
    ~UciEngineOracle() override;

    UciEngineOracle(const UciEngineOracle&) = delete;
    UciEngineOracle& operator=(const UciEngineOracle&) = delete;

    /**
     * @brief Launch the engine and run the UCI handshake
     *
     * @return true if the engine answered uciok and readyok in time
     */
    bool start();

    /**
     * @brief Ask the engine to quit and release the process
     */
    void stop();

    std::optional<chess::ChessMove> bestMove(const chess::BoardState& board,
                                             std::chrono::milliseconds timeBudget) override;

    bool isAvailable() const override;
    std::string getName() const override;
    bool setSkillLevel(int level) override;

    const std::string& getEnginePath() const { return enginePath_; }

    /**
     * @brief Find an engine executable
     *
     * A configured path containing '/' is used as is; a bare name is looked
     * up on PATH. Without a configured path the well-known Stockfish names
     * are searched in the working directory, then on PATH.
     *
     * @param configuredPath Path or name from configuration, may be empty
     * @return Executable path, or nullopt if nothing suitable exists
     */
    static std::optional<std::string> locateEngine(const std::string& configuredPath);

private:
    std::string enginePath_;
    int skillLevel_;
    std::chrono::milliseconds handshakeTimeout_;

    mutable std::mutex ioMutex_;
    pid_t pid_;
    int engineFd_;
    std::string readBuffer_;
    bool available_;
    std::string engineName_;

    bool sendLine(const std::string& line);
    std::optional<std::string> readLine(std::chrono::steady_clock::time_point deadline);
    std::optional<std::string> waitFor(const std::string& prefix,
                                       std::chrono::steady_clock::time_point deadline);
    bool sendSkillLevel();
    void markUnavailable(const std::string& reason);
    void shutdownProcess();
};

} // namespace oracle
} // namespace chessmancer

#endif // CHESSMANCER_UCI_ENGINE_ORACLE_H

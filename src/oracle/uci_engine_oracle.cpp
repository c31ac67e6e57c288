// src/oracle/uci_engine_oracle.cpp
#include "chessmancer/oracle/uci_engine_oracle.h"
#include "chessmancer/chess/notation.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>
#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace chessmancer {
namespace oracle {

namespace {

const std::vector<std::string> DEFAULT_ENGINE_NAMES = {
    "stockfish",
    "stockfish-ubuntu-x86-64",
    "stockfish-ubuntu-x86-64-avx2",
    "stockfish-ubuntu-x86-64-modern"
};

bool isExecutable(const std::string& path) {
    return !path.empty() && access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> searchPath(const std::string& name) {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) {
        return std::nullopt;
    }

    std::stringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        if (isExecutable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

UciEngineOracle::UciEngineOracle(const std::string& enginePath,
                                 int skillLevel,
                                 std::chrono::milliseconds handshakeTimeout)
    : enginePath_(enginePath),
      skillLevel_(std::clamp(skillLevel, config::MIN_SKILL_LEVEL, config::MAX_SKILL_LEVEL)),
      handshakeTimeout_(handshakeTimeout),
      pid_(-1),
      engineFd_(-1),
      available_(false) {
}

UciEngineOracle::~UciEngineOracle() {
    stop();
}

std::optional<std::string> UciEngineOracle::locateEngine(const std::string& configuredPath) {
    if (!configuredPath.empty()) {
        if (configuredPath.find('/') != std::string::npos) {
            if (isExecutable(configuredPath)) {
                return configuredPath;
            }
            return std::nullopt;
        }
        return searchPath(configuredPath);
    }

    for (const auto& name : DEFAULT_ENGINE_NAMES) {
        std::string local = "./" + name;
        if (isExecutable(local)) {
            return local;
        }
    }

    for (const auto& name : DEFAULT_ENGINE_NAMES) {
        if (auto found = searchPath(name)) {
            return found;
        }
    }

    return std::nullopt;
}

bool UciEngineOracle::start() {
    std::lock_guard<std::mutex> lock(ioMutex_);

    if (available_) {
        return true;
    }

    if (!isExecutable(enginePath_)) {
        spdlog::warn("UciEngineOracle: '{}' is not an executable file", enginePath_);
        return false;
    }

    // One stream socket carries both directions; send() with MSG_NOSIGNAL
    // turns a dead engine into EPIPE instead of SIGPIPE
    int channel[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) != 0) {
        spdlog::error("UciEngineOracle: Error creating socket pair: {}", strerror(errno));
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("UciEngineOracle: Error forking engine process: {}", strerror(errno));
        close(channel[0]);
        close(channel[1]);
        return false;
    }

    if (pid == 0) {
        // Child: wire its end to stdin/stdout and become the engine
        dup2(channel[1], STDIN_FILENO);
        dup2(channel[1], STDOUT_FILENO);
        execl(enginePath_.c_str(), enginePath_.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    close(channel[1]);
    pid_ = pid;
    engineFd_ = channel[0];
    readBuffer_.clear();

    spdlog::info("UciEngineOracle: Started engine {} (pid {})", enginePath_, pid_);

    auto deadline = std::chrono::steady_clock::now() + handshakeTimeout_;
    if (!sendLine("uci")) {
        markUnavailable("could not send 'uci'");
        return false;
    }

    std::optional<std::string> line;
    while ((line = readLine(deadline))) {
        if (line->rfind("id name ", 0) == 0) {
            engineName_ = line->substr(8);
        } else if (*line == "uciok") {
            break;
        }
    }
    if (!line) {
        markUnavailable("no 'uciok' from engine");
        return false;
    }

    available_ = true;
    if (!sendSkillLevel()) {
        return false;
    }

    spdlog::info("UciEngineOracle: Engine '{}' ready at skill level {}",
                 engineName_.empty() ? enginePath_ : engineName_, skillLevel_);
    return true;
}

void UciEngineOracle::stop() {
    std::lock_guard<std::mutex> lock(ioMutex_);
    if (available_) {
        sendLine("quit");
    }
    available_ = false;
    shutdownProcess();
}

bool UciEngineOracle::isAvailable() const {
    std::lock_guard<std::mutex> lock(ioMutex_);
    return available_;
}

std::string UciEngineOracle::getName() const {
    std::lock_guard<std::mutex> lock(ioMutex_);
    return engineName_.empty() ? "uci:" + enginePath_ : engineName_;
}

bool UciEngineOracle::setSkillLevel(int level) {
    std::lock_guard<std::mutex> lock(ioMutex_);
    skillLevel_ = std::clamp(level, config::MIN_SKILL_LEVEL, config::MAX_SKILL_LEVEL);
    if (!available_) {
        return true;
    }
    return sendSkillLevel();
}

std::optional<chess::ChessMove> UciEngineOracle::bestMove(const chess::BoardState& board,
                                                          std::chrono::milliseconds timeBudget) {
    std::lock_guard<std::mutex> lock(ioMutex_);

    if (!available_) {
        return std::nullopt;
    }

    long long movetime = std::max<long long>(1, timeBudget.count());
    if (!sendLine("position fen " + chess::toFEN(board)) ||
        !sendLine("go movetime " + std::to_string(movetime))) {
        markUnavailable("could not send search request");
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + timeBudget + handshakeTimeout_;
    auto reply = waitFor("bestmove", deadline);
    if (!reply) {
        markUnavailable("no 'bestmove' within " +
                        std::to_string((timeBudget + handshakeTimeout_).count()) + " ms");
        return std::nullopt;
    }

    std::istringstream tokens(*reply);
    std::string keyword, moveText;
    tokens >> keyword >> moveText;

    if (moveText.empty() || moveText == "(none)" || moveText == "0000") {
        spdlog::debug("UciEngineOracle: Engine reports no move for {}", chess::toFEN(board));
        return std::nullopt;
    }

    auto move = chess::stringToMove(moveText);
    if (!move) {
        spdlog::warn("UciEngineOracle: Unparseable move '{}' from engine", moveText);
        return std::nullopt;
    }

    spdlog::debug("UciEngineOracle: bestmove {}", moveText);
    return move;
}

bool UciEngineOracle::sendSkillLevel() {
    auto deadline = std::chrono::steady_clock::now() + handshakeTimeout_;
    if (!sendLine("setoption name Skill Level value " + std::to_string(skillLevel_)) ||
        !sendLine("isready") ||
        !waitFor("readyok", deadline)) {
        markUnavailable("no 'readyok' after setting skill level");
        return false;
    }
    return true;
}

bool UciEngineOracle::sendLine(const std::string& line) {
    if (engineFd_ < 0) {
        return false;
    }

    std::string data = line + "\n";
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = send(engineFd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("UciEngineOracle: Error writing to engine: {}", strerror(errno));
            return false;
        }
        written += static_cast<size_t>(n);
    }

    spdlog::trace("UciEngineOracle: >> {}", line);
    return true;
}

std::optional<std::string> UciEngineOracle::readLine(std::chrono::steady_clock::time_point deadline) {
    while (true) {
        size_t newline = readBuffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = readBuffer_.substr(0, newline);
            readBuffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            spdlog::trace("UciEngineOracle: << {}", line);
            return line;
        }

        if (engineFd_ < 0) {
            return std::nullopt;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }

        pollfd pfd{engineFd_, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("UciEngineOracle: Error polling engine: {}", strerror(errno));
            return std::nullopt;
        }
        if (ready == 0) {
            return std::nullopt;
        }

        char chunk[4096];
        ssize_t n = read(engineFd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("UciEngineOracle: Error reading from engine: {}", strerror(errno));
            return std::nullopt;
        }
        if (n == 0) {
            // Engine closed its output
            return std::nullopt;
        }
        readBuffer_.append(chunk, static_cast<size_t>(n));
    }
}

std::optional<std::string> UciEngineOracle::waitFor(const std::string& prefix,
                                                    std::chrono::steady_clock::time_point deadline) {
    while (auto line = readLine(deadline)) {
        if (line->rfind(prefix, 0) == 0) {
            return line;
        }
    }
    return std::nullopt;
}

void UciEngineOracle::markUnavailable(const std::string& reason) {
    spdlog::warn("UciEngineOracle: Engine {} unavailable: {}", enginePath_, reason);
    available_ = false;
    shutdownProcess();
}

void UciEngineOracle::shutdownProcess() {
    closeFd(engineFd_);
    readBuffer_.clear();

    if (pid_ <= 0) {
        return;
    }

    // Give the engine a moment to exit on its own after 'quit' or EOF
    for (int attempt = 0; attempt < 20; ++attempt) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_ || (result < 0 && errno == ECHILD)) {
            pid_ = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    spdlog::debug("UciEngineOracle: Killing unresponsive engine (pid {})", pid_);
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
}

} // namespace oracle
} // namespace chessmancer

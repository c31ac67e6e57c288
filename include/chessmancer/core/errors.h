// include/chessmancer/core/errors.h
#ifndef CHESSMANCER_ERRORS_H
#define CHESSMANCER_ERRORS_H

#include <string>
#include <stdexcept>

namespace chessmancer {
namespace core {

/**
 * @brief Exception for game state errors
 */
class GameStateException : public std::runtime_error {
public:
    explicit GameStateException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Exception for illegal move attempts
 *
 * Thrown only by callers that opt into exceptions (ChessGame::makeMove).
 * The value-returning API reports the same condition as an IllegalMoveError.
 */
class IllegalMoveException : public GameStateException {
public:
    IllegalMoveException(const std::string& message, const std::string& move)
        : GameStateException(message), move_(move) {}
    const std::string& getMove() const { return move_; }
private:
    std::string move_;
};

/**
 * @brief A broken board invariant, e.g. two kings of one color or a move
 *        applied from an empty square.
 *
 * Indicates a bug in the caller or the core. Never caught inside the core.
 */
class InvariantViolation : public GameStateException {
public:
    explicit InvariantViolation(const std::string& message)
        : GameStateException("Invariant violation: " + message) {}
};

} // namespace core
} // namespace chessmancer

#endif // CHESSMANCER_ERRORS_H

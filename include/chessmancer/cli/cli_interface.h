// include/chessmancer/cli/cli_interface.h
#ifndef CHESSMANCER_CLI_INTERFACE_H
#define CHESSMANCER_CLI_INTERFACE_H

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "chessmancer/session/game_session.h"

namespace chessmancer {
namespace cli {

/**
 * @brief Interactive text front end for a game session
 */
class CLIInterface {
public:
    /**
     * @brief Constructor
     *
     * @param session Session to drive
     */
    explicit CLIInterface(std::unique_ptr<session::GameSession> session);

    /**
     * @brief Read and execute commands until quit or end of input
     *
     * @return Exit code
     */
    int run();

    /**
     * @brief Execute a single command
     *
     * @param command Command name (case insensitive)
     * @param args Command arguments
     * @return true if the command exists and succeeded
     */
    bool executeCommand(const std::string& command, const std::vector<std::string>& args);

    bool hasCommand(const std::string& command) const;

    void setOutputCallback(std::function<void(const std::string&)> callback);

    /**
     * @brief Replace the input source; nullopt signals end of input
     */
    void setInputCallback(std::function<std::optional<std::string>()> callback);

    session::GameSession& getSession() { return *session_; }

private:
    std::function<void(const std::string&)> outputCallback_;
    std::function<std::optional<std::string>()> inputCallback_;

    std::unique_ptr<session::GameSession> session_;
    bool running_;

    using CommandHandler = std::function<bool(const std::vector<std::string>&)>;
    std::map<std::string, CommandHandler> commands_;
    std::map<std::string, std::string> commandHelp_;

    void registerCommands();
    void output(const std::string& message);
    std::optional<std::string> input();

    // Let the oracle reply while it is its turn
    void playOracleReplies();
    void reportGameOver();

    bool cmdHelp(const std::vector<std::string>& args);
    bool cmdNew(const std::vector<std::string>& args);
    bool cmdPlay(const std::vector<std::string>& args);
    bool cmdMoves(const std::vector<std::string>& args);
    bool cmdAiMove(const std::vector<std::string>& args);
    bool cmdShow(const std::vector<std::string>& args);
    bool cmdStatus(const std::vector<std::string>& args);
    bool cmdHistory(const std::vector<std::string>& args);
    bool cmdSetOption(const std::vector<std::string>& args);
    bool cmdSave(const std::vector<std::string>& args);
    bool cmdLoad(const std::vector<std::string>& args);
    bool cmdQuit(const std::vector<std::string>& args);
};

} // namespace cli
} // namespace chessmancer

#endif // CHESSMANCER_CLI_INTERFACE_H

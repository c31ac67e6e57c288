// include/chessmancer/cli/command_parser.h
#ifndef CHESSMANCER_COMMAND_PARSER_H
#define CHESSMANCER_COMMAND_PARSER_H

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace chessmancer {
namespace cli {

using FlagMap = std::map<std::string, std::string>;

/**
 * @brief Parsing helpers for program arguments and interactive commands
 */
class CommandParser {
public:
    /**
     * @brief Split a line into whitespace separated tokens
     *
     * Double quotes group words into one token ("my game.json").
     */
    static std::vector<std::string> tokenize(const std::string& line);

    /**
     * @brief Collect argv[1..argc) into a vector
     */
    static std::vector<std::string> fromArgv(int argc, char* argv[]);

    /**
     * @brief Parse "key=value"
     *
     * @return Trimmed key and value, or nullopt if there is no '='
     */
    static std::optional<std::pair<std::string, std::string>> parseKeyValue(const std::string& arg);

    /**
     * @brief Remove flags from an argument list
     *
     * Accepts "--name value", "--name=value" and bare "--name". Arguments
     * that are not flags stay in args.
     *
     * @param args Arguments, modified in place
     * @param flagPrefix Flag prefix
     * @return Flag names mapped to values (empty for bare flags)
     */
    static FlagMap extractFlags(std::vector<std::string>& args, const std::string& flagPrefix = "--");

    static bool hasFlag(const FlagMap& flags, const std::string& flag);

    static std::string getFlagValue(const FlagMap& flags, const std::string& flag,
                                    const std::string& defaultValue = "");

    /**
     * @brief Get a flag as an integer
     *
     * @throws std::invalid_argument if the flag is present but not a number
     */
    static int getFlagValueInt(const FlagMap& flags, const std::string& flag, int defaultValue);

    /**
     * @brief Get a flag as a boolean; a bare flag counts as true
     *
     * @throws std::invalid_argument if the value is not a recognized boolean
     */
    static bool getFlagValueBool(const FlagMap& flags, const std::string& flag, bool defaultValue);

    static std::string toLower(std::string text);
};

} // namespace cli
} // namespace chessmancer

#endif // CHESSMANCER_COMMAND_PARSER_H

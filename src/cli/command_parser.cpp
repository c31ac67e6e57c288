// src/cli/command_parser.cpp
#include "chessmancer/cli/command_parser.h"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace chessmancer {
namespace cli {

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

} // namespace

std::vector<std::string> CommandParser::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;

    bool inQuotes = false;
    std::string quoted;

    while (iss >> token) {
        if (inQuotes) {
            if (token.back() == '"') {
                quoted += " " + token.substr(0, token.size() - 1);
                tokens.push_back(quoted);
                inQuotes = false;
                quoted.clear();
            } else {
                quoted += " " + token;
            }
        } else if (token[0] == '"') {
            if (token.size() > 1 && token.back() == '"') {
                tokens.push_back(token.substr(1, token.size() - 2));
            } else {
                inQuotes = true;
                quoted = token.substr(1);
            }
        } else {
            tokens.push_back(token);
        }
    }

    // Unterminated quote: keep what we have
    if (inQuotes) {
        tokens.push_back(quoted);
    }

    return tokens;
}

std::vector<std::string> CommandParser::fromArgv(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

std::optional<std::pair<std::string, std::string>> CommandParser::parseKeyValue(const std::string& arg) {
    size_t equalPos = arg.find('=');
    if (equalPos == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(trim(arg.substr(0, equalPos)), trim(arg.substr(equalPos + 1)));
}

FlagMap CommandParser::extractFlags(std::vector<std::string>& args, const std::string& flagPrefix) {
    FlagMap flags;
    std::vector<std::string> remaining;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() <= flagPrefix.size() || arg.compare(0, flagPrefix.size(), flagPrefix) != 0) {
            remaining.push_back(arg);
            continue;
        }

        std::string flag = arg.substr(flagPrefix.size());
        std::string value;

        size_t equalPos = flag.find('=');
        if (equalPos != std::string::npos) {
            value = flag.substr(equalPos + 1);
            flag = flag.substr(0, equalPos);
        } else if (i + 1 < args.size() && !args[i + 1].empty() && args[i + 1][0] != '-') {
            value = args[++i];
        }

        flags[flag] = value;
    }

    args.swap(remaining);
    return flags;
}

bool CommandParser::hasFlag(const FlagMap& flags, const std::string& flag) {
    return flags.find(flag) != flags.end();
}

std::string CommandParser::getFlagValue(const FlagMap& flags, const std::string& flag,
                                        const std::string& defaultValue) {
    auto it = flags.find(flag);
    return it != flags.end() ? it->second : defaultValue;
}

int CommandParser::getFlagValueInt(const FlagMap& flags, const std::string& flag, int defaultValue) {
    auto it = flags.find(flag);
    if (it == flags.end()) {
        return defaultValue;
    }

    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        if (consumed == it->second.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw std::invalid_argument("--" + flag + " expects an integer, got '" + it->second + "'");
}

bool CommandParser::getFlagValueBool(const FlagMap& flags, const std::string& flag, bool defaultValue) {
    auto it = flags.find(flag);
    if (it == flags.end()) {
        return defaultValue;
    }

    std::string value = toLower(it->second);
    if (value.empty() || value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    throw std::invalid_argument("--" + flag + " expects a boolean, got '" + it->second + "'");
}

std::string CommandParser::toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace cli
} // namespace chessmancer

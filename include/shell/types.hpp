#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace po::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;          // in command line order, repeats kept
    std::vector<std::string> positionals;

    [[nodiscard]] inline std::vector<std::string> constructFullArgs() const {
        std::vector<std::string> args;
        args.reserve(1 + positionals.size());
        args.push_back(name);
        for (const auto& pos : positionals) args.push_back(pos);
        return args;
    }
};

struct CommandResult {
    int exit_code = 0;       // 0 = success, 1 = runtime failure, 2 = usage error
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    std::string synopsis;
    CommandHandler handler;
    std::unordered_set<std::string> aliases;
};

}

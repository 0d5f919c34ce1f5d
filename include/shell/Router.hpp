#pragma once

#include "shell/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace po::shell {

class Router {
public:
    void registerCommand(const std::string& name, std::string synopsis, std::string description,
                         const std::unordered_set<std::string>& aliases, CommandHandler handler);

    // Command run when the call names none.
    void setDefault(const std::string& name) { default_ = normalize(name); }

    CommandResult execute(CommandCall call) const;

    [[nodiscard]] std::string usage() const;

private:
    std::map<std::string, CommandInfo> commands_; // ordered for usage()
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::string default_;

    std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

} // namespace po::shell

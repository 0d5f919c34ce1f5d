#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

using namespace po::shell;
using namespace po::log;

void Router::registerCommand(const std::string& name, std::string synopsis, std::string description,
                             const std::unordered_set<std::string>& aliases, CommandHandler handler) {
    const std::string key = normalize(name);

    CommandInfo info{description.empty() ? "No description provided." : std::move(description),
                     std::move(synopsis), std::move(handler), {}};

    for (const std::string& alias : aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            Registry::shell()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                    a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

CommandResult Router::execute(CommandCall call) const {
    if (call.name.empty()) call.name = default_;
    if (call.name.empty()) return invalid("No command provided.\n" + usage());

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return invalid(call.constructFullArgs(), fmt::format("Unknown command: {}\n{}", call.name, usage()));

    Registry::shell()->debug("[Router] Executing command: '{}'", canonical);
    call.name = canonical;
    return commands_.at(canonical).handler(call);
}

std::string Router::usage() const {
    std::string out = "usage: po [command] [options]\n\ncommands:\n";
    for (const auto& [name, info] : commands_) {
        const auto head = info.synopsis.empty() ? name : info.synopsis;
        out += fmt::format("  {:<16} {}{}\n", head, info.description, name == default_ ? " (default)" : "");
    }
    out += "\noptions:\n"
           "  -c, --config <path>        YAML config file (default: po.yaml if present)\n"
           "  -i, --input <dir>          input directory, repeatable\n"
           "  -o, --output <dir>         library output root\n"
           "  -e, --extension <ext>      extension to capture, repeatable\n"
           "  -s, --sort-policy <name>   date | move_to_root | none\n"
           "      --log-level <level>    trace | debug | info | warn | error | critical | off\n"
           "      --log-file <path>      also log to a rotating file\n"
           "  -h, --help                 show this help\n"
           "  -V, --version              print the version\n";
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace po::shell {

// Flags that never take a value, so a following word stays positional.
inline const std::unordered_set<std::string> SWITCHES = {"help", "h", "version", "V"};

inline void addOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    c.options.push_back(FlagKV{key, val});
}

inline CommandCall parseTokens(const std::vector<Token>& toks) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto key = t.text;
            if (!SWITCHES.contains(key) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word &&
                toks[i + 1].text != "--") {
                addOpt(call, key, toks[i + 1].text);
                ++i; // consumed value
            } else {
                addOpt(call, key, std::nullopt);
            }
            continue;
        }

        // Command name = first Word that is not a flag value; the router picks the default otherwise
        if (!stop_flags && call.name.empty()) {
            call.name = t.text;
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}

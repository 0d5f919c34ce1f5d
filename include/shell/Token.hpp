#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace po::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    while (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// argv is already split by the shell; only flags need recognizing.
// "--key=value" becomes Flag(key) Word(value); "--" and "-" stay words.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size());
    bool stop_flags = false;

    for (const auto& a : args) {
        if (stop_flags || a == "-" || a.size() < 2 || a[0] != '-' || looks_negative_number(a)) {
            pushWord(out, a);
            continue;
        }
        if (a == "--") {
            stop_flags = true;
            pushWord(out, a);
            continue;
        }
        if (const auto eq = a.find('='); eq != std::string::npos) {
            pushFlag(out, a.substr(0, eq));
            pushWord(out, a.substr(eq + 1));
            continue;
        }
        pushFlag(out, a);
    }
    return out;
}

inline std::vector<Token> tokenize(const int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return tokenize(args);
}

}

#include "shell/helpers.hpp"

#include <fmt/core.h>

#include <filesystem>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace po::shell {

namespace {

const std::unordered_map<std::string, std::string> FLAG_ALIASES = {
    {"c", "config"},
    {"i", "input"},
    {"o", "output"},
    {"e", "extension"},
    {"s", "sort-policy"},
    {"h", "help"},
    {"V", "version"},
};

const std::unordered_set<std::string> KNOWN_FLAGS = {
    "config", "input", "output", "extension", "sort-policy", "log-level", "log-file", "help", "version"
};

std::string requireValue(const CommandCall& c, const std::string& key) {
    const auto v = optVal(c, key);
    if (!v || v->empty()) throw std::invalid_argument(fmt::format("--{} requires a value", key));
    return *v;
}

}

CommandResult invalid(std::string msg) {
    return {2, "", std::move(msg)};
}

CommandResult invalid(const std::vector<std::string>& args, std::string msg) {
    std::string joined;
    for (const auto& a : args) {
        if (!joined.empty()) joined += ' ';
        joined += a;
    }
    return {2, "", fmt::format("{}\n  in: {}", msg, joined)};
}

CommandResult failed(std::string msg) {
    return {1, "", std::move(msg)};
}

CommandResult ok(std::string out) {
    return {0, std::move(out), ""};
}

std::string canonicalFlag(const std::string& key) {
    const auto it = FLAG_ALIASES.find(key);
    return it == FLAG_ALIASES.end() ? key : it->second;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (canonicalFlag(k) == key) return true;
    return false;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    std::optional<std::string> out;
    for (const auto& [k, v] : c.options)
        if (canonicalFlag(k) == key) out = v;
    return out;
}

std::vector<std::string> optVals(const CommandCall& c, const std::string& key) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options) {
        if (canonicalFlag(k) != key) continue;
        if (!v || v->empty()) throw std::invalid_argument(fmt::format("--{} requires a value", key));
        out.push_back(*v);
    }
    return out;
}

config::Config resolveConfig(const CommandCall& c) {
    for (const auto& [k, v] : c.options)
        if (!KNOWN_FLAGS.contains(canonicalFlag(k)))
            throw std::invalid_argument(fmt::format("Unknown option: {}{}", k.size() == 1 ? "-" : "--", k));

    config::Config cfg;
    if (hasFlag(c, "config")) {
        cfg = config::loadConfig(requireValue(c, "config"));
    } else if (std::filesystem::exists(config::DEFAULT_CONFIG_PATH)) {
        cfg = config::loadConfig(config::DEFAULT_CONFIG_PATH);
    }

    if (const auto inputs = optVals(c, "input"); !inputs.empty())
        cfg.inputs.assign(inputs.begin(), inputs.end());
    if (hasFlag(c, "output")) cfg.output = requireValue(c, "output");
    if (const auto exts = optVals(c, "extension"); !exts.empty()) {
        cfg.extensions.clear();
        for (auto ext : exts) {
            if (!ext.empty() && ext[0] == '.') ext.erase(ext.begin());
            cfg.extensions.push_back(ext);
        }
    }
    if (hasFlag(c, "sort-policy")) cfg.sort_policy = library::sortPolicyFromString(requireValue(c, "sort-policy"));
    if (hasFlag(c, "log-file")) cfg.logging.log_file = requireValue(c, "log-file");
    if (hasFlag(c, "log-level")) {
        const auto lvl = config::parseLevel(requireValue(c, "log-level"));
        auto& levels = cfg.logging.levels;
        levels.console_log_level = lvl;
        levels.subsystem_levels = {lvl, lvl, lvl, lvl, lvl};
    }

    return cfg;
}

}

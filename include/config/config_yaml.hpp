#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace po::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static std::string levelName(const spdlog::level::level_enum lvl) {
    return to_std_string(spdlog::level::to_string_view(lvl));
}

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    return node ? parseLevel(node.as<std::string>()) : def;
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["po"]      = levelName(rhs.po);
        node["library"] = levelName(rhs.library);
        node["scan"]    = levelName(rhs.scan);
        node["shell"]   = levelName(rhs.shell);
        node["config"]  = levelName(rhs.config);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.po      = levelOr(node["po"], def.po);
        rhs.library = levelOr(node["library"], def.library);
        rhs.scan    = levelOr(node["scan"], def.scan);
        rhs.shell   = levelOr(node["shell"], def.shell);
        rhs.config  = levelOr(node["config"], def.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = levelName(rhs.console_log_level);
        node["file_log_level"] = levelName(rhs.file_log_level);
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::debug);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["levels"] = rhs.levels;
        node["log_file"] = rhs.log_file.string();
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        rhs.log_file = node["log_file"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<po::library::SortPolicy> {
    static Node encode(const po::library::SortPolicy& rhs) {
        return Node(po::library::to_string(rhs));
    }

    static bool decode(const Node& node, po::library::SortPolicy& rhs) {
        if (!node.IsScalar()) return false;
        rhs = po::library::sortPolicyFromString(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<Config> {
    static Node encode(const Config& rhs) {
        Node node;
        node["inputs"] = Node(NodeType::Sequence);
        for (const auto& in : rhs.inputs) node["inputs"].push_back(in.string());
        node["output"] = rhs.output.string();
        node["extensions"] = Node(NodeType::Sequence);
        for (const auto& ext : rhs.extensions) node["extensions"].push_back(ext);
        node["sort_policy"] = rhs.sort_policy;
        node["logging"] = rhs.logging;
        return node;
    }

    static bool decode(const Node& node, Config& rhs) {
        if (!node.IsMap()) return false;
        if (const auto inputs = node["inputs"]) {
            rhs.inputs.clear();
            if (inputs.IsScalar()) rhs.inputs.emplace_back(inputs.as<std::string>());
            else for (const auto& in : inputs) rhs.inputs.emplace_back(in.as<std::string>());
        }
        rhs.output = node["output"].as<std::string>("");
        if (const auto exts = node["extensions"]) rhs.extensions = exts.as<std::vector<std::string>>();
        if (node["sort_policy"]) rhs.sort_policy = node["sort_policy"].as<po::library::SortPolicy>();
        if (node["logging"]) rhs.logging = node["logging"].as<LoggingConfig>();
        return true;
    }
};

}

#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace po::config {

spdlog::level::level_enum parseLevel(const std::string& name) {
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off")
        throw std::invalid_argument("Unknown log level: " + name);
    return lvl;
}

static Config fromNode(const YAML::Node& root) {
    Config cfg;
    if (root.IsNull()) return cfg; // empty document
    if (!YAML::convert<Config>::decode(root, cfg))
        throw std::runtime_error("Config root must be a mapping");
    return cfg;
}

Config parseConfig(const std::string& yaml) {
    return fromNode(YAML::Load(yaml));
}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return fromNode(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load config " + path.string() + ": " + e.what());
    }
}

std::string Config::toYaml() const {
    YAML::Emitter out;
    out << YAML::convert<Config>::encode(*this);
    return {out.c_str()};
}

} // namespace po::config

#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/files.hpp"

#include <spdlog/cfg/env.h>

#include <stdexcept>
#include <vector>

namespace po::log {

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};
    if (!cnf.log_file.empty()) {
        if (cnf.log_file.has_parent_path()) util::ensureDirectory(cnf.log_file.parent_path());
        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cnf.log_file.string(), max_bytes_, max_files_);
        file_sink_->set_level(cnf.levels.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("po",      sub_levels.po);
    makeLogger("library", sub_levels.library);
    makeLogger("scan",    sub_levels.scan);
    makeLogger("shell",   sub_levels.shell);
    makeLogger("config",  sub_levels.config);

    // SPDLOG_LEVEL=library=debug,... overrides the configured logger levels
    spdlog::cfg::load_env_levels();

    initialized_ = true;
    get("po")->debug("[log::Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

}

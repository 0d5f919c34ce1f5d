#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace po::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> po()      { return get("po"); }
    static std::shared_ptr<spdlog::logger> library() { return get("library"); }
    static std::shared_ptr<spdlog::logger> scan()    { return get("scan"); }
    static std::shared_ptr<spdlog::logger> shell()   { return get("shell"); }
    static std::shared_ptr<spdlog::logger> config()  { return get("config"); }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t max_files_ = 3;
};

}

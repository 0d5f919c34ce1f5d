#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace po::config {

class ConfigRegistry {
public:
    static void init(Config config);
    static const Config& get();
    [[nodiscard]] static bool isInitialized() { return initialized_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace po::config

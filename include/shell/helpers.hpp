#pragma once

#include "config/Config.hpp"
#include "shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace po::shell {

CommandResult invalid(std::string msg);
CommandResult invalid(const std::vector<std::string>& args, std::string msg);
CommandResult failed(std::string msg);
CommandResult ok(std::string out);

// Maps short aliases (-o, -i, ...) to their long flag names.
std::string canonicalFlag(const std::string& key);

bool hasFlag(const CommandCall& c, const std::string& key);

// Last value given for key (last wins).
std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

// Every value given for a repeatable key, in order.
std::vector<std::string> optVals(const CommandCall& c, const std::string& key);

/// Loads the config file (--config, or po.yaml when present) and applies the
/// command line overrides. Throws std::invalid_argument for unknown flags or
/// bad values, std::runtime_error when an explicit config file cannot be read.
config::Config resolveConfig(const CommandCall& c);

}

#pragma once

namespace po::config { struct Config; }

namespace po::shell {

class Router;

// cfg must outlive the router.
void registerLibraryCommands(Router& r, const config::Config& cfg);
void registerSystemCommands(Router& r);

inline void registerAllCommands(Router& r, const config::Config& cfg) {
    registerLibraryCommands(r, cfg);
    registerSystemCommands(r);
}

}

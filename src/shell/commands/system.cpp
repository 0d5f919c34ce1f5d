#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"

#ifndef PO_VERSION
#define PO_VERSION "dev"
#endif

namespace po::shell {

static CommandResult handle_version(const CommandCall&) {
    return ok("po v" + std::string(PO_VERSION) + "\n");
}

void registerSystemCommands(Router& r) {
    r.registerCommand("help", "help", "show this help", {}, [&r](const CommandCall&) { return ok(r.usage()); });
    r.registerCommand("version", "version", "print the version", {}, handle_version);
}

}

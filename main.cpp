#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/commands.hpp"
#include "shell/helpers.hpp"

#include <iostream>

using namespace po::config;
using namespace po::shell;

int main(int argc, char** argv) {
    const auto call = parseTokens(tokenize(argc, argv));

    Router router;

    try {
        ConfigRegistry::init(resolveConfig(call));
        po::log::Registry::init();
        registerAllCommands(router, ConfigRegistry::get());
    } catch (const std::exception& e) {
        std::cerr << "po: " << e.what() << std::endl;
        return 2;
    }

    if (hasFlag(call, "help")) {
        std::cout << router.usage();
        return 0;
    }

    try {
        auto effective = call;
        if (hasFlag(call, "version")) effective.name = "version";

        po::log::Registry::config()->debug("[config] Effective configuration:\n{}", ConfigRegistry::get().toYaml());

        const auto result = router.execute(effective);
        if (!result.stdout_text.empty()) std::cout << result.stdout_text;
        if (!result.stderr_text.empty()) {
            std::cerr << result.stderr_text;
            if (result.stderr_text.back() != '\n') std::cerr << '\n';
        }
        if (result.exit_code != 0) po::log::Registry::po()->debug("Exiting with code {}", result.exit_code);
        return result.exit_code;
    } catch (const std::exception& e) {
        po::log::Registry::po()->error("{}", e.what());
        return 1;
    }
}

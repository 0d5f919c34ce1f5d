#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/helpers.hpp"
#include "config/Config.hpp"
#include "library/Library.hpp"
#include "library/errors.hpp"
#include "log/Registry.hpp"
#include "query/Glob.hpp"
#include "scan/InputScanner.hpp"
#include "util/files.hpp"

#include <fmt/core.h>
#include <filesystem>

using namespace po::config;
using namespace po::library;
using namespace po::log;

namespace fs = std::filesystem;

namespace po::shell {

static CommandResult handle_import(const CommandCall& call, const Config& cfg) {
    if (!call.positionals.empty())
        return invalid(call.constructFullArgs(), "import takes no positional arguments");

    if (cfg.output.empty()) return invalid("No output directory configured (set 'output' in the config or pass --output)");

    for (const auto& input : cfg.inputs)
        if (util::ensureDirectory(input)) Registry::po()->debug("[import] Created missing input directory {}", input.string());
    if (util::ensureDirectory(cfg.output)) Registry::po()->debug("[import] Created output root {}", cfg.output.string());

    const scan::InputScanner scanner(cfg.extensions);
    const auto captured = scanner.scanAll(cfg.inputs);

    auto lib = Library::load(cfg.output);
    const auto fresh = lib.checkNew(captured);

    uintmax_t bytes = 0;
    for (const auto& f : fresh) bytes += fs::file_size(f.path);
    Registry::po()->info("[import] {} new of {} captured files ({})", fresh.size(), captured.size(),
                         util::bytesToSize(bytes));

    const auto before = lib.size();
    try {
        lib.place(fresh, cfg.sort_policy);
    } catch (const Error& e) {
        // Files moved before the failure are no longer in the inputs, keep them indexed.
        Registry::po()->error("[import] Sorting stopped: {}", e.what());
        lib.persist();
        return failed(fmt::format("import stopped after {} of {} files: {}", lib.size() - before, fresh.size(),
                                  e.what()));
    }

    lib.persist();
    return ok(fmt::format("Imported {} new files into {} ({} skipped as already known)\n", lib.size() - before,
                          cfg.output.string(), captured.size() - fresh.size()));
}

static CommandResult handle_query(const CommandCall& call, const Config& cfg) {
    if (call.positionals.size() != 1)
        return invalid(call.constructFullArgs(), "query takes exactly one glob pattern");

    if (cfg.output.empty()) return invalid("No output directory configured (set 'output' in the config or pass --output)");
    if (!fs::is_directory(cfg.output)) return failed("No library at " + cfg.output.string());

    const auto& pattern = call.positionals.front();
    const auto lib = Library::open(cfg.output);
    const auto matched = query::filter(pattern, lib.entries());
    Registry::po()->info("[query] {} of {} entries match '{}'", matched.size(), lib.size(), pattern);

    CommandResult result;
    for (const auto& entry : matched) result.stderr_text += fmt::format("{} {}\n", entry.hash.encode(), entry.relPathString());
    return result;
}

void registerLibraryCommands(Router& r, const Config& cfg) {
    r.registerCommand("import", "import", "hash inputs, move new files into the library", {"i"},
                      [&cfg](const CommandCall& call) { return handle_import(call, cfg); });
    r.registerCommand("query", "query <glob>", "print '<hash> <path>' for entries matching glob", {"q", "find"},
                      [&cfg](const CommandCall& call) { return handle_query(call, cfg); });
    r.setDefault("import");
}

}

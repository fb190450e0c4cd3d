#include "cli.hpp"
#include "config.hpp"
#include "platform/linux/shell_command_runner.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "raise_next.hpp"
#include "storage/sqlite_mru_store.hpp"

#include <print>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto opts = parse_args(args);
    if (!opts) {
        std::println(stderr, "{}: {}", argv[0], opts.error());
        print_usage(argv[0]);
        return 1;
    }
    if (opts->help) {
        print_usage(argv[0]);
        return 0;
    }

    Config config = opts->config_path ? Config::load(*opts->config_path) : Config::load_default();
    if (opts->aliases_file) config.aliases_file = *opts->aliases_file;

    auto spec = build_spec(*opts, config.aliases_file);
    if (!spec) {
        std::println(stderr, "config: {}", spec.error());
        return 1;
    }

    SwayWindowManager wm;
    if (spec->has_match_keys() && !wm.connect()) {
        std::println(stderr, "Failed to connect to the window manager");
        return 1;
    }

    SqliteMruStore store;
    if (!store.open(config.state_db) && opts->verbose) {
        std::println(stderr, "[raisenext] {}, window order will not be remembered",
                     store.last_error());
    }

    ShellCommandRunner runner(config.shell);
    RaiseNext raise_next(wm, runner, store, opts->verbose);

    auto result = raise_next.run(*spec);
    if (opts->verbose && !store.last_error().empty()) {
        std::println(stderr, "[raisenext] stored window order unusable ({}), started fresh",
                     store.last_error());
    }
    if (!result) {
        std::println(stderr, "mru: {}", result.error());
        return 1;
    }
    return 0;
}

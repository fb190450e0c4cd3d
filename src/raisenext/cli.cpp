#include "cli.hpp"

#include "alias_config.hpp"

#include <print>

namespace {

struct SpecFlag {
    const char* short_name;
    const char* long_name;
    const char* key;
};

constexpr SpecFlag SPEC_FLAGS[] = {
    {"-i", "--id", "id"},
    {"-d", "--desktop", "desktop"},
    {"-p", "--pid", "pid"},
    {"-w", "--wm_class", "wm_class"},
    {"-m", "--machine", "machine"},
    {"-t", "--title", "title"},
    {"-c", "--command", "command"},
};

const SpecFlag* find_spec_flag(const std::string& arg) {
    for (const auto& flag : SPEC_FLAGS) {
        if (arg == flag.short_name || arg == flag.long_name) return &flag;
    }
    return nullptr;
}

} // namespace

std::expected<CliOptions, std::string> parse_args(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const auto& arg = args[i];

        auto next_value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= args.size()) return std::unexpected(arg + " requires a value");
            return args[++i];
        };

        if (auto* flag = find_spec_flag(arg)) {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());
            opts.overrides.set(flag->key, std::move(*value));
        } else if (arg == "--file" || arg == "-f") {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());
            opts.aliases_file = std::move(*value);
        } else if (arg == "--config") {
            auto value = next_value();
            if (!value) return std::unexpected(value.error());
            opts.config_path = std::move(*value);
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return std::unexpected("unknown option: " + arg);
        } else if (opts.alias) {
            return std::unexpected("unexpected argument: " + arg);
        } else {
            opts.alias = arg;
        }
    }

    // A window id already names exactly one window.
    if (opts.overrides.fields.contains("id") && opts.overrides.fields.size() > 1) {
        return std::unexpected(std::string(
            "-i/--id identifies a single window and can't be combined with other window spec options"));
    }

    return opts;
}

void print_usage(const char* prog) {
    std::println("Usage: {} [options] [alias]", prog);
    std::println("Launch an app, raise it, or cycle to its next window.");
    std::println("Window spec options:");
    std::println("  -i, --id ID           Window id, e.g. 94");
    std::println("  -d, --desktop NAME    Workspace the window is on");
    std::println("  -p, --pid PID         Process id owning the window");
    std::println("  -w, --wm_class CLASS  Window class or app_id, e.g. Navigator.Firefox");
    std::println("  -m, --machine HOST    Client machine name");
    std::println("  -t, --title TITLE     Window title");
    std::println("Options:");
    std::println("  -c, --command CMD     Command that launches the app");
    std::println("  -f, --file PATH       Alias file (default: ~/.config/raisenext/aliases.json)");
    std::println("      --config PATH     Settings file");
    std::println("  -v, --verbose         Enable verbose logging");
    std::println("  -h, --help            Show this help");
}

std::expected<WindowSpec, std::string> build_spec(const CliOptions& opts, const std::string& aliases_file) {
    WindowSpec spec;
    if (opts.alias) {
        auto resolved = resolve_alias(*opts.alias, aliases_file);
        if (!resolved) return std::unexpected(resolved.error().message);
        spec = std::move(*resolved);
    }
    spec.overlay(opts.overrides);
    return spec;
}

#pragma once

#include "window/window_spec.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

struct CliOptions {
    std::optional<std::string> alias;
    WindowSpec overrides;                    // -i/-d/-p/-w/-m/-t/-c
    std::optional<std::string> aliases_file; // -f
    std::optional<std::string> config_path;  // --config
    bool verbose = false;
    bool help = false;
};

// `args` excludes the program name.
std::expected<CliOptions, std::string> parse_args(const std::vector<std::string>& args);

void print_usage(const char* prog);

// The alias's spec from `aliases_file` (if an alias was given) with the
// command-line overrides applied on top.
std::expected<WindowSpec, std::string> build_spec(const CliOptions& opts, const std::string& aliases_file);

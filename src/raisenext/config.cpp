#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::defaults() {
    Config cfg;
    auto config = platform::config_dir();
    auto data = platform::data_dir();
    cfg.aliases_file = config.empty() ? "aliases.json" : (fs::path(config) / "aliases.json").string();
    cfg.state_db = data.empty() ? "/tmp/raisenext-mru.db" : (fs::path(data) / "mru.db").string();
    return cfg;
}

Config Config::load(const std::string& path) {
    Config cfg = defaults();
    std::ifstream f(platform::expand_user(path));
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("aliases_file")) cfg.aliases_file = platform::expand_user(j["aliases_file"].get<std::string>());
        if (j.contains("state_db")) cfg.state_db = platform::expand_user(j["state_db"].get<std::string>());
        if (j.contains("shell")) cfg.shell = j["shell"].get<std::string>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return defaults();
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return defaults();

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return defaults();
}

#pragma once

#include <string>

struct Config {
    std::string aliases_file; // JSON alias -> window spec map
    std::string state_db;     // SQLite MRU snapshot
    std::string shell = "/bin/sh";

    // Defaults under the XDG config and data directories.
    static Config defaults();
    static Config load(const std::string& path);
    static Config load_default();
};

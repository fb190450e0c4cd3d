#pragma once

#include <string>

namespace platform {

// Empty when neither the XDG variable nor $HOME is set.
std::string config_dir();
std::string data_dir();

// Expand a leading "~" to $HOME.
std::string expand_user(const std::string& path);

} // namespace platform

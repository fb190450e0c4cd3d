#pragma once

#include "window/window_spec.hpp"

#include <expected>
#include <string>

struct AliasError {
    enum class Kind { NotFound, Duplicate, Unreadable };

    Kind kind;
    std::string message;
};

// Look up `alias` (case-insensitively) in a JSON file of the form
//
//   { "Firefox": { "wm_class": ".Firefox", "command": "firefox" }, ... }
//
// A leading "~" in `path` is expanded. Two keys that differ only in case make
// the file ambiguous and are reported as Duplicate, whichever alias is asked
// for.
std::expected<WindowSpec, AliasError> resolve_alias(const std::string& alias, const std::string& path);

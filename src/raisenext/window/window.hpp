#pragma once

#include <optional>
#include <string>
#include <string_view>

struct Window {
    std::string id;        // opaque window handle, e.g. Sway con_id "94"
    std::string desktop;   // workspace name
    std::string pid;
    std::string wm_class;  // app_id, or "instance.class" for XWayland windows
    std::string machine;
    std::string title;

    // Look up an attribute by name. Unknown names are absent.
    std::optional<std::string> attribute(std::string_view name) const {
        if (name == "id") return id;
        if (name == "desktop") return desktop;
        if (name == "pid") return pid;
        if (name == "wm_class") return wm_class;
        if (name == "machine") return machine;
        if (name == "title") return title;
        return std::nullopt;
    }

    // Windows are identified by handle only; attributes may change between runs.
    bool operator==(const Window& other) const { return id == other.id; }
};

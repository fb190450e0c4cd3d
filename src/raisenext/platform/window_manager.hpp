#pragma once

#include "window/window.hpp"

#include <optional>
#include <vector>

class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual bool connect() = 0;
    // Most recently focused first when the window manager knows the order.
    virtual std::vector<Window> list_windows() = 0;
    virtual std::optional<Window> focused_window() = 0;
    virtual bool focus(const Window& window) = 0;
};

#pragma once

#include "cycle_selector.hpp"
#include "platform/command_runner.hpp"
#include "platform/mru_store.hpp"
#include "platform/window_manager.hpp"
#include "window/window_spec.hpp"

#include <expected>
#include <string>

// One hotkey press: launch the app, raise it, or go to its next window.
class RaiseNext {
public:
    RaiseNext(WindowManager& wm, CommandRunner& runner, MruStore& store, bool verbose = false);

    RaiseNext(const RaiseNext&) = delete;
    RaiseNext& operator=(const RaiseNext&) = delete;

    // Returns the action taken. Fails only if the new MRU order could not be
    // saved, which happens after the window has already been focused.
    std::expected<Action, std::string> run(const WindowSpec& spec);

private:
    void launch(const WindowSpec& spec);
    std::expected<void, std::string> focus_and_promote(MruList windows, const Window& target);

    void log(const std::string& msg);

    WindowManager& wm_;
    CommandRunner& runner_;
    MruStore& store_;
    bool verbose_;
};

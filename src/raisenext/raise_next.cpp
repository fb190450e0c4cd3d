#include "raise_next.hpp"

#include <format>
#include <print>

RaiseNext::RaiseNext(WindowManager& wm, CommandRunner& runner, MruStore& store, bool verbose)
    : wm_(wm), runner_(runner), store_(store), verbose_(verbose) {}

std::expected<Action, std::string> RaiseNext::run(const WindowSpec& spec) {
    auto windows = reconcile(store_.load(), wm_.list_windows());
    auto focused = wm_.focused_window();
    log(std::format("{} open windows, focused: {}", windows.size(),
                    focused ? focused->id : "none"));

    auto action = select_action(spec, windows, focused);

    switch (action.kind) {
        case ActionKind::Launch:
            launch(spec);
            break;
        case ActionKind::Focus:
        case ActionKind::Advance: {
            log(std::format("{} -> {} ({})", to_string(action.kind), action.target->id,
                            action.target->title));
            auto saved = focus_and_promote(std::move(windows), *action.target);
            if (!saved) return std::unexpected(saved.error());
            break;
        }
        case ActionKind::Noop:
            log("only window already focused, nothing to do");
            break;
    }

    return action;
}

void RaiseNext::launch(const WindowSpec& spec) {
    if (!spec.command || spec.command->empty()) {
        log("no matching window and no command to run");
        return;
    }

    log("launching: " + *spec.command);
    auto res = runner_.run(*spec.command);
    if (!res) {
        std::println(stderr, "launch: {}: {}", *spec.command, res.error());
    }
}

std::expected<void, std::string> RaiseNext::focus_and_promote(MruList windows, const Window& target) {
    if (!wm_.focus(target)) {
        log("focus request for " + target.id + " was not acknowledged");
    }

    auto res = store_.save(promote(std::move(windows), target));
    if (!res) {
        return std::unexpected("could not save window order: " + res.error());
    }
    return {};
}

void RaiseNext::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[raisenext] {}", msg);
    }
}

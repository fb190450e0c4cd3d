#pragma once

#include "mru/mru_list.hpp"
#include "window/window.hpp"
#include "window/window_spec.hpp"

#include <optional>
#include <string_view>
#include <vector>

enum class ActionKind { Launch, Focus, Noop, Advance };

struct Action {
    ActionKind kind = ActionKind::Noop;
    std::optional<Window> target; // set for Focus and Advance only
};

std::string_view to_string(ActionKind kind);

// Decide what one hotkey press should do.
//
// `ordered` is the reconciled MRU list. Launch when nothing can match; focus
// the app's most recent window when the app isn't focused; otherwise step
// through the app's windows, least recently seen first, wrapping to the far
// end once the whole cycle has been visited.
Action select_action(const WindowSpec& spec, const MruList& ordered,
                     const std::optional<Window>& focused);

// Windows of `matching` not in the run of matching windows at the front of
// `ordered` (the ones already cycled through), in `matching` order.
std::vector<Window> unvisited_windows(const std::vector<Window>& matching, const MruList& ordered);

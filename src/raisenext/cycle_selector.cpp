#include "cycle_selector.hpp"

#include <algorithm>
#include <iterator>

std::string_view to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::Launch: return "launch";
        case ActionKind::Focus: return "focus";
        case ActionKind::Noop: return "noop";
        case ActionKind::Advance: return "advance";
    }
    return "unknown";
}

std::vector<Window> unvisited_windows(const std::vector<Window>& matching, const MruList& ordered) {
    std::vector<Window> visited;
    for (const auto& window : ordered) {
        if (!contains(matching, window)) break;
        visited.push_back(window);
    }

    std::vector<Window> unvisited;
    std::ranges::copy_if(matching, std::back_inserter(unvisited),
                         [&](const Window& w) { return !contains(visited, w); });
    return unvisited;
}

Action select_action(const WindowSpec& spec, const MruList& ordered,
                     const std::optional<Window>& focused) {
    if (!spec.has_match_keys() || ordered.empty()) {
        return {ActionKind::Launch, std::nullopt};
    }

    std::vector<Window> matching;
    std::ranges::copy_if(ordered, std::back_inserter(matching),
                         [&](const Window& w) { return matches(w, spec); });

    if (matching.empty()) {
        return {ActionKind::Launch, std::nullopt};
    }

    if (!focused || !contains(matching, *focused)) {
        return {ActionKind::Focus, matching.front()};
    }

    if (matching.size() == 1) {
        return {ActionKind::Noop, std::nullopt};
    }

    auto unvisited = unvisited_windows(matching, ordered);
    if (!unvisited.empty()) {
        return {ActionKind::Advance, unvisited.front()};
    }
    return {ActionKind::Advance, matching.back()};
}

#include "mru/mru_list.hpp"

#include <algorithm>
#include <stdexcept>

bool contains(const std::vector<Window>& windows, const Window& window) {
    return std::ranges::find(windows, window) != windows.end();
}

MruList reconcile(const MruList& stored, const std::vector<Window>& live) {
    MruList known;
    known.reserve(live.size());
    for (const auto& old : stored) {
        auto it = std::ranges::find(live, old);
        if (it == live.end() || contains(known, old)) continue;
        known.push_back(*it);
    }

    // Newly opened windows go in front as one block, keeping live order.
    MruList result;
    result.reserve(live.size());
    for (const auto& window : live) {
        if (!contains(known, window) && !contains(result, window)) {
            result.push_back(window);
        }
    }
    result.insert(result.end(), known.begin(), known.end());
    return result;
}

MruList promote(MruList list, const Window& window) {
    auto it = std::ranges::find(list, window);
    if (it == list.end()) {
        throw std::logic_error("promote: window " + window.id + " is not in the MRU list");
    }

    Window promoted = std::move(*it);
    list.erase(it);
    list.insert(list.begin(), std::move(promoted));
    return list;
}

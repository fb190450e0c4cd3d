#pragma once

#include "window/window.hpp"

#include <vector>

// Windows in most-recently-focused-first order, unique by id.
using MruList = std::vector<Window>;

// Drop stored windows that are no longer open, then put every newly opened
// window at the front (in live order). Surviving entries take their
// attributes from the live window with the same id.
MruList reconcile(const MruList& stored, const std::vector<Window>& live);

// Move `window` to the front. Throws std::logic_error if it is not in `list`.
MruList promote(MruList list, const Window& window);

bool contains(const std::vector<Window>& windows, const Window& window);

#include "platform/linux/sway_window_manager.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <print>
#include <unistd.h>

using json = nlohmann::json;

bool SwayWindowManager::connect() {
    const char* sock = std::getenv("SWAYSOCK");
    if (!sock) sock = std::getenv("I3SOCK");
    if (!sock) {
        std::println(stderr, "sway: neither $SWAYSOCK nor $I3SOCK is set");
        return false;
    }

    char host[256] = {};
    if (::gethostname(host, sizeof(host) - 1) == 0) hostname_ = host;

    auto res = ipc_.connect(sock);
    if (!res) {
        std::println(stderr, "sway: {}", res.error());
        return false;
    }
    return true;
}

std::vector<Window> SwayWindowManager::list_windows() {
    auto tree = get_tree();
    if (!tree) return {};
    try {
        return windows_from_tree(*tree, hostname_);
    } catch (const json::exception& e) {
        std::println(stderr, "sway: unexpected tree layout: {}", e.what());
        return {};
    }
}

std::optional<Window> SwayWindowManager::focused_window() {
    auto tree = get_tree();
    if (!tree) return std::nullopt;
    try {
        return focused_from_tree(*tree, hostname_);
    } catch (const json::exception& e) {
        std::println(stderr, "sway: unexpected tree layout: {}", e.what());
        return std::nullopt;
    }
}

bool SwayWindowManager::focus(const Window& window) {
    auto payload = ipc_.request(SwayIpc::Message::RunCommand, std::format("[con_id={}] focus", window.id));
    if (!payload) {
        std::println(stderr, "sway: focus {}: {}", window.id, payload.error());
        return false;
    }

    try {
        auto reply = json::parse(*payload);
        if (!reply.is_array() || reply.empty()) return false;
        for (const auto& r : reply) {
            if (!r.value("success", false)) {
                std::println(stderr, "sway: focus {} failed: {}", window.id, r.value("error", "unknown"));
                return false;
            }
        }
        return true;
    } catch (const json::exception& e) {
        std::println(stderr, "sway: bad command reply: {}", e.what());
        return false;
    }
}

std::optional<json> SwayWindowManager::get_tree() {
    if (!ipc_.connected()) return std::nullopt;

    auto payload = ipc_.request(SwayIpc::Message::GetTree);
    if (!payload) {
        std::println(stderr, "sway: get_tree: {}", payload.error());
        return std::nullopt;
    }

    try {
        return json::parse(*payload);
    } catch (const json::exception& e) {
        std::println(stderr, "sway: bad tree reply: {}", e.what());
        return std::nullopt;
    }
}

std::vector<Window> SwayWindowManager::windows_from_tree(const json& tree, const std::string& machine) {
    std::vector<Window> out;
    walk(tree, "", machine, out);
    return out;
}

std::optional<Window> SwayWindowManager::focused_from_tree(const json& tree, const std::string& machine) {
    // A focused workspace or split container has no window to report.
    auto find = [&](auto& self, const json& node, const std::string& desktop) -> std::optional<Window> {
        std::string ws = node.value("type", "") == "workspace" ? node.value("name", "") : desktop;
        if (node.value("focused", false)) {
            if (is_window(node)) return make_window(node, ws, machine);
            return std::nullopt;
        }
        for (const char* key : {"nodes", "floating_nodes"}) {
            if (!node.contains(key)) continue;
            for (const auto& child : node[key]) {
                if (auto w = self(self, child, ws)) return w;
            }
        }
        return std::nullopt;
    };
    return find(find, tree, "");
}

bool SwayWindowManager::is_window(const json& node) {
    auto type = node.value("type", "");
    if (type != "con" && type != "floating_con") return false;
    if (!node.contains("pid") || !node["pid"].is_number_integer()) return false;
    return !node.contains("nodes") || node["nodes"].empty();
}

Window SwayWindowManager::make_window(const json& node, const std::string& desktop,
                                      const std::string& machine) {
    Window w;
    w.id = std::to_string(node.value("id", int64_t{0}));
    w.desktop = desktop;
    w.pid = std::to_string(node.value("pid", 0));
    w.machine = machine;
    if (node.contains("name") && node["name"].is_string()) {
        w.title = node["name"].get<std::string>();
    }

    if (node.contains("app_id") && node["app_id"].is_string()) {
        w.wm_class = node["app_id"].get<std::string>();
    }
    if (w.wm_class.empty() && node.contains("window_properties")) {
        const auto& props = node["window_properties"];
        auto instance = props.value("instance", "");
        auto cls = props.value("class", "");
        w.wm_class = instance.empty() ? cls : instance + "." + cls;
    }
    return w;
}

void SwayWindowManager::walk(const json& node, std::string desktop, const std::string& machine,
                             std::vector<Window>& out) {
    if (node.value("type", "") == "workspace") desktop = node.value("name", "");

    if (is_window(node)) {
        out.push_back(make_window(node, desktop, machine));
        return;
    }

    std::vector<const json*> children;
    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (const auto& child : node[key]) children.push_back(&child);
    }

    // "focus" lists child ids, most recently focused first. Children it
    // doesn't mention keep their tree order after the listed ones.
    std::vector<const json*> ordered;
    if (node.contains("focus") && node["focus"].is_array()) {
        for (const auto& id : node["focus"]) {
            auto it = std::ranges::find_if(children, [&](const json* c) {
                return c->value("id", int64_t{-1}) == id.get<int64_t>();
            });
            if (it != children.end()) ordered.push_back(*it);
        }
    }
    for (const json* child : children) {
        if (std::ranges::find(ordered, child) == ordered.end()) ordered.push_back(child);
    }

    for (const json* child : ordered) {
        walk(*child, desktop, machine, out);
    }
}

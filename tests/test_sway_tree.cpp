#include <catch2/catch_test_macros.hpp>

#include "platform/linux/sway_window_manager.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// Two outputs' worth of GET_TREE, trimmed to the fields that matter. The
// "focus" arrays list child ids most recently focused first.
json sample_tree() {
    return json::parse(R"({
        "id": 1, "type": "root", "name": "root", "focus": [3, 2],
        "nodes": [
            { "id": 2, "type": "output", "name": "__i3", "focus": [],
              "nodes": [] },
            { "id": 3, "type": "output", "name": "DP-1", "focus": [5, 4],
              "nodes": [
                { "id": 4, "type": "workspace", "name": "1", "focus": [10, 11],
                  "nodes": [
                    { "id": 10, "type": "con", "name": "vim", "pid": 100,
                      "app_id": "kitty", "focused": false, "nodes": [] },
                    { "id": 11, "type": "con", "name": "Mozilla Firefox", "pid": 200,
                      "app_id": null,
                      "window_properties": { "class": "Firefox", "instance": "Navigator" },
                      "focused": false, "nodes": [] }
                  ],
                  "floating_nodes": [] },
                { "id": 5, "type": "workspace", "name": "2", "focus": [13, 12],
                  "nodes": [
                    { "id": 12, "type": "con", "name": null, "layout": "splitv",
                      "focus": [21, 20],
                      "nodes": [
                        { "id": 20, "type": "con", "name": "htop", "pid": 300,
                          "app_id": "foot", "focused": false, "nodes": [] },
                        { "id": 21, "type": "con", "name": "mail", "pid": 400,
                          "app_id": "thunderbird", "focused": true, "nodes": [] }
                      ] }
                  ],
                  "floating_nodes": [
                    { "id": 13, "type": "floating_con", "name": "Calculator", "pid": 500,
                      "app_id": "gnome-calculator", "focused": false, "nodes": [] }
                  ] }
              ] }
        ]
    })");
}

std::vector<std::string> ids(const std::vector<Window>& windows) {
    std::vector<std::string> out;
    for (const auto& w : windows) out.push_back(w.id);
    return out;
}

} // namespace

TEST_CASE("Sway tree parsing", "[sway]") {
    auto tree = sample_tree();

    SECTION("WindowsInFocusOrder") {
        auto windows = SwayWindowManager::windows_from_tree(tree, "host");
        REQUIRE(ids(windows) == std::vector<std::string>{"13", "21", "20", "10", "11"});
    }

    SECTION("WindowAttributes") {
        auto windows = SwayWindowManager::windows_from_tree(tree, "host");
        REQUIRE(windows.size() == 5);

        const auto& calc = windows[0];
        REQUIRE(calc.desktop == "2");
        REQUIRE(calc.pid == "500");
        REQUIRE(calc.wm_class == "gnome-calculator");
        REQUIRE(calc.title == "Calculator");
        REQUIRE(calc.machine == "host");

        const auto& firefox = windows[4];
        REQUIRE(firefox.wm_class == "Navigator.Firefox");
        REQUIRE(firefox.desktop == "1");
    }

    SECTION("FocusedWindow") {
        auto focused = SwayWindowManager::focused_from_tree(tree, "host");
        REQUIRE(focused.has_value());
        REQUIRE(focused->id == "21");
        REQUIRE(focused->wm_class == "thunderbird");
        REQUIRE(focused->desktop == "2");
    }

    SECTION("FocusedWorkspaceIsNoWindow") {
        auto empty = json::parse(R"({
            "id": 1, "type": "root", "nodes": [
                { "id": 3, "type": "output", "name": "DP-1", "nodes": [
                    { "id": 4, "type": "workspace", "name": "1", "focused": true,
                      "nodes": [], "floating_nodes": [] }
                ] }
            ]
        })");
        REQUIRE_FALSE(SwayWindowManager::focused_from_tree(empty, "host").has_value());
        REQUIRE(SwayWindowManager::windows_from_tree(empty, "host").empty());
    }

    SECTION("MissingFocusArrayKeepsTreeOrder") {
        auto flat = json::parse(R"({
            "id": 1, "type": "workspace", "name": "web", "nodes": [
                { "id": 7, "type": "con", "name": "a", "pid": 1, "app_id": "x", "nodes": [] },
                { "id": 8, "type": "con", "name": "b", "pid": 2, "app_id": "y", "nodes": [] }
            ]
        })");
        auto windows = SwayWindowManager::windows_from_tree(flat, "");
        REQUIRE(ids(windows) == std::vector<std::string>{"7", "8"});
        REQUIRE(windows[0].desktop == "web");
    }
}

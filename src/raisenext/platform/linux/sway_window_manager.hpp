#pragma once

#include "platform/window_manager.hpp"
#include "sway/ipc.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

class SwayWindowManager : public WindowManager {
public:
    SwayWindowManager() = default;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    // Connect to $SWAYSOCK (or $I3SOCK). Returns false if neither is set or
    // the connection fails.
    bool connect() override;
    std::vector<Window> list_windows() override;
    std::optional<Window> focused_window() override;
    bool focus(const Window& window) override;

    // Windows of a GET_TREE reply, most recently focused first.
    static std::vector<Window> windows_from_tree(const nlohmann::json& tree,
                                                 const std::string& machine);
    static std::optional<Window> focused_from_tree(const nlohmann::json& tree,
                                                   const std::string& machine);

private:
    std::optional<nlohmann::json> get_tree();

    static bool is_window(const nlohmann::json& node);
    static Window make_window(const nlohmann::json& node, const std::string& desktop,
                              const std::string& machine);
    static void walk(const nlohmann::json& node, std::string desktop,
                     const std::string& machine, std::vector<Window>& out);

    SwayIpc ipc_;
    std::string hostname_;
};

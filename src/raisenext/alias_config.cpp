#include "alias_config.hpp"

#include "platform/platform_paths.hpp"

#include <format>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

WindowSpec spec_from_json(const json& obj) {
    WindowSpec spec;
    for (const auto& [key, value] : obj.items()) {
        spec.set(key, value.is_string() ? value.get<std::string>() : value.dump());
    }
    return spec;
}

} // namespace

std::expected<WindowSpec, AliasError> resolve_alias(const std::string& alias, const std::string& path) {
    auto full_path = platform::expand_user(path);
    std::ifstream f(full_path);
    if (!f.is_open()) {
        return std::unexpected(AliasError{AliasError::Kind::Unreadable,
                                          std::format("could not open {}", full_path)});
    }

    json specs;
    try {
        specs = json::parse(f);
    } catch (const json::exception& e) {
        return std::unexpected(AliasError{AliasError::Kind::Unreadable,
                                          std::format("{}: parse error: {}", full_path, e.what())});
    }

    if (!specs.is_object()) {
        return std::unexpected(AliasError{AliasError::Kind::Unreadable,
                                          std::format("{}: expected an object of aliases", full_path)});
    }

    // folded alias -> key as written in the file
    std::map<std::string, std::string> lowered;
    for (const auto& item : specs.items()) {
        auto [it, inserted] = lowered.emplace(to_lower(item.key()), item.key());
        if (!inserted) {
            return std::unexpected(AliasError{AliasError::Kind::Duplicate,
                                              std::format("{}: alias '{}' is defined more than once",
                                                          full_path, item.key())});
        }
    }

    auto it = lowered.find(to_lower(alias));
    if (it == lowered.end()) {
        return std::unexpected(AliasError{AliasError::Kind::NotFound,
                                          std::format("{}: no alias '{}'", full_path, alias)});
    }

    const auto& entry = specs.at(it->second);
    if (!entry.is_object()) {
        return std::unexpected(AliasError{AliasError::Kind::Unreadable,
                                          std::format("{}: alias '{}' is not an object", full_path, alias)});
    }

    return spec_from_json(entry);
}

#pragma once

#include <expected>
#include <string>

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    // Start `command` detached. Its exit status is never observed.
    virtual std::expected<void, std::string> run(const std::string& command) = 0;
};

#pragma once

#include "platform/command_runner.hpp"

#include <string>

class ShellCommandRunner : public CommandRunner {
public:
    explicit ShellCommandRunner(std::string shell = "/bin/sh");

    // Double-forks so the launched app is reparented to init and outlives us.
    std::expected<void, std::string> run(const std::string& command) override;

private:
    std::string shell_;
};

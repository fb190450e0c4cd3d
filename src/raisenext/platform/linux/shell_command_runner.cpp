#include "platform/linux/shell_command_runner.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

ShellCommandRunner::ShellCommandRunner(std::string shell)
    : shell_(std::move(shell)) {}

std::expected<void, std::string> ShellCommandRunner::run(const std::string& command) {
    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setsid();

        pid_t grandchild = ::fork();
        if (grandchild < 0) ::_exit(1);
        if (grandchild > 0) ::_exit(0);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }

        ::execl(shell_.c_str(), "sh", "-c", command.c_str(), nullptr);
        ::_exit(127);
    }

    // Reap the intermediate child; the grandchild's status is not ours to see.
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return std::unexpected("failed to detach command (fork in child failed)");
    }

    return {};
}

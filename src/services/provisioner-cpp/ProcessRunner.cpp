#include "ProcessRunner.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
void SetNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void Drain(int fd, std::string& buffer) {
    std::array<char, 4096> chunk{};
    while (true) {
        const ssize_t bytes = read(fd, chunk.data(), chunk.size());
        if (bytes > 0) {
            buffer.append(chunk.data(), static_cast<size_t>(bytes));
            continue;
        }
        return;
    }
}

void ClosePipe(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}
} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.stderrText = "empty command";
        return result;
    }

    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    if (pipe(stdoutPipe) != 0 || pipe(stderrPipe) != 0) {
        ClosePipe(stdoutPipe);
        ClosePipe(stderrPipe);
        result.stderrText = "failed to create pipes";
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        ClosePipe(stdoutPipe);
        ClosePipe(stderrPipe);
        result.stderrText = "failed to fork";
        return result;
    }

    if (pid == 0) {
        (void)dup2(stdoutPipe[1], STDOUT_FILENO);
        (void)dup2(stderrPipe[1], STDERR_FILENO);
        ClosePipe(stdoutPipe);
        ClosePipe(stderrPipe);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        execvp(args[0], args.data());
        _exit(127);
    }

    close(stdoutPipe[1]);
    close(stderrPipe[1]);
    SetNonBlocking(stdoutPipe[0]);
    SetNonBlocking(stderrPipe[0]);

    int status = 0;
    bool reaped = false;
    const auto started = std::chrono::steady_clock::now();
    while (true) {
        Drain(stdoutPipe[0], result.stdoutText);
        Drain(stderrPipe[0], result.stderrText);

        const pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            result.stderrText += "waitpid failed";
            break;
        }

        if (std::chrono::steady_clock::now() - started > timeout) {
            result.timedOut = true;
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            break;
        }

        struct pollfd pollFds[2] = {
            {stdoutPipe[0], POLLIN, 0},
            {stderrPipe[0], POLLIN, 0},
        };
        (void)poll(pollFds, 2, 100);
    }

    Drain(stdoutPipe[0], result.stdoutText);
    Drain(stderrPipe[0], result.stderrText);
    close(stdoutPipe[0]);
    close(stderrPipe[0]);

    result.exitCode = (reaped && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return result;
}

std::string JoinArgs(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += arg;
    }
    return joined;
}

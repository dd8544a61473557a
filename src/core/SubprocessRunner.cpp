// SPDX-License-Identifier: Apache-2.0
#include "SubprocessRunner.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mindcast
{

namespace
{

    /// @brief Owns one end of a pipe.
    struct Fd
    {
        int fd = -1;

        Fd() = default;
        explicit Fd(int value): fd(value) {}
        Fd(const Fd&) = delete;
        Fd& operator=(const Fd&) = delete;
        ~Fd() { reset(); }

        void reset()
        {
            if (fd >= 0)
                ::close(fd);
            fd = -1;
        }
    };

    auto makePipe(Fd& readEnd, Fd& writeEnd) -> bool
    {
        int fds[2];
        if (pipe(fds) != 0)
            return false;
        fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        readEnd.fd = fds[0];
        writeEnd.fd = fds[1];
        return true;
    }

    auto decodeExitStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

} // namespace

auto describeCommand(const ProcessSpec& spec) -> std::string
{
    auto line = spec.command;
    for (const auto& arg: spec.args)
    {
        if (arg.find_first_of(" \t'\"") != std::string::npos)
            line += std::format(" '{}'", arg);
        else
            line += " " + arg;
    }
    return line;
}

auto SubprocessRunner::run(const ProcessSpec& spec) -> Result<ProcessOutput>
{
    auto stdoutRead = Fd {};
    auto stdoutWrite = Fd {};
    auto stderrRead = Fd {};
    auto stderrWrite = Fd {};

    if (!makePipe(stdoutRead, stdoutWrite))
        return makeError(ErrorCode::ProcessError, "Failed to create stdout pipe");
    if (!makePipe(stderrRead, stderrWrite))
        return makeError(ErrorCode::ProcessError, "Failed to create stderr pipe");

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, stdoutWrite.fd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrWrite.fd, STDERR_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = spec.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(spec.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    log::debug("Running: {}", describeCommand(spec));

    pid_t pid;
    auto const status = posix_spawnp(&pid, spec.command.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    stdoutWrite.reset();
    stderrWrite.reset();

    if (status != 0)
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", spec.command, strerror(status)));

    auto const hasDeadline = spec.timeout.count() > 0;
    auto const deadline = std::chrono::steady_clock::now() + spec.timeout;
    auto output = ProcessOutput {};
    auto timedOut = false;

    // Drain both pipes until the child closes them
    while (stdoutRead.fd >= 0 || stderrRead.fd >= 0)
    {
        auto waitMs = -1;
        if (hasDeadline)
        {
            auto const remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                timedOut = true;
                break;
            }
            waitMs = static_cast<int>(remaining.count());
        }

        auto fds = std::array<pollfd, 2> { {
            { .fd = stdoutRead.fd, .events = POLLIN, .revents = 0 },
            { .fd = stderrRead.fd, .events = POLLIN, .revents = 0 },
        } };

        auto const ready = poll(fds.data(), fds.size(), waitMs);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }
        if (ready == 0)
            continue;

        auto drain = [](pollfd const& pfd, Fd& owner, std::string& sink) {
            if (pfd.fd < 0 || (pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0)
                return;
            auto buf = std::array<char, 4096> {};
            auto const bytesRead = ::read(pfd.fd, buf.data(), buf.size());
            if (bytesRead <= 0)
                owner.reset();
            else
                sink.append(buf.data(), static_cast<size_t>(bytesRead));
        };

        drain(fds[0], stdoutRead, output.standardOutput);
        drain(fds[1], stderrRead, output.standardError);
    }

    // Reap the child, honouring the same deadline
    auto childStatus = 0;
    while (!timedOut)
    {
        auto const rc = waitpid(pid, &childStatus, WNOHANG);
        if (rc == pid)
            break;
        if (rc < 0 && errno != EINTR)
            return makeError(ErrorCode::ProcessError,
                             std::format("waitpid failed for '{}': {}", spec.command, strerror(errno)));
        if (hasDeadline && std::chrono::steady_clock::now() >= deadline)
        {
            timedOut = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timedOut)
    {
        kill(pid, SIGKILL);
        waitpid(pid, &childStatus, 0);
        log::warning("Process '{}' exceeded timeout of {} ms", spec.command, spec.timeout.count());
        return makeError(ErrorCode::TimeoutError,
                         std::format("'{}' timed out after {} ms", spec.command, spec.timeout.count()));
    }

    output.exitCode = decodeExitStatus(childStatus);
    log::trace("Process '{}' exited with code {}", spec.command, output.exitCode);
    return output;
}

} // namespace mindcast

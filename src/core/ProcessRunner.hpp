// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace mindcast
{

/// @brief Describes one blocking invocation of an external program.
struct ProcessSpec
{
    std::string command;
    std::vector<std::string> args;

    /// @brief Maximum wall-clock time before the child is killed. Zero disables the limit.
    std::chrono::milliseconds timeout { 0 };
};

/// @brief Captured outcome of a finished child process.
struct ProcessOutput
{
    int exitCode = 0;
    std::string standardOutput;
    std::string standardError;

    [[nodiscard]] auto succeeded() const -> bool { return exitCode == 0; }
};

/// @brief Abstract interface for running external tools.
///
/// A successful Result means the child ran to completion; its exit code is reported in
/// ProcessOutput and interpreting it is up to the caller. Spawn failures are ProcessError,
/// exceeding the timeout is TimeoutError.
class ProcessRunner
{
  public:
    virtual ~ProcessRunner() = default;

    /// @brief Runs the process to completion (blocking).
    /// @param spec The program, its arguments and the timeout.
    /// @return The captured output or an error.
    [[nodiscard]] virtual auto run(const ProcessSpec& spec) -> Result<ProcessOutput> = 0;
};

/// @brief Renders a command line for log output.
[[nodiscard]] auto describeCommand(const ProcessSpec& spec) -> std::string;

} // namespace mindcast

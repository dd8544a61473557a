// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/ProcessRunner.hpp>

namespace mindcast
{

/// @brief Runs programs as child processes with captured stdout/stderr.
///
/// Spawns the child via posix_spawnp with stdin bound to /dev/null and both output
/// streams connected to pipes, then waits for it while enforcing the timeout.
class SubprocessRunner: public ProcessRunner
{
  public:
    [[nodiscard]] auto run(const ProcessSpec& spec) -> Result<ProcessOutput> override;
};

} // namespace mindcast

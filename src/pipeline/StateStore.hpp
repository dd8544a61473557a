// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/Stage.hpp>
#include <pipeline/State.hpp>

#include <filesystem>
#include <optional>
#include <vector>

namespace mindcast
{

/// @brief Append-only snapshot persistence in a flat directory.
///
/// Every save() creates `state_<stage>_<YYYYMMDD_HHMMSS_ffffff>[_NN].json`; existing files are
/// never overwritten. Names sort lexically in write order per stage.
class StateStore
{
  public:
    explicit StateStore(std::filesystem::path directory);

    /// @brief Writes a new snapshot of the state tagged with the stage.
    /// @return The snapshot's path, or IoError.
    [[nodiscard]] auto save(const State& state, StageId stage) -> Result<std::filesystem::path>;

    /// @brief Reads a snapshot.
    /// @return The state, NotFound for a missing file, CorruptSnapshot for an unreadable one.
    [[nodiscard]] auto load(const std::filesystem::path& snapshot) const -> Result<State>;

    /// @brief Finds the newest snapshot of a stage, or of the furthest stage that has any.
    /// @return The snapshot's path, or NotFound.
    [[nodiscard]] auto latest(std::optional<StageId> stage = std::nullopt) const -> Result<std::filesystem::path>;

    /// @brief Lists a stage's snapshots, oldest first.
    [[nodiscard]] auto snapshots(StageId stage) const -> std::vector<std::filesystem::path>;

    [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& { return _directory; }

  private:
    std::filesystem::path _directory;
};

} // namespace mindcast

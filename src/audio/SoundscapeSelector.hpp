// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace mindcast
{

/// @brief Chooses a background file for a soundscape tag.
class SoundscapeSelector
{
  public:
    SoundscapeSelector(std::filesystem::path directory, std::vector<std::string> extensions, std::mt19937_64& rng);

    /// @brief Lists the audio files in the directory, sorted by name.
    ///
    /// Only regular files whose extension (compared case-insensitively) is configured count.
    [[nodiscard]] auto candidates() const -> std::vector<std::filesystem::path>;

    /// @brief Picks a file whose name contains the tag (case-insensitive).
    ///
    /// Without a match any candidate is chosen uniformly at random.
    /// @return The chosen file, or NoCandidate if the directory has no audio files.
    [[nodiscard]] auto select(std::string_view tag) -> Result<std::filesystem::path>;

  private:
    std::filesystem::path _directory;
    std::vector<std::string> _extensions;
    std::mt19937_64& _rng;
};

} // namespace mindcast

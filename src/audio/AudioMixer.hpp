// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTool.hpp>
#include <core/Error.hpp>

#include <filesystem>
#include <optional>
#include <random>

namespace mindcast
{

/// @brief How the background is aligned to the narration.
struct BackgroundPlan
{
    double durationSeconds = 0.0;
    double offsetSeconds = 0.0;
    int repetitions = 1;
    double fadeSeconds = 0.0;

    [[nodiscard]] auto looped() const noexcept -> bool { return repetitions > 1; }
};

/// @brief Decides between trimming and looping the background.
///
/// A background at least as long as the narration is trimmed from a random offset in
/// [0, background - narration]. A shorter one is repeated floor(narration / background) + 1
/// times and then trimmed from the start. Fades are clamped to a quarter of the narration.
[[nodiscard]] auto planBackground(double narrationSeconds,
                                  double backgroundSeconds,
                                  double fadeSeconds,
                                  std::mt19937_64& rng) -> BackgroundPlan;

/// @brief Picks where a preview excerpt starts.
///
/// Returns a random offset in [10, total - sample] when the total exceeds the sample by more
/// than 10 seconds, 0 otherwise.
[[nodiscard]] auto sampleStart(double totalSeconds, double sampleSeconds, std::mt19937_64& rng) -> double;

/// @brief Inputs of one mixing operation.
struct MixRequest
{
    std::filesystem::path narrationFile;
    std::filesystem::path backgroundFile;

    /// @brief Directory for the results; empty means the narration's directory.
    std::filesystem::path outputDir;

    double backgroundVolume = 0.3;
    double fadeSeconds = 3.0;
    bool makeSample = true;
    double sampleDurationSeconds = 30.0;
};

/// @brief Files produced by a mixing operation.
struct MixResult
{
    std::filesystem::path mixedFile;
    std::optional<std::filesystem::path> sampleFile;
    double durationSeconds = 0.0;
    BackgroundPlan plan;
};

/// @brief Overlays a narration on a duration-matched, attenuated background.
class AudioMixer
{
  public:
    AudioMixer(AudioTool& audioTool, std::mt19937_64& rng);

    /// @brief Mixes the two files and optionally cuts a preview excerpt.
    ///
    /// The mixed file is named `<narration>_with_<background>.<ext>` and the excerpt
    /// `sample_<mixed name>`. A failed excerpt is logged and leaves sampleFile empty.
    /// @return The produced files, or InvalidArgument / MixError.
    [[nodiscard]] auto mix(const MixRequest& request) -> Result<MixResult>;

    /// @brief The mixed-file name for a pair of inputs.
    [[nodiscard]] static auto mixedFileName(const std::filesystem::path& narration,
                                            const std::filesystem::path& background) -> std::filesystem::path;

  private:
    AudioTool& _audioTool;
    std::mt19937_64& _rng;
};

} // namespace mindcast

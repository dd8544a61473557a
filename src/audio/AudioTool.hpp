// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/ProcessRunner.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace mindcast
{

/// @brief Locations and limits for the external audio tools.
struct AudioToolConfig
{
    std::string ffmpegPath = "ffmpeg";
    std::string ffprobePath = "ffprobe";
    std::chrono::seconds timeout { 600 };
};

/// @brief Everything needed to overlay a duration-matched background onto a narration.
struct OverlaySpec
{
    std::filesystem::path narration;
    std::filesystem::path background;
    std::filesystem::path output;

    /// @brief Length of the result; always the narration's duration.
    double durationSeconds = 0.0;

    /// @brief Where to start reading the (possibly looped) background.
    double backgroundOffsetSeconds = 0.0;

    /// @brief How often the background is played back to back. 1 means no looping.
    int backgroundRepetitions = 1;

    double backgroundVolume = 1.0;
    double fadeSeconds = 0.0;
};

/// @brief Blocking wrapper around ffprobe and ffmpeg.
///
/// All operations go through a ProcessRunner with the configured timeout. An operation that
/// fails never leaves its output file behind.
class AudioTool
{
  public:
    AudioTool(ProcessRunner& runner, AudioToolConfig config);

    /// @brief Reads the container duration of an audio file in seconds.
    /// @return NotFound for a missing file, DecodeError if the file cannot be probed.
    [[nodiscard]] auto probeDuration(const std::filesystem::path& file) -> Result<double>;

    /// @brief Mixes narration and background with trim or loop, volume and fades applied.
    [[nodiscard]] auto overlay(const OverlaySpec& spec) -> VoidResult;

    /// @brief Copies a time range of a file without re-encoding.
    [[nodiscard]] auto extract(const std::filesystem::path& input,
                               const std::filesystem::path& output,
                               double startSeconds,
                               double durationSeconds) -> VoidResult;

    /// @brief Joins files of identical encoding in order without re-encoding.
    [[nodiscard]] auto concat(const std::vector<std::filesystem::path>& inputs, const std::filesystem::path& output)
        -> VoidResult;

    /// @brief Builds the ffmpeg filter graph used by overlay().
    [[nodiscard]] static auto overlayFilter(const OverlaySpec& spec) -> std::string;

  private:
    ProcessRunner& _runner;
    AudioToolConfig _config;

    auto runFfmpeg(std::vector<std::string> args, const std::filesystem::path& output, std::string_view what)
        -> VoidResult;
};

} // namespace mindcast

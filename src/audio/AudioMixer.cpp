// SPDX-License-Identifier: Apache-2.0
#include "AudioMixer.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace mindcast
{

namespace
{

    constexpr auto SampleLeadInSeconds = 10.0;

    auto uniform(double low, double high, std::mt19937_64& rng) -> double
    {
        if (high <= low)
            return low;
        return std::uniform_real_distribution<double>(low, high)(rng);
    }

    auto probeInput(AudioTool& tool, const std::filesystem::path& file, std::string_view role) -> Result<double>
    {
        auto duration = tool.probeDuration(file);
        if (!duration)
            return makeError(ErrorCode::MixError, std::format("{} track unusable: {}", role, duration.error().message));
        return duration;
    }

} // namespace

auto planBackground(double narrationSeconds, double backgroundSeconds, double fadeSeconds, std::mt19937_64& rng)
    -> BackgroundPlan
{
    auto plan = BackgroundPlan {
        .durationSeconds = narrationSeconds,
        .offsetSeconds = 0.0,
        .repetitions = 1,
        .fadeSeconds = std::clamp(fadeSeconds, 0.0, narrationSeconds / 4.0),
    };

    if (backgroundSeconds >= narrationSeconds)
        plan.offsetSeconds = uniform(0.0, backgroundSeconds - narrationSeconds, rng);
    else
        plan.repetitions = static_cast<int>(std::floor(narrationSeconds / backgroundSeconds)) + 1;

    return plan;
}

auto sampleStart(double totalSeconds, double sampleSeconds, std::mt19937_64& rng) -> double
{
    if (totalSeconds > sampleSeconds + SampleLeadInSeconds)
        return uniform(SampleLeadInSeconds, totalSeconds - sampleSeconds, rng);
    return 0.0;
}

AudioMixer::AudioMixer(AudioTool& audioTool, std::mt19937_64& rng): _audioTool(audioTool), _rng(rng)
{
}

auto AudioMixer::mixedFileName(const std::filesystem::path& narration, const std::filesystem::path& background)
    -> std::filesystem::path
{
    return std::format("{}_with_{}{}", narration.stem().string(), background.stem().string(), narration.extension().string());
}

auto AudioMixer::mix(const MixRequest& request) -> Result<MixResult>
{
    if (request.backgroundVolume < 0.0 || request.backgroundVolume > 1.0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Background volume {} is outside [0, 1]", request.backgroundVolume));
    if (request.makeSample && request.sampleDurationSeconds <= 0.0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Sample duration must be positive, got {}", request.sampleDurationSeconds));

    for (const auto& file: { request.narrationFile, request.backgroundFile })
    {
        if (!std::filesystem::is_regular_file(file))
            return makeError(ErrorCode::MixError, std::format("Input file not found: {}", file.string()));
    }

    auto const narrationSeconds = probeInput(_audioTool, request.narrationFile, "Narration");
    if (!narrationSeconds)
        return std::unexpected(narrationSeconds.error());
    auto const backgroundSeconds = probeInput(_audioTool, request.backgroundFile, "Background");
    if (!backgroundSeconds)
        return std::unexpected(backgroundSeconds.error());

    auto const plan = planBackground(*narrationSeconds, *backgroundSeconds, request.fadeSeconds, _rng);
    if (plan.looped())
        log::info("Background ({:.1f}s) is shorter than narration ({:.1f}s), looping it {} times",
                  *backgroundSeconds,
                  *narrationSeconds,
                  plan.repetitions);
    else
        log::info("Background ({:.1f}s) trimmed to narration ({:.1f}s) from offset {:.1f}s",
                  *backgroundSeconds,
                  *narrationSeconds,
                  plan.offsetSeconds);

    auto const outputDir = request.outputDir.empty() ? request.narrationFile.parent_path() : request.outputDir;
    auto result = MixResult {
        .mixedFile = outputDir / mixedFileName(request.narrationFile, request.backgroundFile),
        .sampleFile = std::nullopt,
        .durationSeconds = *narrationSeconds,
        .plan = plan,
    };

    auto const overlay = OverlaySpec {
        .narration = request.narrationFile,
        .background = request.backgroundFile,
        .output = result.mixedFile,
        .durationSeconds = plan.durationSeconds,
        .backgroundOffsetSeconds = plan.offsetSeconds,
        .backgroundRepetitions = plan.repetitions,
        .backgroundVolume = request.backgroundVolume,
        .fadeSeconds = plan.fadeSeconds,
    };
    if (auto mixed = _audioTool.overlay(overlay); !mixed)
        return std::unexpected(mixed.error());

    log::info("Mixed audio written to {}", result.mixedFile.string());

    if (!request.makeSample)
        return result;

    auto const samplePath = outputDir / std::format("sample_{}", result.mixedFile.filename().string());
    auto const length = std::min(request.sampleDurationSeconds, result.durationSeconds);
    auto const start = sampleStart(result.durationSeconds, length, _rng);

    log::info("Creating sample from {:.2f}s to {:.2f}s", start, start + length);
    if (auto excerpt = _audioTool.extract(result.mixedFile, samplePath, start, length); !excerpt)
    {
        log::warning("Sample extraction failed, continuing without a sample: {}", excerpt.error().message);
        return result;
    }

    result.sampleFile = samplePath;
    return result;
}

} // namespace mindcast

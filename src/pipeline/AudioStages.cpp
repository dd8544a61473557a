// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <core/Timestamp.hpp>
#include <pipeline/AudioStages.hpp>

#include <format>
#include <fstream>
#include <system_error>

namespace mindcast
{

namespace
{

    auto writeSummary(const std::filesystem::path& path, const nlohmann::json& summary) -> VoidResult
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Cannot create directory {}: {}", path.parent_path().string(), ec.message()));

        auto file = std::ofstream(path);
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot write summary {}", path.string()));
        file << summary.dump(2) << '\n';
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Failed writing summary {}", path.string()));
        return {};
    }

} // namespace

SpeechSynthesisStage::SpeechSynthesisStage(ChunkedSynthesizer& synthesizer,
                                           const VoiceCatalog& voices,
                                           SynthesisSettings settings):
    _synthesizer(synthesizer), _voices(voices), _settings(std::move(settings))
{
}

auto SpeechSynthesisStage::run(State state) -> State
{
    if (!state.markupOutput || state.markupOutput->empty())
    {
        state.error = stageError(id(), Error { ErrorCode::InvalidArgument, "no markup to synthesize" });
        return state;
    }

    auto const voiceId = _voices.resolve(state.request.languageCode, enumName(state.request.voice));
    auto const output =
        _settings.audioDir / std::format("meditation_audio_{}_{}.{}", voiceId, fileTimestamp(), _settings.outputFormat);

    auto ec = std::error_code {};
    std::filesystem::create_directories(_settings.audioDir, ec);
    if (ec)
    {
        state.error = stageError(
            id(),
            Error { ErrorCode::IoError, std::format("Cannot create {}: {}", _settings.audioDir.string(), ec.message()) });
        return state;
    }

    log::info("Synthesizing {} bytes of markup with voice {} ({})",
              state.markupOutput->size(),
              voiceId,
              state.request.languageCode);

    auto narration = _synthesizer.synthesize(SpeechRequest {
        .markup = *state.markupOutput,
        .voiceId = voiceId,
        .languageCode = state.request.languageCode,
        .outputFormat = _settings.outputFormat,
        .outputPath = output,
    });
    if (!narration)
    {
        state.error = stageError(id(), narration.error());
        return state;
    }

    log::info("Narration written to {}", narration->string());
    state.audioOutput = AudioOutput {
        .narrationFile = narration->string(),
        .mixedFile = std::nullopt,
        .sampleFile = std::nullopt,
        .status = std::string(audio_status::Generated),
        .summaryFile = std::nullopt,
    };
    return state;
}

AudioMixingStage::AudioMixingStage(AudioMixer& mixer, SoundscapeSelector& selector, MixingSettings settings):
    _mixer(mixer), _selector(selector), _settings(std::move(settings))
{
}

auto AudioMixingStage::run(State state) -> State
{
    if (!state.audioOutput || state.audioOutput->narrationFile.empty())
    {
        state.error = stageError(id(), Error { ErrorCode::InvalidArgument, "no narration file to mix" });
        return state;
    }

    auto const tag = enumName(state.request.soundscape);
    auto background = _selector.select(tag);
    if (!background)
    {
        state.error = stageError(id(), background.error());
        return state;
    }
    log::info("Using soundscape {} for '{}'", background->string(), tag);

    auto ec = std::error_code {};
    std::filesystem::create_directories(_settings.audioDir, ec);
    if (ec)
    {
        state.error = stageError(
            id(),
            Error { ErrorCode::IoError, std::format("Cannot create {}: {}", _settings.audioDir.string(), ec.message()) });
        return state;
    }

    auto mixed = _mixer.mix(MixRequest {
        .narrationFile = state.audioOutput->narrationFile,
        .backgroundFile = *background,
        .outputDir = _settings.audioDir,
        .backgroundVolume = _settings.backgroundVolume,
        .fadeSeconds = _settings.fadeSeconds,
        .makeSample = _settings.makeSample,
        .sampleDurationSeconds = _settings.sampleDurationSeconds,
    });
    if (!mixed)
    {
        state.error = stageError(id(), mixed.error());
        return state;
    }

    auto& audio = *state.audioOutput;
    audio.mixedFile = mixed->mixedFile.string();
    audio.sampleFile = mixed->sampleFile ? std::optional(mixed->sampleFile->string()) : std::nullopt;
    audio.summaryFile.reset();

    // The state reports completion only once the summary is on disk
    auto const summaryPath = _settings.jsonDir / std::format("meditation_{}.json", fileTimestamp());
    auto summary = summaryJson(state);
    summary["audio_output"]["status"] = std::string(audio_status::Completed);
    summary["audio_output"]["summary_file"] = summaryPath.string();
    if (auto written = writeSummary(summaryPath, summary); !written)
    {
        state.error = stageError(id(), written.error());
        return state;
    }

    log::info("Summary written to {}", summaryPath.string());
    audio.status = std::string(audio_status::Completed);
    audio.summaryFile = summaryPath.string();
    return state;
}

auto summaryJson(const State& state) -> nlohmann::json
{
    auto const full = toJson(state);
    return {
        { "request", full.at("request") },
        { "script", full.at("script") },
        { "prosody_analysis", full.at("prosody_analysis") },
        { "prosody_profile", full.at("prosody_profile") },
        { "audio_output", full.at("audio_output") },
    };
}

} // namespace mindcast

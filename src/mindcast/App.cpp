// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioMixer.hpp>
#include <audio/AudioTool.hpp>
#include <audio/SoundscapeSelector.hpp>
#include <core/Log.hpp>
#include <core/SubprocessRunner.hpp>
#include <llm/LlmEngine.hpp>
#include <pipeline/AudioStages.hpp>
#include <pipeline/GenerationStages.hpp>
#include <pipeline/Pipeline.hpp>
#include <pipeline/StateStore.hpp>
#include <speech/ChunkedSynthesizer.hpp>
#include <speech/CommandSpeechService.hpp>
#include <speech/PiperSpeechService.hpp>
#include <speech/VoiceCatalog.hpp>

#include <chrono>
#include <format>
#include <random>

namespace mindcast
{

namespace
{

    auto makeRng(const MixerConfig& mixer) -> std::mt19937_64
    {
        if (mixer.seed)
            return std::mt19937_64(*mixer.seed);
        return std::mt19937_64(std::random_device {}());
    }

    /// Stage to continue with after a snapshot written by `currentStep`.
    auto stageAfter(std::string_view currentStep) -> Result<StageId>
    {
        if (currentStep.empty())
            return AllStages.front();

        auto stage = parseStage(currentStep);
        if (!stage)
            return makeError(ErrorCode::CorruptSnapshot,
                             std::format("Snapshot names an unknown stage '{}'", currentStep));
        if (*stage == AllStages.back())
            return makeError(ErrorCode::InvalidArgument, "The snapshot already completed the pipeline");
        return AllStages[stageIndex(*stage) + 1];
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    SubprocessRunner runner;
    LlmEngine engine;
    PiperSpeechService* piper = nullptr;
    std::unique_ptr<SpeechService> speech;
    AudioTool audioTool;
    std::mt19937_64 rng;
    VoiceCatalog voices;
    ChunkedSynthesizer synthesizer;
    AudioMixer mixer;
    SoundscapeSelector selector;
    StateStore store;
    Pipeline pipeline;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)),
        speech(makeSpeechService()),
        audioTool(runner,
                  AudioToolConfig {
                      .ffmpegPath = config.mixer.ffmpegPath,
                      .ffprobePath = config.mixer.ffprobePath,
                      .timeout = std::chrono::seconds(config.mixer.timeoutSeconds),
                  }),
        rng(makeRng(config.mixer)),
        voices(config.synthesis.voices),
        synthesizer(*speech,
                    audioTool,
                    markup::ChunkingOptions { .maxChunkChars = static_cast<std::size_t>(config.synthesis.maxChunkChars) }),
        mixer(audioTool, rng),
        selector(config.paths.soundscapeDir, config.mixer.extensions, rng),
        store(config.paths.stateDir),
        pipeline(store)
    {
    }

    auto makeSpeechService() -> std::unique_ptr<SpeechService>
    {
        if (config.synthesis.backend == SynthesisBackend::Piper)
        {
            auto service = std::make_unique<PiperSpeechService>();
            piper = service.get();
            return service;
        }

        return std::make_unique<CommandSpeechService>(
            runner,
            CommandSpeechConfig {
                .command = config.synthesis.command,
                .timeout = std::chrono::seconds(config.synthesis.timeoutSeconds),
            });
    }

    /// The piper backend writes wav regardless of the configured format.
    [[nodiscard]] auto outputFormat() const -> std::string
    {
        if (config.synthesis.backend == SynthesisBackend::Piper && config.synthesis.outputFormat != "wav")
            return "wav";
        return config.synthesis.outputFormat;
    }

    void registerStages()
    {
        auto const generation = GenerationSettings {
            .sampler = SamplerConfig { .temperature = config.llm.temperature },
            .maxReformatAttempts = config.llm.maxReformatAttempts,
            .reviewIterations = config.llm.reviewIterations,
        };

        pipeline.setStage(std::make_unique<ScriptStage>(engine, generation));
        pipeline.setStage(std::make_unique<ProsodyAnalysisStage>(engine, generation));
        pipeline.setStage(std::make_unique<ProsodyProfileStage>(engine, generation));
        pipeline.setStage(std::make_unique<MarkupGenerationStage>(engine, generation));
        pipeline.setStage(std::make_unique<MarkupReviewStage>(engine, generation));
        pipeline.setStage(std::make_unique<SpeechSynthesisStage>(synthesizer,
                                                                 voices,
                                                                 SynthesisSettings {
                                                                     .audioDir = config.paths.audioDir,
                                                                     .outputFormat = outputFormat(),
                                                                 }));
        pipeline.setStage(std::make_unique<AudioMixingStage>(mixer,
                                                             selector,
                                                             MixingSettings {
                                                                 .audioDir = config.paths.audioDir,
                                                                 .jsonDir = config.paths.jsonDir,
                                                                 .backgroundVolume = config.mixer.backgroundVolume,
                                                                 .fadeSeconds = config.mixer.fadeSeconds,
                                                                 .makeSample = config.mixer.makeSample,
                                                                 .sampleDurationSeconds =
                                                                     config.mixer.sampleDurationSeconds,
                                                             }));
    }

    /// Loads the collaborators that the stages in [start, end] depend on.
    auto prepare(StageId start, StageId end) -> VoidResult
    {
        auto const covers = [&](StageId stage) {
            return stageIndex(start) <= stageIndex(stage) && stageIndex(stage) <= stageIndex(end);
        };

        if (stageIndex(start) <= stageIndex(StageId::MarkupReview) && !engine.isLoaded())
        {
            if (config.llm.modelPath.empty())
                return makeError(ErrorCode::ConfigError, "No language model configured (llm.modelPath)");

            auto loadResult = engine.load(LlmEngineConfig {
                .modelPath = config.llm.modelPath,
                .contextSize = config.llm.contextSize,
                .gpuLayers = config.llm.gpuLayers,
            });
            if (!loadResult)
                return loadResult;
        }

        if (covers(StageId::SpeechSynthesis) && piper)
        {
            if (config.synthesis.piperModelPath.empty())
                return makeError(ErrorCode::ConfigError, "No piper voice configured (synthesis.piperModelPath)");

            auto initResult = piper->initialize(PiperSpeechConfig {
                .modelPath = config.synthesis.piperModelPath,
                .espeakDataPath = config.synthesis.espeakDataPath,
            });
            if (!initResult)
                return initResult;
        }

        return {};
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    if (auto const& logFile = _impl->config.paths.logFile; !logFile.empty())
    {
        if (!log::setFile(logFile))
            return makeError(ErrorCode::IoError, std::format("Cannot open log file {}", logFile));
    }

    log::debug("Speech backend: {}, output format {}",
               backendName(_impl->config.synthesis.backend),
               _impl->outputFormat());
    log::debug("Snapshots in {}", _impl->store.directory().string());

    _impl->registerStages();
    return {};
}

auto App::run(const MeditationRequest& request, const RunPlan& plan) -> Result<State>
{
    auto seed = std::optional<State> {};
    if (plan.resumeFrom)
    {
        auto loaded = _impl->store.load(*plan.resumeFrom);
        if (!loaded)
            return std::unexpected(loaded.error());
        log::info("Resuming from {} (written by {})",
                  plan.resumeFrom->string(),
                  loaded->currentStep.empty() ? "-" : loaded->currentStep);
        seed = std::move(*loaded);
    }

    auto start = plan.start;
    if (!start)
    {
        if (seed)
        {
            auto next = stageAfter(seed->currentStep);
            if (!next)
                return std::unexpected(next.error());
            start = *next;
        }
        else
            start = AllStages.front();
    }

    if (stageIndex(*start) > stageIndex(plan.end))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Start stage {} comes after end stage {}", stageName(*start), stageName(plan.end)));

    if (auto prepared = _impl->prepare(*start, plan.end); !prepared)
        return std::unexpected(prepared.error());

    auto const effectiveRequest = seed ? seed->request : request;
    return _impl->pipeline.runRange(*start, plan.end, effectiveRequest, std::move(seed));
}

} // namespace mindcast

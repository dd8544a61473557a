// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioMixer.hpp>
#include <audio/SoundscapeSelector.hpp>
#include <pipeline/Stage.hpp>
#include <speech/ChunkedSynthesizer.hpp>
#include <speech/VoiceCatalog.hpp>

#include <filesystem>
#include <string>

namespace mindcast
{

struct SynthesisSettings
{
    std::filesystem::path audioDir = "output/audio";
    std::string outputFormat = "mp3";
};

/// @brief Synthesizes the reviewed markup into the narration file.
///
/// The narration is written to `<audioDir>/meditation_audio_<voice>_<timestamp>.<format>`.
/// Re-running the stage replaces the whole audio output, so mixing results of an earlier run
/// never survive next to a new narration.
class SpeechSynthesisStage: public Stage
{
  public:
    SpeechSynthesisStage(ChunkedSynthesizer& synthesizer, const VoiceCatalog& voices, SynthesisSettings settings);

    [[nodiscard]] auto id() const -> StageId override { return StageId::SpeechSynthesis; }
    [[nodiscard]] auto run(State state) -> State override;

  private:
    ChunkedSynthesizer& _synthesizer;
    const VoiceCatalog& _voices;
    SynthesisSettings _settings;
};

struct MixingSettings
{
    std::filesystem::path audioDir = "output/audio";
    std::filesystem::path jsonDir = "output/json";
    double backgroundVolume = 0.3;
    double fadeSeconds = 3.0;
    bool makeSample = true;
    double sampleDurationSeconds = 30.0;
};

/// @brief Mixes the narration with a soundscape and writes the run summary.
class AudioMixingStage: public Stage
{
  public:
    AudioMixingStage(AudioMixer& mixer, SoundscapeSelector& selector, MixingSettings settings);

    [[nodiscard]] auto id() const -> StageId override { return StageId::AudioMixing; }
    [[nodiscard]] auto run(State state) -> State override;

  private:
    AudioMixer& _mixer;
    SoundscapeSelector& _selector;
    MixingSettings _settings;
};

/// @brief The summary document: request, script, prosody analysis and profile, audio output.
[[nodiscard]] auto summaryJson(const State& state) -> nlohmann::json;

} // namespace mindcast

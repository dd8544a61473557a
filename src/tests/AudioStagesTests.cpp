// SPDX-License-Identifier: Apache-2.0
#include <pipeline/AudioStages.hpp>

#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <random>

using namespace mindcast;
using namespace mindcast::test;

namespace
{

    struct SynthesisFixture
    {
        TempDir dir { "synthesis_stage" };
        FakeSpeechService speech;
        FakeProcessRunner runner;
        AudioTool tool { runner, AudioToolConfig {} };
        ChunkedSynthesizer synthesizer { speech, tool, markup::ChunkingOptions {} };
        VoiceCatalog voices;
        SpeechSynthesisStage stage { synthesizer, voices, SynthesisSettings { .audioDir = dir / "audio", .outputFormat = "mp3" } };
    };

    struct MixingFixture
    {
        TempDir dir { "mixing_stage" };
        FakeProcessRunner runner;
        std::mt19937_64 rng { 3 };
        AudioTool tool { runner, AudioToolConfig {} };
        AudioMixer mixer { tool, rng };
        SoundscapeSelector selector { dir / "sounds", { ".mp3", ".wav" }, rng };
        AudioMixingStage stage { mixer,
                                 selector,
                                 MixingSettings {
                                     .audioDir = dir / "audio",
                                     .jsonDir = dir / "json",
                                     .backgroundVolume = 0.3,
                                     .fadeSeconds = 3.0,
                                     .makeSample = true,
                                     .sampleDurationSeconds = 30.0,
                                 } };

        MixingFixture()
        {
            std::filesystem::create_directories(dir / "sounds");
            std::filesystem::create_directories(dir / "audio");
        }

        /// @brief A state as the synthesis stage leaves it.
        [[nodiscard]] auto synthesizedState() -> State
        {
            writeFile(dir / "audio" / "narration.mp3", "narration");
            auto state = State {};
            state.request.soundscape = Soundscape::Rain;
            state.script = Script { .content = "Breathe in.", .sections = {} };
            state.prosodyAnalysis = nlohmann::json { { "pace", "slow" } };
            state.markupOutput = "<speak>Breathe in.</speak>";
            state.audioOutput = AudioOutput {
                .narrationFile = (dir / "audio" / "narration.mp3").string(),
                .mixedFile = std::nullopt,
                .sampleFile = std::nullopt,
                .status = "generated",
                .summaryFile = std::nullopt,
            };
            return state;
        }
    };

} // namespace

TEST_CASE("SpeechSynthesisStage writes the narration named after the voice", "[stages][audio]")
{
    auto fixture = SynthesisFixture {};
    auto state = State {};
    state.request.voice = VoiceType::Female;
    state.request.languageCode = "en-US";
    state.markupOutput = "<speak>Close your eyes.</speak>";

    auto const result = fixture.stage.run(state);

    REQUIRE(result.error.empty());
    REQUIRE(result.audioOutput.has_value());
    auto const narration = std::filesystem::path(result.audioOutput->narrationFile);
    CHECK(narration.parent_path() == fixture.dir / "audio");
    CHECK(narration.filename().string().starts_with("meditation_audio_Joanna_"));
    CHECK(narration.extension() == ".mp3");
    CHECK(std::filesystem::exists(narration));
    CHECK(result.audioOutput->status == "generated");
    CHECK(!result.audioOutput->mixedFile.has_value());

    REQUIRE(fixture.speech.requests.size() == 1);
    CHECK(fixture.speech.requests[0].voiceId == "Joanna");
    CHECK(fixture.speech.requests[0].markup == "<speak>Close your eyes.</speak>");
}

TEST_CASE("SpeechSynthesisStage requires markup", "[stages][audio]")
{
    auto fixture = SynthesisFixture {};

    auto const result = fixture.stage.run(State {});

    CHECK(result.error == "speech-synthesis: no markup to synthesize");
    CHECK(!result.audioOutput.has_value());
    CHECK(fixture.speech.requests.empty());
}

TEST_CASE("SpeechSynthesisStage reports synthesis failures", "[stages][audio]")
{
    auto fixture = SynthesisFixture {};
    fixture.speech.failingRequest = 0;
    auto state = State {};
    state.markupOutput = "<speak>Close your eyes.</speak>";

    auto const result = fixture.stage.run(state);

    CHECK(result.error.starts_with("speech-synthesis: "));
    CHECK(!result.audioOutput.has_value());
    CHECK(fixture.dir.files().empty());
}

TEST_CASE("AudioMixingStage mixes with a matching soundscape and writes the summary", "[stages][audio]")
{
    auto fixture = MixingFixture {};
    writeFile(fixture.dir / "sounds" / "gentle_rain.mp3", "rain");
    writeFile(fixture.dir / "sounds" / "city_traffic.mp3", "city");
    fixture.runner.durations["narration.mp3"] = 300.0;
    fixture.runner.durations["gentle_rain.mp3"] = 900.0;

    auto const result = fixture.stage.run(fixture.synthesizedState());

    REQUIRE(result.error.empty());
    REQUIRE(result.audioOutput.has_value());
    auto const& audio = *result.audioOutput;
    CHECK(audio.status == "completed");
    REQUIRE(audio.mixedFile.has_value());
    CHECK(std::filesystem::path(*audio.mixedFile).filename() == "narration_with_gentle_rain.mp3");
    CHECK(std::filesystem::exists(*audio.mixedFile));
    REQUIRE(audio.sampleFile.has_value());
    CHECK(std::filesystem::path(*audio.sampleFile).filename() == "sample_narration_with_gentle_rain.mp3");

    REQUIRE(audio.summaryFile.has_value());
    auto const summaryPath = std::filesystem::path(*audio.summaryFile);
    CHECK(summaryPath.parent_path() == fixture.dir / "json");
    CHECK(summaryPath.filename().string().starts_with("meditation_"));

    auto const summary = nlohmann::json::parse(readFile(summaryPath));
    CHECK(summary.size() == 5);
    CHECK(summary.contains("request"));
    CHECK(summary.contains("script"));
    CHECK(summary.contains("prosody_analysis"));
    CHECK(summary.contains("prosody_profile"));
    CHECK(summary.at("request").at("soundscape") == "Rain");
    CHECK(summary.at("audio_output").at("status") == "completed");
    CHECK(summary.at("audio_output").at("mixed_file") == *audio.mixedFile);
    CHECK(summary.at("audio_output").at("summary_file") == *audio.summaryFile);
}

TEST_CASE("AudioMixingStage is not completed when the summary cannot be written", "[stages][audio]")
{
    auto fixture = MixingFixture {};
    writeFile(fixture.dir / "sounds" / "rain.mp3", "rain");
    fixture.runner.durations["narration.mp3"] = 300.0;
    fixture.runner.durations["rain.mp3"] = 900.0;

    // A plain file where the summary directory should go
    writeFile(fixture.dir / "json", "in the way");

    auto const result = fixture.stage.run(fixture.synthesizedState());

    CHECK(result.error.starts_with("audio-mixing: "));
    REQUIRE(result.audioOutput.has_value());
    CHECK(result.audioOutput->status == "generated");
    CHECK(!result.audioOutput->summaryFile.has_value());
    CHECK(result.audioOutput->mixedFile.has_value());
}

TEST_CASE("AudioMixingStage requires a narration", "[stages][audio]")
{
    auto fixture = MixingFixture {};
    writeFile(fixture.dir / "sounds" / "rain.mp3", "rain");

    auto const result = fixture.stage.run(State {});

    CHECK(result.error == "audio-mixing: no narration file to mix");
    CHECK(fixture.runner.calls.empty());
}

TEST_CASE("AudioMixingStage fails without soundscapes", "[stages][audio]")
{
    auto fixture = MixingFixture {};

    auto const result = fixture.stage.run(fixture.synthesizedState());

    CHECK(result.error.starts_with("audio-mixing: No soundscape files found"));
    REQUIRE(result.audioOutput.has_value());
    CHECK(result.audioOutput->status == "generated");
    CHECK(fixture.runner.calls.empty());
    CHECK(!std::filesystem::exists(fixture.dir / "json"));
}

TEST_CASE("summaryJson keeps the documented sections only", "[stages][audio]")
{
    auto state = State {};
    state.markupOutput = "<speak/>";
    state.warnings.push_back("something");

    auto const summary = summaryJson(state);

    CHECK(summary.size() == 5);
    CHECK(!summary.contains("markup_output"));
    CHECK(!summary.contains("warnings"));
    CHECK(summary.at("script").is_null());
}

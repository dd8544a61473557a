// SPDX-License-Identifier: Apache-2.0
#include <mindcast/Config.hpp>

#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace mindcast;
using namespace mindcast::test;

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.paths.stateDir == "output/state");
    CHECK(config.paths.audioDir == "output/audio");
    CHECK(config.llm.contextSize == 8192);
    CHECK(config.llm.temperature == 0.7f);
    CHECK(config.llm.reviewIterations == 3);
    CHECK(config.synthesis.backend == SynthesisBackend::Command);
    CHECK(config.synthesis.maxChunkChars == 2900);
    CHECK(config.synthesis.command.front() == "aws");
    CHECK(config.mixer.backgroundVolume == 0.3);
    CHECK(config.mixer.makeSample == true);
    CHECK(!config.mixer.seed.has_value());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto dir = TempDir { "config" };
    auto const path = dir / "config.json";
    writeFile(path, R"({
        "paths": {
            "stateDir": "/tmp/states",
            "soundscapeDir": "/srv/sounds",
            "logFile": "/tmp/mindcast.log"
        },
        "llm": {
            "modelPath": "/tmp/test.gguf",
            "contextSize": 4096,
            "gpuLayers": 32,
            "temperature": 0.5,
            "reviewIterations": 1
        },
        "synthesis": {
            "backend": "piper",
            "command": ["say", "-o", "{output}", "{markup}"],
            "outputFormat": "wav",
            "maxChunkChars": 1500,
            "piperModelPath": "/tmp/voice.onnx",
            "voices": { "de-DE": { "Female": "Vicki" } }
        },
        "mixer": {
            "backgroundVolume": 0.2,
            "fadeSeconds": 5,
            "makeSample": false,
            "seed": 1234,
            "extensions": [".ogg"]
        }
    })");

    auto result = loadConfigFromFile(path.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("Paths config")
    {
        CHECK(config.paths.stateDir == "/tmp/states");
        CHECK(config.paths.audioDir == "output/audio");
        CHECK(config.paths.soundscapeDir == "/srv/sounds");
        CHECK(config.paths.logFile == "/tmp/mindcast.log");
    }

    SECTION("LLM config")
    {
        CHECK(config.llm.modelPath == "/tmp/test.gguf");
        CHECK(config.llm.contextSize == 4096);
        CHECK(config.llm.gpuLayers == 32);
        CHECK(config.llm.temperature == 0.5f);
        CHECK(config.llm.reviewIterations == 1);
        CHECK(config.llm.maxReformatAttempts == 1);
    }

    SECTION("Synthesis config")
    {
        CHECK(config.synthesis.backend == SynthesisBackend::Piper);
        CHECK(config.synthesis.command == std::vector<std::string> { "say", "-o", "{output}", "{markup}" });
        CHECK(config.synthesis.outputFormat == "wav");
        CHECK(config.synthesis.maxChunkChars == 1500);
        CHECK(config.synthesis.piperModelPath == "/tmp/voice.onnx");
        REQUIRE(config.synthesis.voices.contains("de-DE"));
        CHECK(config.synthesis.voices.at("de-DE").at("Female") == "Vicki");
    }

    SECTION("Mixer config")
    {
        CHECK(config.mixer.backgroundVolume == 0.2);
        CHECK(config.mixer.fadeSeconds == 5.0);
        CHECK(config.mixer.makeSample == false);
        CHECK(config.mixer.seed == std::optional<std::uint64_t> { 1234 });
        CHECK(config.mixer.extensions == std::vector<std::string> { ".ogg" });
        CHECK(config.mixer.ffmpegPath == "ffmpeg");
    }
}

TEST_CASE("loadConfigFromFile rejects invalid values", "[config]")
{
    auto dir = TempDir { "config" };
    auto const path = dir / "config.json";

    for (auto const* content: {
             "{ broken",
             "[1, 2]",
             R"({"synthesis": {"backend": "polly"}})",
             R"({"synthesis": {"command": []}})",
             R"({"synthesis": {"maxChunkChars": 0}})",
             R"({"synthesis": {"voices": {"en-US": "Joanna"}}})",
             R"({"llm": {"reviewIterations": -1}})",
             R"({"mixer": {"backgroundVolume": 1.5}})",
             R"({"mixer": {"seed": -3}})",
             R"({"mixer": {"timeoutSeconds": 0}})",
         })
    {
        writeFile(path, content);
        auto result = loadConfigFromFile(path.string());
        INFO(content);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("loadConfigFromFile reports a missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/mindcast/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("saveConfigToFile writes a file loadConfigFromFile reads back", "[config]")
{
    auto dir = TempDir { "config" };
    auto const path = dir / "nested" / "config.json";

    auto config = AppConfig {};
    config.llm.modelPath = "/models/writer.gguf";
    config.synthesis.backend = SynthesisBackend::Piper;
    config.synthesis.voices["en-GB"]["Male"] = "Brian";
    config.mixer.seed = 99;
    config.mixer.sampleDurationSeconds = 20.0;

    REQUIRE(saveConfigToFile(path.string(), config).has_value());
    REQUIRE(std::filesystem::exists(path));

    auto loaded = loadConfigFromFile(path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->llm.modelPath == "/models/writer.gguf");
    CHECK(loaded->llm.temperature == 0.7f);
    CHECK(loaded->synthesis.backend == SynthesisBackend::Piper);
    CHECK(loaded->synthesis.command == config.synthesis.command);
    CHECK(loaded->synthesis.voices == config.synthesis.voices);
    CHECK(loaded->mixer.seed == std::optional<std::uint64_t> { 99 });
    CHECK(loaded->mixer.sampleDurationSeconds == 20.0);
}

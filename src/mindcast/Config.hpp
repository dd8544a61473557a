// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speech/CommandSpeechService.hpp>
#include <speech/VoiceCatalog.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mindcast
{

/// @brief Speech synthesis backend.
enum class SynthesisBackend : std::uint8_t
{
    Command,
    Piper,
};

/// @brief Output and input directories.
struct PathsConfig
{
    std::string stateDir = "output/state";
    std::string audioDir = "output/audio";
    std::string jsonDir = "output/json";
    std::string soundscapeDir = "soundscapes";

    /// @brief Run log file; empty disables file logging.
    std::string logFile;
};

/// @brief LLM configuration section.
struct LlmConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1;
    float temperature = 0.7f;
    int maxReformatAttempts = 1;
    int reviewIterations = 3;
};

/// @brief Speech synthesis configuration section.
struct SynthesisConfig
{
    SynthesisBackend backend = SynthesisBackend::Command;

    /// @brief argv template of the command backend.
    std::vector<std::string> command = CommandSpeechConfig::defaultCommand();

    /// @brief Audio container requested from the backend. The piper backend always writes wav.
    std::string outputFormat = "mp3";

    int maxChunkChars = 2900;
    int timeoutSeconds = 120;

    /// @brief Path to the piper voice model (.onnx file).
    std::string piperModelPath;

    /// @brief Path to the espeak-ng-data directory (optional, defaults to built-in).
    std::string espeakDataPath;

    /// @brief Voice ids overriding the built-in table.
    VoiceCatalog::VoiceTable voices;
};

/// @brief Audio mixing configuration section.
struct MixerConfig
{
    std::string ffmpegPath = "ffmpeg";
    std::string ffprobePath = "ffprobe";
    double backgroundVolume = 0.3;
    double fadeSeconds = 3.0;
    bool makeSample = true;
    double sampleDurationSeconds = 30.0;
    int timeoutSeconds = 600;

    /// @brief Seed for offsets and soundscape selection; random when absent.
    std::optional<std::uint64_t> seed;

    std::vector<std::string> extensions { ".mp3", ".wav" };
};

/// @brief Top-level application configuration.
struct AppConfig
{
    PathsConfig paths;
    LlmConfig llm;
    SynthesisConfig synthesis;
    MixerConfig mixer;
};

[[nodiscard]] auto backendName(SynthesisBackend backend) -> std::string_view;

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path.
/// On Linux: $XDG_CONFIG_HOME/mindcast or ~/.config/mindcast
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mindcast

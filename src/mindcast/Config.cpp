// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mindcast
{

namespace
{

    auto parseBackend(std::string_view name) -> Result<SynthesisBackend>
    {
        if (name == "command")
            return SynthesisBackend::Command;
        if (name == "piper")
            return SynthesisBackend::Piper;
        return makeError(ErrorCode::ConfigError,
                         std::format("Unknown synthesis backend '{}' (expected command or piper)", name));
    }

    auto parseVoices(const nlohmann::json& voices) -> Result<VoiceCatalog::VoiceTable>
    {
        if (!voices.is_object())
            return makeError(ErrorCode::ConfigError, "synthesis.voices must be an object");

        auto table = VoiceCatalog::VoiceTable {};
        for (const auto& [language, types]: voices.items())
        {
            if (!types.is_object())
                return makeError(ErrorCode::ConfigError, std::format("synthesis.voices.{} must be an object", language));
            for (const auto& [type, voiceId]: types.items())
            {
                if (!voiceId.is_string())
                    return makeError(ErrorCode::ConfigError,
                                     std::format("synthesis.voices.{}.{} must be a string", language, type));
                table[language][type] = voiceId.get<std::string>();
            }
        }
        return table;
    }

} // namespace

auto backendName(SynthesisBackend backend) -> std::string_view
{
    switch (backend)
    {
        case SynthesisBackend::Command: return "command";
        case SynthesisBackend::Piper: return "piper";
    }
    return "command";
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mindcast";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mindcast";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content, ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));

    auto config = AppConfig {};

    // Paths section
    if (root.contains("paths"))
    {
        auto const& paths = root["paths"];
        config.paths.stateDir = json::getStringOr(paths, "stateDir", config.paths.stateDir);
        config.paths.audioDir = json::getStringOr(paths, "audioDir", config.paths.audioDir);
        config.paths.jsonDir = json::getStringOr(paths, "jsonDir", config.paths.jsonDir);
        config.paths.soundscapeDir = json::getStringOr(paths, "soundscapeDir", config.paths.soundscapeDir);
        config.paths.logFile = json::getStringOr(paths, "logFile", "");
    }

    // LLM section
    if (root.contains("llm"))
    {
        auto const& llm = root["llm"];
        config.llm.modelPath = json::getStringOr(llm, "modelPath", "");
        config.llm.contextSize = json::getIntOr(llm, "contextSize", 8192);
        config.llm.gpuLayers = json::getIntOr(llm, "gpuLayers", -1);
        config.llm.temperature = json::getFloatOr(llm, "temperature", 0.7f);
        config.llm.maxReformatAttempts = json::getIntOr(llm, "maxReformatAttempts", 1);
        config.llm.reviewIterations = json::getIntOr(llm, "reviewIterations", 3);
        if (config.llm.maxReformatAttempts < 0 || config.llm.reviewIterations < 0)
            return makeError(ErrorCode::ConfigError, "llm.maxReformatAttempts and llm.reviewIterations must not be negative");
    }

    // Synthesis section
    if (root.contains("synthesis"))
    {
        auto const& synthesis = root["synthesis"];
        auto backend = parseBackend(json::getStringOr(synthesis, "backend", "command"));
        if (!backend)
            return std::unexpected(backend.error());
        config.synthesis.backend = *backend;
        config.synthesis.command = json::getStringArrayOr(synthesis, "command", config.synthesis.command);
        if (config.synthesis.command.empty())
            return makeError(ErrorCode::ConfigError, "synthesis.command must not be empty");
        config.synthesis.outputFormat = json::getStringOr(synthesis, "outputFormat", "mp3");
        config.synthesis.maxChunkChars = json::getIntOr(synthesis, "maxChunkChars", 2900);
        config.synthesis.timeoutSeconds = json::getIntOr(synthesis, "timeoutSeconds", 120);
        config.synthesis.piperModelPath = json::getStringOr(synthesis, "piperModelPath", "");
        config.synthesis.espeakDataPath = json::getStringOr(synthesis, "espeakDataPath", "");
        if (config.synthesis.maxChunkChars <= 0 || config.synthesis.timeoutSeconds <= 0)
            return makeError(ErrorCode::ConfigError, "synthesis.maxChunkChars and synthesis.timeoutSeconds must be positive");

        if (synthesis.contains("voices"))
        {
            auto voices = parseVoices(synthesis["voices"]);
            if (!voices)
                return std::unexpected(voices.error());
            config.synthesis.voices = std::move(*voices);
        }
    }

    // Mixer section
    if (root.contains("mixer"))
    {
        auto const& mixer = root["mixer"];
        config.mixer.ffmpegPath = json::getStringOr(mixer, "ffmpegPath", "ffmpeg");
        config.mixer.ffprobePath = json::getStringOr(mixer, "ffprobePath", "ffprobe");
        config.mixer.backgroundVolume = json::getDoubleOr(mixer, "backgroundVolume", 0.3);
        config.mixer.fadeSeconds = json::getDoubleOr(mixer, "fadeSeconds", 3.0);
        config.mixer.makeSample = json::getBoolOr(mixer, "makeSample", true);
        config.mixer.sampleDurationSeconds = json::getDoubleOr(mixer, "sampleDurationSeconds", 30.0);
        config.mixer.timeoutSeconds = json::getIntOr(mixer, "timeoutSeconds", 600);
        config.mixer.extensions = json::getStringArrayOr(mixer, "extensions", config.mixer.extensions);

        if (mixer.contains("seed") && mixer["seed"].is_number_unsigned())
            config.mixer.seed = mixer["seed"].get<std::uint64_t>();
        else if (mixer.contains("seed") && !mixer["seed"].is_null())
            return makeError(ErrorCode::ConfigError, "mixer.seed must be a non-negative integer");

        if (config.mixer.backgroundVolume < 0.0 || config.mixer.backgroundVolume > 1.0)
            return makeError(ErrorCode::ConfigError,
                             std::format("mixer.backgroundVolume must be within [0, 1], got {}",
                                         config.mixer.backgroundVolume));
        if (config.mixer.timeoutSeconds <= 0)
            return makeError(ErrorCode::ConfigError, "mixer.timeoutSeconds must be positive");
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Paths section
    auto paths = nlohmann::json::object();
    paths["stateDir"] = config.paths.stateDir;
    paths["audioDir"] = config.paths.audioDir;
    paths["jsonDir"] = config.paths.jsonDir;
    paths["soundscapeDir"] = config.paths.soundscapeDir;
    if (!config.paths.logFile.empty())
        paths["logFile"] = config.paths.logFile;
    root["paths"] = std::move(paths);

    // LLM section
    auto llm = nlohmann::json::object();
    if (!config.llm.modelPath.empty())
        llm["modelPath"] = config.llm.modelPath;
    llm["contextSize"] = config.llm.contextSize;
    llm["gpuLayers"] = config.llm.gpuLayers;
    llm["temperature"] = config.llm.temperature;
    llm["maxReformatAttempts"] = config.llm.maxReformatAttempts;
    llm["reviewIterations"] = config.llm.reviewIterations;
    root["llm"] = std::move(llm);

    // Synthesis section
    auto synthesis = nlohmann::json::object();
    synthesis["backend"] = backendName(config.synthesis.backend);
    synthesis["command"] = config.synthesis.command;
    synthesis["outputFormat"] = config.synthesis.outputFormat;
    synthesis["maxChunkChars"] = config.synthesis.maxChunkChars;
    synthesis["timeoutSeconds"] = config.synthesis.timeoutSeconds;
    if (!config.synthesis.piperModelPath.empty())
        synthesis["piperModelPath"] = config.synthesis.piperModelPath;
    if (!config.synthesis.espeakDataPath.empty())
        synthesis["espeakDataPath"] = config.synthesis.espeakDataPath;
    if (!config.synthesis.voices.empty())
    {
        auto voices = nlohmann::json::object();
        for (const auto& [language, types]: config.synthesis.voices)
        {
            for (const auto& [type, voiceId]: types)
                voices[language][type] = voiceId;
        }
        synthesis["voices"] = std::move(voices);
    }
    root["synthesis"] = std::move(synthesis);

    // Mixer section
    auto mixer = nlohmann::json::object();
    mixer["ffmpegPath"] = config.mixer.ffmpegPath;
    mixer["ffprobePath"] = config.mixer.ffprobePath;
    mixer["backgroundVolume"] = config.mixer.backgroundVolume;
    mixer["fadeSeconds"] = config.mixer.fadeSeconds;
    mixer["makeSample"] = config.mixer.makeSample;
    mixer["sampleDurationSeconds"] = config.mixer.sampleDurationSeconds;
    mixer["timeoutSeconds"] = config.mixer.timeoutSeconds;
    if (config.mixer.seed)
        mixer["seed"] = *config.mixer.seed;
    mixer["extensions"] = config.mixer.extensions;
    root["mixer"] = std::move(mixer);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mindcast

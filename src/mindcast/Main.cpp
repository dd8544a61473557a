// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mindcast/App.hpp>
#include <mindcast/Config.hpp>

#include <CLI/CLI.hpp>

#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <string>

namespace
{

    constexpr auto ExitHalted = 1;
    constexpr auto ExitUsage = 2;

    template <typename E>
    auto applyEnum(const std::string& text, E& target) -> mindcast::VoidResult
    {
        if (text.empty())
            return {};
        auto parsed = mindcast::parseEnum<E>(text);
        if (!parsed)
            return std::unexpected(parsed.error());
        target = *parsed;
        return {};
    }

    auto applyStage(const std::string& text, std::optional<mindcast::StageId>& target) -> mindcast::VoidResult
    {
        if (text.empty())
            return {};
        auto parsed = mindcast::parseStage(text);
        if (!parsed)
            return std::unexpected(parsed.error());
        target = *parsed;
        return {};
    }

    void printPath(std::string_view label, const std::optional<std::string>& path)
    {
        if (path)
            std::println("{:<10} {}", label, *path);
    }

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mindcast - narrated meditation generator" };

    auto emotionalState = std::string {};
    auto style = std::string {};
    auto theme = std::string {};
    auto voice = std::string {};
    auto soundscape = std::string {};
    auto request = mindcast::MeditationRequest {};
    auto startStep = std::string {};
    auto endStep = std::string {};
    auto resumePath = std::string {};
    auto configPath = std::string {};
    auto listSteps = false;
    auto verbose = false;

    app.add_option("--emotional-state", emotionalState, "Current emotional state (e.g. anxious, tired)");
    app.add_option("--style", style, "Meditation style (e.g. Mindfulness, BodyScan)");
    app.add_option("--theme", theme, "Meditation theme (e.g. StressRelief, Sleep)");
    app.add_option("--duration", request.durationMinutes, "Duration in minutes")
        ->check(CLI::Range(1, mindcast::MaxDurationMinutes));
    app.add_option("--voice", voice, "Voice type (Male|Female|Neutral)");
    app.add_option("--language", request.languageCode, "Language code (e.g. en-US, es-ES)");
    app.add_option("--soundscape", soundscape, "Background soundscape (e.g. Nature, Rain)");
    app.add_option("--start-step", startStep, "First stage to run");
    app.add_option("--end-step", endStep, "Last stage to run");
    app.add_option("--resume", resumePath, "Snapshot file to resume from")->check(CLI::ExistingFile);
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("--list-steps", listSteps, "List the stages in execution order and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        auto const code = app.exit(e);
        return code == 0 ? 0 : ExitUsage;
    }

    if (listSteps)
    {
        for (auto const stage: mindcast::AllStages)
            std::println("{}", mindcast::stageName(stage));
        return 0;
    }

    if (verbose)
        mindcast::log::setLevel(mindcast::log::Level::Debug);

    auto plan = mindcast::RunPlan {};
    auto end = std::optional<mindcast::StageId> {};
    for (auto const& result: {
             applyEnum(emotionalState, request.emotionalState),
             applyEnum(style, request.style),
             applyEnum(theme, request.theme),
             applyEnum(voice, request.voice),
             applyEnum(soundscape, request.soundscape),
             applyStage(startStep, plan.start),
             applyStage(endStep, end),
             mindcast::validate(request),
         })
    {
        if (!result)
        {
            std::println(stderr, "Error: {}", result.error().message);
            return ExitUsage;
        }
    }
    if (end)
        plan.end = *end;
    if (!resumePath.empty())
        plan.resumeFrom = resumePath;

    // Load config
    auto configResult = configPath.empty() ? mindcast::loadConfig() : mindcast::loadConfigFromFile(configPath);
    if (!configResult)
    {
        mindcast::log::error("Failed to load config: {}", configResult.error().message);
        return ExitUsage;
    }

    auto application = mindcast::App(std::move(*configResult));
    auto initResult = application.initialize();
    if (!initResult)
    {
        mindcast::log::error("Initialization failed: {}", initResult.error().message);
        return ExitUsage;
    }

    auto result = application.run(request, plan);
    if (!result)
    {
        std::println(stderr, "Error: {}", result.error().message);
        return result.error().code == mindcast::ErrorCode::InvalidArgument
                       || result.error().code == mindcast::ErrorCode::ConfigError
                   ? ExitUsage
                   : ExitHalted;
    }

    auto const& state = *result;
    for (auto const& warning: state.warnings)
        mindcast::log::warning("{}", warning);

    if (state.failed())
    {
        std::println(stderr, "Error: {}", state.error);
        return ExitHalted;
    }

    std::println("Completed stage {}", state.currentStep);
    if (state.audioOutput)
    {
        printPath("Narration:", state.audioOutput->narrationFile);
        printPath("Mixed:", state.audioOutput->mixedFile);
        printPath("Sample:", state.audioOutput->sampleFile);
        printPath("Summary:", state.audioOutput->summaryFile);
    }
    return 0;
}

// SPDX-License-Identifier: Apache-2.0
#include "CommandSpeechService.hpp"

#include <core/Log.hpp>

#include <array>
#include <format>
#include <iterator>
#include <system_error>
#include <utility>

namespace mindcast
{

namespace
{

    void discardOutput(const std::filesystem::path& path)
    {
        auto ec = std::error_code {};
        std::filesystem::remove(path, ec);
    }

} // namespace

CommandSpeechService::CommandSpeechService(ProcessRunner& runner, CommandSpeechConfig config):
    _runner(runner), _config(std::move(config))
{
}

auto CommandSpeechService::expandCommand(const std::vector<std::string>& command, const SpeechRequest& request)
    -> std::vector<std::string>
{
    auto const output = request.outputPath.string();
    auto const substitutions = std::array<std::pair<std::string_view, std::string_view>, 5> { {
        { "{markup}", request.markup },
        { "{voice}", request.voiceId },
        { "{language}", request.languageCode },
        { "{format}", request.outputFormat },
        { "{output}", output },
    } };

    auto expanded = std::vector<std::string> {};
    expanded.reserve(command.size());
    for (const auto& arg: command)
    {
        // Single pass, so substituted values are never scanned for placeholders again
        auto result = std::string {};
        auto pos = std::size_t { 0 };
        while (pos < arg.size())
        {
            auto matched = false;
            if (arg[pos] == '{')
            {
                for (const auto& [placeholder, value]: substitutions)
                {
                    if (std::string_view(arg).substr(pos).starts_with(placeholder))
                    {
                        result += value;
                        pos += placeholder.size();
                        matched = true;
                        break;
                    }
                }
            }
            if (!matched)
                result += arg[pos++];
        }
        expanded.push_back(std::move(result));
    }
    return expanded;
}

auto CommandSpeechService::synthesize(const SpeechRequest& request) -> VoidResult
{
    if (_config.command.empty())
        return makeError(ErrorCode::ConfigError, "No synthesis command configured (synthesis.command)");

    auto argv = expandCommand(_config.command, request);
    auto spec = ProcessSpec {
        .command = argv.front(),
        .args = std::vector<std::string>(std::next(argv.begin()), argv.end()),
        .timeout = _config.timeout,
    };

    log::debug("Synthesizing {} bytes of markup with voice {} into {}",
               request.markup.size(),
               request.voiceId,
               request.outputPath.string());

    auto result = _runner.run(spec);
    if (!result)
    {
        discardOutput(request.outputPath);
        return makeError(ErrorCode::SynthesisError,
                         std::format("Speech command {} failed: {}", spec.command, result.error().message));
    }

    if (!result->succeeded())
    {
        discardOutput(request.outputPath);
        return makeError(ErrorCode::SynthesisError,
                         std::format("Speech command {} exited with {}: {}",
                                     spec.command,
                                     result->exitCode,
                                     log::preview(result->standardError)));
    }

    auto ec = std::error_code {};
    auto const size = std::filesystem::file_size(request.outputPath, ec);
    if (ec || size == 0)
    {
        discardOutput(request.outputPath);
        return makeError(ErrorCode::SynthesisError,
                         std::format("Speech command {} produced no audio at {}", spec.command, request.outputPath.string()));
    }

    log::debug("Wrote {} bytes of audio to {}", size, request.outputPath.string());
    return {};
}

} // namespace mindcast

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/ProcessRunner.hpp>
#include <speech/SpeechService.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace mindcast
{

/// @brief Configuration for a speech backend driven by an external command.
struct CommandSpeechConfig
{
    /// @brief argv template; `{markup}`, `{voice}`, `{language}`, `{format}` and `{output}` are substituted.
    std::vector<std::string> command = defaultCommand();

    std::chrono::seconds timeout { 120 };

    /// @brief The AWS Polly command line client.
    [[nodiscard]] static auto defaultCommand() -> std::vector<std::string>
    {
        return { "aws",
                 "polly",
                 "synthesize-speech",
                 "--text-type",
                 "ssml",
                 "--text",
                 "{markup}",
                 "--voice-id",
                 "{voice}",
                 "--language-code",
                 "{language}",
                 "--output-format",
                 "{format}",
                 "{output}" };
    }
};

/// @brief Synthesizes speech by running a configurable command line per request.
class CommandSpeechService: public SpeechService
{
  public:
    CommandSpeechService(ProcessRunner& runner, CommandSpeechConfig config);

    [[nodiscard]] auto synthesize(const SpeechRequest& request) -> VoidResult override;
    [[nodiscard]] auto name() const -> std::string_view override { return "command"; }

    /// @brief Substitutes the request into the argv template.
    [[nodiscard]] static auto expandCommand(const std::vector<std::string>& command, const SpeechRequest& request)
        -> std::vector<std::string>;

  private:
    ProcessRunner& _runner;
    CommandSpeechConfig _config;
};

} // namespace mindcast

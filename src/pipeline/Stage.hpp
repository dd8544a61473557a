// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/State.hpp>

#include <array>
#include <cstddef>
#include <format>
#include <string_view>

namespace mindcast
{

/// @brief The pipeline stages in execution order.
enum class StageId
{
    Script,
    ProsodyAnalysis,
    ProsodyProfile,
    MarkupGeneration,
    MarkupReview,
    SpeechSynthesis,
    AudioMixing,
};

constexpr auto StageCount = std::size_t { 7 };

constexpr auto AllStages = std::array<StageId, StageCount> {
    StageId::Script,           StageId::ProsodyAnalysis, StageId::ProsodyProfile,  StageId::MarkupGeneration,
    StageId::MarkupReview,     StageId::SpeechSynthesis, StageId::AudioMixing,
};

/// @brief Returns the stage's name as used in snapshot files and on the command line.
[[nodiscard]] constexpr auto stageName(StageId stage) -> std::string_view
{
    switch (stage)
    {
        case StageId::Script: return "script";
        case StageId::ProsodyAnalysis: return "prosody-analysis";
        case StageId::ProsodyProfile: return "prosody-profile";
        case StageId::MarkupGeneration: return "markup-generation";
        case StageId::MarkupReview: return "markup-review";
        case StageId::SpeechSynthesis: return "speech-synthesis";
        case StageId::AudioMixing: return "audio-mixing";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto stageIndex(StageId stage) -> std::size_t
{
    return static_cast<std::size_t>(stage);
}

/// @brief Parses a stage name.
/// @return The stage, or InvalidArgument for unknown names.
[[nodiscard]] inline auto parseStage(std::string_view name) -> Result<StageId>
{
    for (auto const stage: AllStages)
    {
        if (stageName(stage) == name)
            return stage;
    }
    return makeError(ErrorCode::InvalidArgument, std::format("Unknown stage '{}'", name));
}

/// @brief One named transformation of the pipeline state.
///
/// A stage reports failure by setting State::error on the returned record. It must not change
/// State::request. Exceptions escaping run() are converted into an error by the pipeline.
class Stage
{
  public:
    virtual ~Stage() = default;

    [[nodiscard]] virtual auto id() const -> StageId = 0;

    /// @brief Transforms the state.
    /// @param state The output of the previous stage.
    /// @return The updated state.
    [[nodiscard]] virtual auto run(State state) -> State = 0;
};

/// @brief Renders a stage failure into the State::error format `<stage>: <message>`.
[[nodiscard]] inline auto stageError(StageId stage, const Error& error) -> std::string
{
    return std::format("{}: {}", stageName(stage), error.message);
}

} // namespace mindcast

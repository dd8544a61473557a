// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/Request.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mindcast
{

/// @brief One typed section of a narration script.
struct ScriptSection
{
    std::string type;
    std::string content;

    auto operator==(const ScriptSection&) const -> bool = default;
};

/// @brief Narration text plus its ordered sections.
struct Script
{
    std::string content;
    std::vector<ScriptSection> sections;

    auto operator==(const Script&) const -> bool = default;
};

/// @brief Outcome of the markup review rounds.
struct MarkupReview
{
    int iterations = 0;
    std::vector<std::string> notes;

    auto operator==(const MarkupReview&) const -> bool = default;
};

/// @brief Audio status values recorded in AudioOutput::status.
namespace audio_status
{
    constexpr auto Generated = std::string_view { "generated" };
    constexpr auto Completed = std::string_view { "completed" };
} // namespace audio_status

/// @brief Files produced by synthesis and mixing.
struct AudioOutput
{
    std::string narrationFile;
    std::optional<std::string> mixedFile;
    std::optional<std::string> sampleFile;
    std::string status;
    std::optional<std::string> summaryFile;

    auto operator==(const AudioOutput&) const -> bool = default;
};

/// @brief The record threaded through all pipeline stages.
///
/// Fields other than `request` fill in progressively. Once `error` is non-empty the record is
/// frozen and no further stage runs on it.
struct State
{
    MeditationRequest request;
    std::optional<Script> script;
    std::optional<nlohmann::json> prosodyAnalysis;
    std::optional<nlohmann::json> prosodyProfile;
    std::optional<std::string> markupOutput;
    std::optional<MarkupReview> markupReview;
    std::optional<AudioOutput> audioOutput;

    /// @brief Recoverable problems, e.g. a fallback replacing malformed generated content.
    std::vector<std::string> warnings;

    std::string error;
    std::string currentStep;

    [[nodiscard]] auto failed() const noexcept -> bool { return !error.empty(); }

    /// @brief One-line description of which fields are filled, for log output.
    [[nodiscard]] auto summary() const -> std::string;

    auto operator==(const State&) const -> bool = default;
};

[[nodiscard]] auto toJson(const MeditationRequest& request) -> nlohmann::json;
[[nodiscard]] auto toJson(const State& state) -> nlohmann::json;

/// @brief Reads a request; every field is optional and defaults as in MeditationRequest.
/// @return The request, or InvalidArgument for unknown enumerators or mistyped fields.
[[nodiscard]] auto requestFromJson(const nlohmann::json& value) -> Result<MeditationRequest>;

/// @brief Reads a full state record as written by toJson().
/// @return The state, or DecodeError describing the first mismatch.
[[nodiscard]] auto stateFromJson(const nlohmann::json& value) -> Result<State>;

} // namespace mindcast

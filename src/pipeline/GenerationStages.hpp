// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <llm/Sampler.hpp>
#include <llm/TextGenerator.hpp>
#include <pipeline/Stage.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mindcast
{

/// @brief Settings shared by the stages that consult the text generator.
struct GenerationSettings
{
    SamplerConfig sampler;

    /// @brief Reformat requests issued after a malformed structured reply.
    int maxReformatAttempts = 1;

    /// @brief Upper bound on markup review rounds.
    int reviewIterations = 3;
};

/// @brief Writes the narration script and splits it into typed sections.
class ScriptStage: public Stage
{
  public:
    ScriptStage(TextGenerator& generator, GenerationSettings settings);

    [[nodiscard]] auto id() const -> StageId override { return StageId::Script; }
    [[nodiscard]] auto run(State state) -> State override;

  private:
    TextGenerator& _generator;
    GenerationSettings _settings;
};

/// @brief Produces the prosody analysis of the script.
class ProsodyAnalysisStage: public Stage
{
  public:
    ProsodyAnalysisStage(TextGenerator& generator, GenerationSettings settings);

    [[nodiscard]] auto id() const -> StageId override { return StageId::ProsodyAnalysis; }
    [[nodiscard]] auto run(State state) -> State override;

  private:
    TextGenerator& _generator;
    GenerationSettings _settings;
};

/// @brief Turns the analysis into concrete pitch, rate and pause settings.
class ProsodyProfileStage: public Stage
{
  public:
    ProsodyProfileStage(TextGenerator& generator, GenerationSettings settings);

    [[nodiscard]] auto id() const -> StageId override { return StageId::ProsodyProfile; }
    [[nodiscard]] auto run(State state) -> State override;

  private:
    TextGenerator& _generator;
    GenerationSettings _settings;
};

/// @brief Generates speech markup for the script.
class MarkupGenerationStage: public Stage
{
  public:
    MarkupGenerationStage(TextGenerator& generator, GenerationSettings settings);

    [[nodiscard]] auto id() const -> StageId override { return StageId::MarkupGeneration; }
    [[nodiscard]] auto run(State state) -> State override;

  private:
    TextGenerator& _generator;
    GenerationSettings _settings;
};

/// @brief Iteratively reviews and repairs the generated markup.
class MarkupReviewStage: public Stage
{
  public:
    MarkupReviewStage(TextGenerator& generator, GenerationSettings settings);

    [[nodiscard]] auto id() const -> StageId override { return StageId::MarkupReview; }
    [[nodiscard]] auto run(State state) -> State override;

  private:
    TextGenerator& _generator;
    GenerationSettings _settings;
};

/// @brief Maps a free-form section label (e.g. "BODY SCAN", "Intro") to a canonical type.
[[nodiscard]] auto normalizeSectionType(std::string_view label) -> std::string;

/// @brief Splits a script into sections using `[SECTION]` markers, else blank-line paragraphs.
[[nodiscard]] auto parseScriptSections(std::string_view script) -> std::vector<ScriptSection>;

/// @brief Analysis used when the generator's analysis is unusable.
[[nodiscard]] auto fallbackProsodyAnalysis(const Script& script) -> nlohmann::json;

/// @brief Profile used when the generator's profile is unusable.
[[nodiscard]] auto fallbackProsodyProfile() -> nlohmann::json;

} // namespace mindcast

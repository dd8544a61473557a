// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <llm/StructuredReply.hpp>
#include <pipeline/GenerationStages.hpp>
#include <pipeline/GenerationSupport.hpp>

#include <format>
#include <optional>

namespace mindcast
{

namespace
{

    constexpr auto ProsodySystemPrompt = std::string_view {
        "You are an expert in prosody for meditation narration and in speech synthesis markup "
        "(SSML). You recommend speaking rate, pitch, volume, pauses and emphasis that make a "
        "narration calm, natural and easy to follow. You always answer with JSON only."
    };

    constexpr auto AnalysisShape = std::string_view {
        R"({
  "overall_tone": "calming and soothing",
  "key_terms": ["breath", "relax"],
  "breathing_patterns": [{"type": "deep_breathing", "inhale": "4s", "exhale": "6s"}],
  "sections": [{"type": "introduction", "tone": "welcoming", "rate": "80%", "pitch": "-15%", "volume": "soft"}],
  "progression": {"start": {"rate": "85%"}, "middle": {"rate": "75%"}, "end": {"rate": "70%"}}
})"
    };

    constexpr auto ProfileShape = std::string_view {
        R"({
  "pitch": {"base_pitch": "-10%", "range": "+20%", "contour_pattern": "..."},
  "rate": {"base_rate": "80%", "variation": "...", "special_sections": {"breathing": "70%"}},
  "pauses": {"short_pause": "500ms", "medium_pause": "1s", "long_pause": "3s", "breath_pause": "4s"},
  "emphasis": {"intensity": "reduced", "key_terms": ["breath"]},
  "volume": "soft",
  "section_profiles": {"introduction": {"pitch": "-15%", "rate": "80%", "volume": "soft"}}
})"
    };

    auto renderSections(const Script& script) -> std::string
    {
        auto text = std::string {};
        for (const auto& section: script.sections)
            text += std::format("[{}]\n{}\n\n", section.type, section.content);
        return text;
    }

    auto analysisPrompt(const State& state) -> std::string
    {
        return std::format("Analyse the prosody needs of this meditation script.\n\n"
                           "Request:\n{}\n"
                           "SCRIPT:\n{}\n"
                           "Describe the overall tone, the key terms to emphasise, the breathing "
                           "patterns used and, for every section in order, its tone together with a "
                           "recommended rate, pitch and volume. Describe how the delivery should "
                           "progress from start to end.\n"
                           "Reply with only a JSON object of this layout:\n{}",
                           describeRequest(state.request),
                           renderSections(*state.script),
                           AnalysisShape);
    }

    auto profilePrompt(const State& state) -> std::string
    {
        return std::format("Create a prosody profile for synthesizing this meditation.\n\n"
                           "Request:\n{}\n"
                           "Prosody analysis:\n{}\n\n"
                           "Give concrete pitch, rate, pause, emphasis and volume settings as used by "
                           "speech synthesis markup, plus settings per section type. Slow down and "
                           "lower the pitch gradually towards the end.\n"
                           "Reply with only a JSON object of this layout:\n{}",
                           describeRequest(state.request),
                           state.prosodyAnalysis->dump(2),
                           ProfileShape);
    }

    auto sectionDelivery(std::string_view type) -> nlohmann::json
    {
        if (type == "introduction")
            return { { "tone", "welcoming and grounding" }, { "rate", "80%" }, { "pitch", "-15%" }, { "volume", "soft" } };
        if (type == "closing")
            return { { "tone", "gentle transition to awareness" },
                     { "rate", "75%" },
                     { "pitch", "-15%" },
                     { "volume", "soft" } };
        return { { "tone", "supportive and gentle" }, { "rate", "70%" }, { "pitch", "-18%" }, { "volume", "x-soft" } };
    }

    auto progression() -> nlohmann::json
    {
        return {
            { "start", { { "rate", "85%" }, { "pitch", "-10%" }, { "volume", "medium" } } },
            { "middle", { { "rate", "75%" }, { "pitch", "-15%" }, { "volume", "soft" } } },
            { "end", { { "rate", "70%" }, { "pitch", "-20%" }, { "volume", "x-soft" } } },
        };
    }

    /// Shared flow: request structured JSON, fall back with a warning on malformed replies.
    auto requestOrFallback(TextGenerator& generator,
                           const GenerationSettings& settings,
                           StageId stage,
                           std::string prompt,
                           StructuredRequest request,
                           nlohmann::json fallback,
                           State& state) -> std::optional<nlohmann::json>
    {
        auto session = ChatSession(std::string(ProsodySystemPrompt));
        session.addUserMessage(std::move(prompt));

        request.maxReformatAttempts = settings.maxReformatAttempts;
        request.sampler = settings.sampler;

        auto reply = requestStructured(generator, session, request);
        if (reply)
            return std::move(*reply);

        if (reply.error().code != ErrorCode::MalformedResponse)
        {
            state.error = stageError(stage, reply.error());
            return std::nullopt;
        }

        log::warning("Using the default {}: {}", request.purpose, reply.error().message);
        state.warnings.push_back(
            std::format("{}: used the default {} ({})", stageName(stage), request.purpose, reply.error().message));
        return fallback;
    }

} // namespace

auto fallbackProsodyAnalysis(const Script& script) -> nlohmann::json
{
    auto sections = nlohmann::json::array();
    for (const auto& section: script.sections)
    {
        auto delivery = sectionDelivery(section.type);
        delivery["type"] = section.type;
        sections.push_back(std::move(delivery));
    }

    return {
        { "overall_tone", "calming and soothing" },
        { "key_terms", { "breath", "relax", "present", "awareness", "gentle" } },
        { "breathing_patterns", { { { "type", "deep_breathing" }, { "inhale", "4s" }, { "exhale", "6s" } } } },
        { "sections", std::move(sections) },
        { "progression", progression() },
    };
}

auto fallbackProsodyProfile() -> nlohmann::json
{
    return {
        { "pitch",
          {
              { "base_pitch", "-10%" },
              { "range", "+20%" },
              { "contour_pattern", "gradual downward drift with gentle rises" },
          } },
        { "rate",
          {
              { "base_rate", "80%" },
              { "variation", "slowing gradually towards the end" },
              { "special_sections",
                {
                    { "breathing", "70%" },
                    { "introduction", "80%" },
                    { "closing", "75%" },
                    { "grounding", "65%" },
                    { "body_scan", "60%" },
                    { "affirmations", "75%" },
                    { "visualization", "70%" },
                } },
          } },
        { "pauses",
          {
              { "short_pause", "500ms" },
              { "medium_pause", "1s" },
              { "long_pause", "3s" },
              { "breath_pause", "4s" },
              { "sentence_pattern", "medium pause after each sentence" },
              { "breathing_patterns",
                {
                    { "4-7-8", { { "inhale", "4s" }, { "hold", "7s" }, { "exhale", "8s" } } },
                    { "box_breathing", { { "inhale", "4s" }, { "hold_in", "4s" }, { "exhale", "4s" }, { "hold_out", "4s" } } },
                    { "deep_breathing", { { "inhale", "4s" }, { "exhale", "6s" } } },
                } },
          } },
        { "emphasis", { { "intensity", "reduced" }, { "key_terms", { "breath", "relax", "calm" } } } },
        { "volume", "soft" },
        { "section_profiles",
          {
              { "introduction", { { "pitch", "-15%" }, { "rate", "80%" }, { "volume", "soft" } } },
              { "grounding", { { "pitch", "-20%" }, { "rate", "65%" }, { "volume", "x-soft" } } },
              { "body_scan", { { "pitch", "-18%" }, { "rate", "60%" }, { "volume", "x-soft" } } },
              { "breathing", { { "pitch", "-15%" }, { "rate", "70%" }, { "volume", "soft" } } },
              { "visualization", { { "pitch", "-12%" }, { "rate", "75%" }, { "volume", "soft" } } },
              { "affirmations", { { "pitch", "-10%" }, { "rate", "75%" }, { "volume", "medium" } } },
              { "closing", { { "pitch", "-15%" }, { "rate", "75%" }, { "volume", "soft" } } },
          } },
        { "progression", progression() },
    };
}

ProsodyAnalysisStage::ProsodyAnalysisStage(TextGenerator& generator, GenerationSettings settings):
    _generator(generator), _settings(std::move(settings))
{
}

auto ProsodyAnalysisStage::run(State state) -> State
{
    if (!state.script)
    {
        state.error = stageError(id(), Error { ErrorCode::InvalidArgument, "no script to analyse" });
        return state;
    }

    log::info("Analysing prosody of {} script sections", state.script->sections.size());

    auto analysis = requestOrFallback(_generator,
                                      _settings,
                                      id(),
                                      analysisPrompt(state),
                                      StructuredRequest {
                                          .purpose = "prosody analysis",
                                          .validate = requireObject({ "overall_tone" }, {}, { "sections" }),
                                          .expectedShape = std::string(AnalysisShape),
                                      },
                                      fallbackProsodyAnalysis(*state.script),
                                      state);
    if (analysis)
        state.prosodyAnalysis = std::move(*analysis);
    return state;
}

ProsodyProfileStage::ProsodyProfileStage(TextGenerator& generator, GenerationSettings settings):
    _generator(generator), _settings(std::move(settings))
{
}

auto ProsodyProfileStage::run(State state) -> State
{
    if (!state.prosodyAnalysis)
    {
        state.error = stageError(id(), Error { ErrorCode::InvalidArgument, "no prosody analysis to build on" });
        return state;
    }

    log::info("Creating prosody profile");

    auto profile = requestOrFallback(_generator,
                                     _settings,
                                     id(),
                                     profilePrompt(state),
                                     StructuredRequest {
                                         .purpose = "prosody profile",
                                         .validate = requireObject({}, { "pitch", "rate", "pauses" }, {}),
                                         .expectedShape = std::string(ProfileShape),
                                     },
                                     fallbackProsodyProfile(),
                                     state);
    if (profile)
        state.prosodyProfile = std::move(*profile);
    return state;
}

} // namespace mindcast

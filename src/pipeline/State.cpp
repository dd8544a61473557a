// SPDX-License-Identifier: Apache-2.0
#include "State.hpp"

#include <format>

namespace mindcast
{

namespace
{

    auto optionalToJson(const std::optional<std::string>& value) -> nlohmann::json
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

    auto optionalString(const nlohmann::json& obj, const char* key) -> std::optional<std::string>
    {
        if (!obj.contains(key) || obj[key].is_null())
            return std::nullopt;
        return obj[key].get<std::string>();
    }

    auto optionalObject(const nlohmann::json& obj, const char* key) -> std::optional<nlohmann::json>
    {
        if (!obj.contains(key) || obj[key].is_null())
            return std::nullopt;
        return obj[key];
    }

    template <typename E>
    auto readEnum(const nlohmann::json& obj, const char* key, E defaultValue) -> Result<E>
    {
        if (!obj.contains(key))
            return defaultValue;
        if (!obj[key].is_string())
            return makeError(ErrorCode::InvalidArgument, std::format("Request field '{}' must be a string", key));
        return parseEnum<E>(obj[key].get<std::string>());
    }

    auto scriptFromJson(const nlohmann::json& value) -> Script
    {
        auto script = Script { .content = value.at("content").get<std::string>(), .sections = {} };
        for (const auto& section: value.at("sections"))
        {
            script.sections.push_back(ScriptSection {
                .type = section.at("type").get<std::string>(),
                .content = section.at("content").get<std::string>(),
            });
        }
        return script;
    }

    auto audioOutputFromJson(const nlohmann::json& value) -> AudioOutput
    {
        return AudioOutput {
            .narrationFile = value.at("narration_file").get<std::string>(),
            .mixedFile = optionalString(value, "mixed_file"),
            .sampleFile = optionalString(value, "sample_file"),
            .status = value.at("status").get<std::string>(),
            .summaryFile = optionalString(value, "summary_file"),
        };
    }

} // namespace

auto State::summary() const -> std::string
{
    auto present = [](bool has) { return has ? "yes" : "no"; };
    return std::format("step={} script={} analysis={} profile={} markup={} audio={} warnings={} error={}",
                       currentStep.empty() ? "-" : currentStep,
                       script ? std::format("{} sections", script->sections.size()) : std::string("no"),
                       present(prosodyAnalysis.has_value()),
                       present(prosodyProfile.has_value()),
                       markupOutput ? std::format("{} bytes", markupOutput->size()) : std::string("no"),
                       audioOutput ? audioOutput->status : std::string("no"),
                       warnings.size(),
                       error.empty() ? "none" : error);
}

auto toJson(const MeditationRequest& request) -> nlohmann::json
{
    return {
        { "emotional_state", enumName(request.emotionalState) },
        { "meditation_style", enumName(request.style) },
        { "meditation_theme", enumName(request.theme) },
        { "duration_minutes", request.durationMinutes },
        { "voice_type", enumName(request.voice) },
        { "language_code", request.languageCode },
        { "soundscape", enumName(request.soundscape) },
    };
}

auto toJson(const State& state) -> nlohmann::json
{
    auto j = nlohmann::json::object();
    j["request"] = toJson(state.request);

    if (state.script)
    {
        auto sections = nlohmann::json::array();
        for (const auto& section: state.script->sections)
            sections.push_back({ { "type", section.type }, { "content", section.content } });
        j["script"] = { { "content", state.script->content }, { "sections", std::move(sections) } };
    }
    else
        j["script"] = nullptr;

    j["prosody_analysis"] = state.prosodyAnalysis.value_or(nullptr);
    j["prosody_profile"] = state.prosodyProfile.value_or(nullptr);
    j["markup_output"] = optionalToJson(state.markupOutput);

    if (state.markupReview)
        j["markup_review"] = { { "iterations", state.markupReview->iterations },
                               { "notes", state.markupReview->notes } };
    else
        j["markup_review"] = nullptr;

    if (state.audioOutput)
    {
        j["audio_output"] = {
            { "narration_file", state.audioOutput->narrationFile },
            { "mixed_file", optionalToJson(state.audioOutput->mixedFile) },
            { "sample_file", optionalToJson(state.audioOutput->sampleFile) },
            { "status", state.audioOutput->status },
            { "summary_file", optionalToJson(state.audioOutput->summaryFile) },
        };
    }
    else
        j["audio_output"] = nullptr;

    j["warnings"] = state.warnings;
    j["error"] = state.error;
    j["current_step"] = state.currentStep;
    return j;
}

auto requestFromJson(const nlohmann::json& value) -> Result<MeditationRequest>
{
    if (!value.is_object())
        return makeError(ErrorCode::InvalidArgument, "Request must be a JSON object");

    auto const defaults = MeditationRequest {};
    auto request = MeditationRequest {};

    auto emotionalState = readEnum(value, "emotional_state", defaults.emotionalState);
    if (!emotionalState)
        return std::unexpected(emotionalState.error());
    request.emotionalState = *emotionalState;

    auto style = readEnum(value, "meditation_style", defaults.style);
    if (!style)
        return std::unexpected(style.error());
    request.style = *style;

    auto theme = readEnum(value, "meditation_theme", defaults.theme);
    if (!theme)
        return std::unexpected(theme.error());
    request.theme = *theme;

    auto voice = readEnum(value, "voice_type", defaults.voice);
    if (!voice)
        return std::unexpected(voice.error());
    request.voice = *voice;

    auto soundscape = readEnum(value, "soundscape", defaults.soundscape);
    if (!soundscape)
        return std::unexpected(soundscape.error());
    request.soundscape = *soundscape;

    if (value.contains("duration_minutes"))
    {
        if (!value["duration_minutes"].is_number_integer())
            return makeError(ErrorCode::InvalidArgument, "Request field 'duration_minutes' must be an integer");
        request.durationMinutes = value["duration_minutes"].get<int>();
    }

    if (value.contains("language_code"))
    {
        if (!value["language_code"].is_string())
            return makeError(ErrorCode::InvalidArgument, "Request field 'language_code' must be a string");
        request.languageCode = value["language_code"].get<std::string>();
    }

    if (auto valid = validate(request); !valid)
        return std::unexpected(valid.error());
    return request;
}

auto stateFromJson(const nlohmann::json& value) -> Result<State>
{
    if (!value.is_object())
        return makeError(ErrorCode::DecodeError, "State must be a JSON object");
    if (!value.contains("request"))
        return makeError(ErrorCode::DecodeError, "State has no request");

    auto request = requestFromJson(value["request"]);
    if (!request)
        return makeError(ErrorCode::DecodeError, std::format("Invalid request: {}", request.error().message));

    auto state = State { .request = std::move(*request) };
    try
    {
        if (value.contains("script") && !value["script"].is_null())
            state.script = scriptFromJson(value["script"]);

        state.prosodyAnalysis = optionalObject(value, "prosody_analysis");
        state.prosodyProfile = optionalObject(value, "prosody_profile");
        state.markupOutput = optionalString(value, "markup_output");

        if (value.contains("markup_review") && !value["markup_review"].is_null())
        {
            const auto& review = value["markup_review"];
            state.markupReview = MarkupReview {
                .iterations = review.at("iterations").get<int>(),
                .notes = review.at("notes").get<std::vector<std::string>>(),
            };
        }

        if (value.contains("audio_output") && !value["audio_output"].is_null())
            state.audioOutput = audioOutputFromJson(value["audio_output"]);

        if (value.contains("warnings"))
            state.warnings = value["warnings"].get<std::vector<std::string>>();

        state.error = optionalString(value, "error").value_or("");
        state.currentStep = optionalString(value, "current_step").value_or("");
    }
    catch (const nlohmann::json::exception& e)
    {
        return makeError(ErrorCode::DecodeError, std::format("State does not match the expected layout: {}", e.what()));
    }
    return state;
}

} // namespace mindcast

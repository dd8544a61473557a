// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <llm/StructuredReply.hpp>
#include <pipeline/GenerationStages.hpp>
#include <pipeline/GenerationSupport.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace mindcast
{

namespace
{

    constexpr auto WordsPerMinute = 125;
    constexpr auto MaxMarkerLength = std::size_t { 40 };

    constexpr auto ScriptSystemPrompt = std::string_view {
        "You are an experienced writer of guided meditation scripts with a background in mindfulness "
        "and therapeutic communication.\n"
        "A script consists of a welcoming introduction, a grounding section, breathing guidance, the "
        "main practice of the requested style and a gentle closing. Use clear, inclusive, "
        "non-judgemental language paced for the requested duration.\n"
        "Mark every section with a label in square brackets on its own line, for example "
        "[INTRODUCTION], [GROUNDING], [BREATHING], [BODY_SCAN], [VISUALIZATION], [AFFIRMATIONS], "
        "[CLOSING]."
    };

    constexpr auto SectionShape = std::string_view {
        R"([{"type": "introduction", "content": "full text of the section"}, ...])"
    };

    auto scriptPrompt(const MeditationRequest& request) -> std::string
    {
        return std::format("Write a {}-minute {} meditation about {} for someone who feels {}.\n\n"
                           "Request:\n{}\n"
                           "Write in the language {}. Aim for about {} words and leave room for "
                           "natural pauses. The text will be narrated by a speech synthesizer, so "
                           "keep a natural speaking rhythm.",
                           request.durationMinutes,
                           enumName(request.style),
                           enumName(request.theme),
                           enumName(request.emotionalState),
                           describeRequest(request),
                           request.languageCode,
                           request.durationMinutes * WordsPerMinute);
    }

    auto sectionPrompt(std::string_view script) -> std::string
    {
        return std::format("Split this meditation script into its sections.\n\n"
                           "SCRIPT:\n{}\n\n"
                           "Reply with only a JSON array. Each element has a \"type\" (introduction, "
                           "grounding, breathing, body_scan, visualization, affirmations or closing) and "
                           "the section's full \"content\", in script order:\n{}",
                           script,
                           SectionShape);
    }

    auto validateSections(const nlohmann::json& value) -> VoidResult
    {
        if (!value.is_array() || value.empty())
            return makeError(ErrorCode::MalformedResponse, "Expected a non-empty JSON array of sections");
        for (const auto& section: value)
        {
            if (!section.is_object() || !section.contains("type") || !section["type"].is_string()
                || !section.contains("content") || !section["content"].is_string())
                return makeError(ErrorCode::MalformedResponse, "Every section needs string members 'type' and 'content'");
        }
        return {};
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto lower = std::string(text);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    auto containsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) -> bool
    {
        return std::ranges::any_of(needles, [haystack](auto needle) { return haystack.contains(needle); });
    }

    auto isMarkerLabel(std::string_view label) -> bool
    {
        return !label.empty() && label.size() <= MaxMarkerLength
               && std::ranges::all_of(label, [](unsigned char c) {
                      return std::isalpha(c) || c == '_' || c == ' ' || c == '-';
                  });
    }

    /// Guesses a paragraph's type from its position and wording.
    auto classifyParagraph(std::string_view paragraph, std::size_t index, std::size_t count) -> std::string
    {
        auto const lower = toLower(paragraph);
        if (containsAny(lower, { "breathe", "inhale", "exhale", "respira", "inhala", "exhala" }))
            return "breathing";
        if (containsAny(lower, { "body", "scan", "muscles", "cuerpo", "músculos" }))
            return "body_scan";
        if (containsAny(lower, { "imagine", "visualize", "visualiza", "imagina" }))
            return "visualization";
        if (index == 0)
            return "introduction";
        if (index + 1 == count)
            return "closing";
        return "body";
    }

    auto splitParagraphs(std::string_view script) -> std::vector<std::string_view>
    {
        auto paragraphs = std::vector<std::string_view> {};
        auto pos = std::size_t { 0 };
        while (pos <= script.size())
        {
            auto const next = script.find("\n\n", pos);
            auto const paragraph = trimmed(script.substr(pos, next == std::string_view::npos ? next : next - pos));
            if (!paragraph.empty())
                paragraphs.push_back(paragraph);
            if (next == std::string_view::npos)
                break;
            pos = next + 2;
        }
        return paragraphs;
    }

} // namespace

auto normalizeSectionType(std::string_view label) -> std::string
{
    auto const lower = toLower(trimmed(label));
    if (lower.contains("intro"))
        return "introduction";
    if (lower.contains("breath"))
        return "breathing";
    if (lower.contains("body") && lower.contains("scan"))
        return "body_scan";
    if (lower.contains("visual"))
        return "visualization";
    if (lower.contains("affirm"))
        return "affirmations";
    if (lower.contains("clos"))
        return "closing";
    if (lower.contains("ground"))
        return "grounding";

    auto normalized = lower;
    std::ranges::replace(normalized, ' ', '_');
    std::ranges::replace(normalized, '-', '_');
    return normalized.empty() ? std::string("body") : normalized;
}

auto parseScriptSections(std::string_view script) -> std::vector<ScriptSection>
{
    struct Marker
    {
        std::size_t begin;
        std::size_t end;
        std::string_view label;
    };

    auto markers = std::vector<Marker> {};
    for (auto pos = script.find('['); pos != std::string_view::npos; pos = script.find('[', pos + 1))
    {
        auto const close = script.find(']', pos + 1);
        if (close == std::string_view::npos)
            break;
        auto const label = script.substr(pos + 1, close - pos - 1);
        if (isMarkerLabel(label))
            markers.push_back(Marker { .begin = pos, .end = close + 1, .label = label });
    }

    auto sections = std::vector<ScriptSection> {};

    if (!markers.empty())
    {
        if (auto const preamble = trimmed(script.substr(0, markers.front().begin)); !preamble.empty())
            sections.push_back(ScriptSection { .type = "introduction", .content = std::string(preamble) });

        for (auto i = std::size_t { 0 }; i < markers.size(); ++i)
        {
            auto const contentEnd = i + 1 < markers.size() ? markers[i + 1].begin : script.size();
            auto const content = trimmed(script.substr(markers[i].end, contentEnd - markers[i].end));
            if (!content.empty())
                sections.push_back(
                    ScriptSection { .type = normalizeSectionType(markers[i].label), .content = std::string(content) });
        }
        return sections;
    }

    auto const paragraphs = splitParagraphs(script);
    for (auto i = std::size_t { 0 }; i < paragraphs.size(); ++i)
    {
        sections.push_back(ScriptSection {
            .type = classifyParagraph(paragraphs[i], i, paragraphs.size()),
            .content = std::string(paragraphs[i]),
        });
    }
    return sections;
}

ScriptStage::ScriptStage(TextGenerator& generator, GenerationSettings settings):
    _generator(generator), _settings(std::move(settings))
{
}

auto ScriptStage::run(State state) -> State
{
    log::info("Generating a {} minute {} script on {}",
              state.request.durationMinutes,
              enumName(state.request.style),
              enumName(state.request.theme));

    auto session = ChatSession(std::string(ScriptSystemPrompt));
    session.addUserMessage(scriptPrompt(state.request));

    auto reply = generateText(_generator, session, _settings.sampler, "script");
    if (!reply)
    {
        state.error = stageError(id(), reply.error());
        return state;
    }

    auto script = Script { .content = std::string(trimmed(*reply)), .sections = {} };
    if (script.content.empty())
    {
        state.error = stageError(id(), Error { ErrorCode::MalformedResponse, "the generator returned an empty script" });
        return state;
    }
    log::info("Generated script with {} characters", script.content.size());

    auto analysis = ChatSession();
    analysis.addUserMessage(sectionPrompt(script.content));
    auto sections = requestStructured(_generator,
                                      analysis,
                                      StructuredRequest {
                                          .purpose = "script sections",
                                          .validate = validateSections,
                                          .expectedShape = std::string(SectionShape),
                                          .maxReformatAttempts = _settings.maxReformatAttempts,
                                          .sampler = _settings.sampler,
                                      });

    if (sections)
    {
        for (const auto& section: *sections)
        {
            script.sections.push_back(ScriptSection {
                .type = normalizeSectionType(section["type"].get<std::string>()),
                .content = section["content"].get<std::string>(),
            });
        }
    }
    else if (sections.error().code == ErrorCode::MalformedResponse)
    {
        log::warning("Section analysis unusable, splitting the script locally: {}", sections.error().message);
        state.warnings.push_back(std::format("{}: section analysis unusable, used section markers ({})",
                                             stageName(id()),
                                             sections.error().message));
        script.sections = parseScriptSections(script.content);
    }
    else
    {
        state.error = stageError(id(), sections.error());
        return state;
    }

    if (script.sections.empty())
        script.sections.push_back(ScriptSection { .type = "body", .content = script.content });

    log::info("Script has {} sections", script.sections.size());
    state.script = std::move(script);
    return state;
}

} // namespace mindcast

// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <markup/Markup.hpp>
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

    constexpr auto NoteLength = std::size_t { 200 };

    constexpr auto MarkupSystemPrompt = std::string_view {
        "You write speech synthesis markup (SSML) for meditation narration.\n"
        "Use only <speak>, <p>, <s>, <break time=\"...\"/>, <prosody rate=\"...\" pitch=\"...\" "
        "volume=\"...\"> and <emphasis>. Wrap every paragraph in <p>. Put pauses of 3 to 6 seconds "
        "after breathing instructions. Slow the rate and lower the pitch gradually towards the end. "
        "Escape &, < and > in text. The result must be well-formed XML."
    };

    constexpr auto ReviewSystemPrompt = std::string_view {
        "You review speech synthesis markup (SSML) for meditation narration. Technical correctness "
        "comes first: balanced tags, correct nesting and valid attribute values. Then compatibility "
        "with common neural voices. Then the listening experience: pacing, pauses and prosody."
    };

    constexpr auto NoImprovementPhrases = std::array<std::string_view, 3> {
        "no improvements are needed",
        "no improvements needed",
        "markup looks good",
    };

    auto generationPrompt(const State& state) -> std::string
    {
        auto sections = std::string {};
        for (const auto& section: state.script->sections)
            sections += std::format("[{}]\n{}\n\n", section.type, section.content);

        return std::format("Generate the markup for this meditation.\n\n"
                           "Request:\n{}\n"
                           "SCRIPT:\n{}"
                           "Prosody profile:\n{}\n\n"
                           "Apply the profile's settings per section type. Return only the complete "
                           "markup inside <speak> tags.",
                           describeRequest(state.request),
                           sections,
                           state.prosodyProfile->dump(2));
    }

    auto reviewPrompt(std::string_view markup) -> std::string
    {
        return std::format("Review and fix the following meditation markup:\n\n"
                           "```xml\n{}\n```\n\n"
                           "If you find problems, explain them briefly and then give the complete "
                           "corrected markup inside <speak> tags. If the markup is correct and well "
                           "paced, answer that no improvements are needed.",
                           markup);
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto lower = std::string(text);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    auto declaresNoImprovements(std::string_view reply) -> bool
    {
        auto const lower = toLower(reply);
        return std::ranges::any_of(NoImprovementPhrases, [&](auto phrase) { return lower.contains(phrase); });
    }

    /// The explanation that precedes the revised markup in a review reply.
    auto reviewNote(std::string_view reply) -> std::string
    {
        auto const end = std::min(reply.find("```"), reply.find("<speak"));
        auto const note = trimmed(reply.substr(0, end));
        return note.empty() ? std::string("revised markup") : log::preview(note, NoteLength);
    }

} // namespace

MarkupGenerationStage::MarkupGenerationStage(TextGenerator& generator, GenerationSettings settings):
    _generator(generator), _settings(std::move(settings))
{
}

auto MarkupGenerationStage::run(State state) -> State
{
    if (!state.script || !state.prosodyProfile)
    {
        state.error = stageError(id(), Error { ErrorCode::InvalidArgument, "script and prosody profile are required" });
        return state;
    }

    log::info("Generating speech markup");

    auto session = ChatSession(std::string(MarkupSystemPrompt));
    session.addUserMessage(generationPrompt(state));

    auto reply = generateText(_generator, session, _settings.sampler, "markup");
    if (!reply)
    {
        state.error = stageError(id(), reply.error());
        return state;
    }

    auto markup = markup::extractSpeak(*reply);
    if (!markup)
    {
        log::warning("Reply contains no <speak> element, wrapping it");
        state.warnings.push_back(std::format("{}: reply had no <speak> element and was wrapped", stageName(id())));
        markup = markup::ensureSpeakRoot(trimmed(*reply));
    }

    if (!markup::isSpeakDocument(*markup))
        log::warning("Generated markup is not well-formed, leaving repairs to the review");

    log::info("Generated {} bytes of markup", markup->size());
    state.markupOutput = std::move(*markup);
    state.markupReview.reset();
    return state;
}

MarkupReviewStage::MarkupReviewStage(TextGenerator& generator, GenerationSettings settings):
    _generator(generator), _settings(std::move(settings))
{
}

auto MarkupReviewStage::run(State state) -> State
{
    if (!state.markupOutput)
    {
        state.error = stageError(id(), Error { ErrorCode::InvalidArgument, "no markup to review" });
        return state;
    }

    auto markup = *state.markupOutput;
    auto review = MarkupReview {};

    while (review.iterations < _settings.reviewIterations)
    {
        ++review.iterations;
        log::info("Markup review round {}", review.iterations);

        auto session = ChatSession(std::string(ReviewSystemPrompt));
        session.addUserMessage(reviewPrompt(markup));

        auto reply = generateText(_generator, session, _settings.sampler, "markup review");
        if (!reply)
        {
            state.error = stageError(id(), reply.error());
            return state;
        }

        if (declaresNoImprovements(*reply))
        {
            review.notes.push_back(std::format("Round {}: no issues found", review.iterations));
            break;
        }

        auto revised = markup::extractSpeak(*reply);
        if (!revised)
        {
            review.notes.push_back(std::format("Round {}: reply contained no markup", review.iterations));
            continue;
        }

        if (auto document = markup::parse(*revised); !document || document->root.name != "speak")
        {
            auto const reason = document ? std::string("root is not <speak>") : document.error().message;
            log::warning("Rejecting revision from round {}: {}", review.iterations, reason);
            review.notes.push_back(std::format("Round {}: revision rejected ({})", review.iterations, reason));
            continue;
        }

        review.notes.push_back(std::format("Round {}: {}", review.iterations, reviewNote(*reply)));
        markup = std::move(*revised);
    }

    if (!markup::isSpeakDocument(markup))
    {
        log::warning("Markup is still not well-formed after review");
        state.warnings.push_back(std::format("{}: markup is not well-formed after review", stageName(id())));
    }

    log::info("Markup review finished after {} round(s)", review.iterations);
    state.markupOutput = std::move(markup);
    state.markupReview = std::move(review);
    return state;
}

} // namespace mindcast

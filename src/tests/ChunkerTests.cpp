// SPDX-License-Identifier: Apache-2.0
#include <markup/Chunker.hpp>
#include <markup/Markup.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <format>
#include <string>

using namespace mindcast;
using namespace mindcast::markup;

namespace
{

    /// A sentence of exactly 75 bytes.
    auto sentence(int index) -> std::string
    {
        auto text = std::format("Sentence {:03} lets the breath settle slowly into the body", index);
        text.resize(74, '.');
        text += '.';
        return text;
    }

    auto paragraph(int index, int sentences) -> std::string
    {
        auto text = std::string { "<p>" };
        for (auto i = 0; i < sentences; ++i)
        {
            if (i > 0)
                text += ' ';
            text += sentence(index * 100 + i);
        }
        text += "</p>";
        return text;
    }

} // namespace

TEST_CASE("splitMarkup passes small documents through", "[chunker]")
{
    auto const markup = std::string { "<speak><p>Breathe in. Breathe out.</p></speak>" };

    auto plan = splitMarkup(markup, ChunkingOptions {});
    REQUIRE(plan.has_value());
    CHECK(plan->strategy == SplitStrategy::None);
    REQUIRE(plan->fragments.size() == 1);
    CHECK(plan->fragments[0] == markup);
}

TEST_CASE("splitMarkup packs paragraphs into well-formed fragments", "[chunker]")
{
    auto markup = std::string { R"(<speak><prosody rate="85%">)" };
    for (auto i = 0; i < 12; ++i)
        markup += paragraph(i, 10);
    markup += "</prosody></speak>";
    REQUIRE(markup.size() > 9000);

    auto const options = ChunkingOptions {};
    auto plan = splitMarkup(markup, options);
    REQUIRE(plan.has_value());
    CHECK(plan->strategy == SplitStrategy::Paragraphs);
    CHECK(plan->fragments.size() >= 4);

    auto recovered = std::string {};
    for (const auto& fragment: plan->fragments)
    {
        CHECK(fragment.size() <= options.maxChunkChars);
        CHECK(isSpeakDocument(fragment));
        CHECK(fragment.starts_with(R"(<speak><prosody rate="85%">)"));
        CHECK(fragment.ends_with("</prosody></speak>"));
        if (!recovered.empty())
            recovered += ' ';
        recovered += stripTags(fragment);
    }

    // No text is lost or reordered
    CHECK(recovered == stripTags(markup));
}

TEST_CASE("splitMarkup re-splits an oversized paragraph by sentences", "[chunker]")
{
    auto const markup = std::format("<speak>{}{}</speak>", paragraph(0, 2), paragraph(1, 60));
    REQUIRE(markup.size() > 2900);

    auto const options = ChunkingOptions {};
    auto plan = splitMarkup(markup, options);
    REQUIRE(plan.has_value());
    CHECK(plan->strategy == SplitStrategy::Paragraphs);
    REQUIRE(plan->fragments.size() >= 3);

    for (const auto& fragment: plan->fragments)
    {
        CHECK(fragment.size() <= options.maxChunkChars);
        CHECK(isSpeakDocument(fragment));
    }
    CHECK(plan->fragments[1].starts_with("<speak><p>"));
}

TEST_CASE("splitMarkup keeps sibling wrappers and breaks around paragraphs", "[chunker]")
{
    // Sections each in their own prosody element, separated by pauses; every second one is too
    // large for a single fragment.
    auto markup = std::string { "<speak>" };
    auto paragraphCount = 0;
    for (auto section = 0; section < 4; ++section)
    {
        markup += section % 2 == 0 ? R"(<prosody rate="80%">)" : R"(<prosody pitch="-10%">)";
        for (auto i = 0; i < (section % 2 == 0 ? 3 : 5); ++i)
            markup += paragraph(paragraphCount++, 10);
        markup += R"(</prosody><break time="3s"/>)";
    }
    markup += "</speak>";
    REQUIRE(markup.size() > 9000);

    auto const options = ChunkingOptions {};
    auto plan = splitMarkup(markup, options);
    REQUIRE(plan.has_value());
    CHECK(plan->strategy == SplitStrategy::Paragraphs);
    CHECK(plan->fragments.size() >= 5);

    auto breaks = 0;
    auto withProsody = 0;
    auto recovered = std::string {};
    for (const auto& fragment: plan->fragments)
    {
        CHECK(fragment.size() <= options.maxChunkChars);
        CHECK(isSpeakDocument(fragment));
        if (fragment.find("<prosody ") != std::string::npos)
            ++withProsody;
        for (auto pos = fragment.find(R"(<break time="3s"/>)"); pos != std::string::npos;
             pos = fragment.find(R"(<break time="3s"/>)", pos + 1))
            ++breaks;
        recovered += stripTags(fragment);
    }
    CHECK(breaks == 4);
    CHECK(withProsody >= 6);

    // The oversized sections keep their own attributes when re-opened
    auto const pitched = std::ranges::count_if(
        plan->fragments, [](const std::string& fragment) { return fragment.starts_with(R"(<speak><prosody pitch="-10%">)"); });
    CHECK(pitched >= 4);

    // Every sentence survives, in document order
    auto last = std::size_t { 0 };
    for (auto p = 0; p < paragraphCount; ++p)
    {
        for (auto i = 0; i < 10; ++i)
        {
            auto const pos = recovered.find(sentence(p * 100 + i), last);
            REQUIRE(pos != std::string::npos);
            last = pos;
        }
    }
}

TEST_CASE("splitMarkup falls back to sentences without paragraph structure", "[chunker]")
{
    auto text = std::string {};
    for (auto i = 0; i < 80; ++i)
    {
        if (i > 0)
            text += ' ';
        text += sentence(i);
    }
    auto const markup = std::format("<speak>{}</speak>", text);

    auto const options = ChunkingOptions {};
    auto plan = splitMarkup(markup, options);
    REQUIRE(plan.has_value());
    CHECK(plan->strategy == SplitStrategy::Sentences);
    CHECK(plan->fragments.size() >= 3);

    for (const auto& fragment: plan->fragments)
    {
        CHECK(fragment.size() <= options.maxChunkChars - options.sentenceHeadroom);
        CHECK(isSpeakDocument(fragment));
    }
    CHECK(plan->fragments.front().starts_with("<speak>Sentence 000"));
}

TEST_CASE("splitMarkup wraps bare text in speak elements", "[chunker]")
{
    auto text = std::string {};
    for (auto i = 0; i < 60; ++i)
        text += sentence(i) + " ";

    auto plan = splitMarkup(text, ChunkingOptions {});
    REQUIRE(plan.has_value());
    CHECK(plan->fragments.size() >= 2);
    for (const auto& fragment: plan->fragments)
        CHECK(isSpeakDocument(fragment));
}

TEST_CASE("splitMarkup rejects a limit that cannot hold a wrapper", "[chunker]")
{
    auto plan = splitMarkup("<speak>Hello</speak>", ChunkingOptions { .maxChunkChars = 40 });
    REQUIRE(!plan.has_value());
    CHECK(plan.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("splitToFit breaks at word boundaries", "[chunker]")
{
    auto const pieces = splitToFit("one two three four five six", 9);

    REQUIRE(pieces.size() == 4);
    CHECK(pieces[0] == "one two");
    CHECK(pieces[1] == "three");
    CHECK(pieces[2] == "four five");
    CHECK(pieces[3] == "six");
}

TEST_CASE("splitToFit cuts long words without breaking UTF-8 or entities", "[chunker]")
{
    SECTION("multi-byte characters stay whole")
    {
        // "é" is two bytes; a cut at 5 would land inside the third one
        auto const pieces = splitToFit("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9", 5);
        REQUIRE(pieces.size() == 2);
        CHECK(pieces[0] == "\xC3\xA9\xC3\xA9");
        CHECK(pieces[1] == "\xC3\xA9\xC3\xA9");
    }

    SECTION("entity references stay whole")
    {
        auto const pieces = splitToFit("abcd&amp;efgh", 6);
        REQUIRE(pieces.size() == 3);
        CHECK(pieces[0] == "abcd");
        CHECK(pieces[1] == "&amp;e");
        CHECK(pieces[2] == "fgh");
    }

    SECTION("zero limit yields nothing")
    {
        CHECK(splitToFit("anything", 0).empty());
    }
}

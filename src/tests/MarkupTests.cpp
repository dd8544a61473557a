// SPDX-License-Identifier: Apache-2.0
#include <markup/Markup.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mindcast;
using namespace mindcast::markup;

TEST_CASE("parse builds the element tree of a speak document", "[markup]")
{
    auto const source = std::string {
        R"(<?xml version="1.0"?><speak><prosody rate="80%"><p>One.</p><p>Two <break time="1s"/> three.</p></prosody></speak>)"
    };

    auto document = parse(source);
    REQUIRE(document.has_value());
    CHECK(document->root.name == "speak");
    REQUIRE(document->root.children.size() == 1);

    auto const& prosody = document->root.children[0];
    CHECK(prosody.name == "prosody");
    CHECK(document->openTag(prosody) == R"(<prosody rate="80%">)");
    CHECK(document->closeTag(prosody) == "</prosody>");
    REQUIRE(prosody.children.size() == 2);
    CHECK(document->text(prosody.children[0]) == "<p>One.</p>");

    auto const& second = prosody.children[1];
    REQUIRE(second.children.size() == 3);
    CHECK(second.children[1].name == "break");
    CHECK(second.children[1].selfClosing);
}

TEST_CASE("parse accepts comments, CDATA and '>' inside attribute values", "[markup]")
{
    auto document = parse(R"(<!-- intro --><speak><p title="a > b"><![CDATA[<raw>]]> text</p></speak>)");
    REQUIRE(document.has_value());
    CHECK(document->root.name == "speak");
}

TEST_CASE("parse rejects malformed markup", "[markup]")
{
    SECTION("mismatched closing tag")
    {
        auto document = parse("<speak><p>text</s></speak>");
        REQUIRE(!document.has_value());
        CHECK(document.error().code == ErrorCode::MalformedMarkup);
    }

    SECTION("unclosed element")
    {
        CHECK(!parse("<speak><p>text</speak>").has_value());
    }

    SECTION("two root elements")
    {
        CHECK(!parse("<speak>a</speak><speak>b</speak>").has_value());
    }

    SECTION("no element at all")
    {
        CHECK(!parse("just text").has_value());
    }
}

TEST_CASE("isSpeakDocument requires a well-formed speak root", "[markup]")
{
    CHECK(isSpeakDocument("<speak>Hello</speak>"));
    CHECK(isSpeakDocument("<speak xml:lang=\"en-US\"><p>Hi</p></speak>"));
    CHECK(!isSpeakDocument("<p>Hello</p>"));
    CHECK(!isSpeakDocument("<speak><p>Hello</speak>"));
}

TEST_CASE("stripTags removes tags and collapses whitespace", "[markup]")
{
    CHECK(stripTags("<speak><p>Breathe in.</p>\n  <p>Breathe out.</p></speak>") == "Breathe in. Breathe out.");
    CHECK(stripTags("<speak>Rest &amp; relax</speak>") == "Rest &amp; relax");
    CHECK(stripTags("<speak></speak>").empty());
}

TEST_CASE("unescapeEntities decodes named and numeric references", "[markup]")
{
    CHECK(unescapeEntities("Rest &amp; relax") == "Rest & relax");
    CHECK(unescapeEntities("&lt;calm&gt; &quot;now&quot; &apos;here&apos;") == "<calm> \"now\" 'here'");
    CHECK(unescapeEntities("caf&#233;") == "caf\xC3\xA9");
    CHECK(unescapeEntities("&#x41;") == "A");
    CHECK(unescapeEntities("AT&T") == "AT&T");
}

TEST_CASE("splitSentences splits on terminal punctuation followed by whitespace", "[markup]")
{
    auto const sentences = splitSentences("Breathe in. Hold it! Are you calm? \"Yes.\" Version 1.5 is fine");

    REQUIRE(sentences.size() == 5);
    CHECK(sentences[0] == "Breathe in.");
    CHECK(sentences[1] == "Hold it!");
    CHECK(sentences[2] == "Are you calm?");
    CHECK(sentences[3] == "\"Yes.\"");
    CHECK(sentences[4] == "Version 1.5 is fine");
}

TEST_CASE("extractSpeak finds the speak element in a chatty reply", "[markup]")
{
    auto const reply = std::string { "Here is the markup:\n```xml\n<speak><p>Hi</p></speak>\n```\nEnjoy!" };
    auto const extracted = extractSpeak(reply);
    REQUIRE(extracted.has_value());
    CHECK(*extracted == "<speak><p>Hi</p></speak>");

    CHECK(!extractSpeak("<speaker>nope</speaker>").has_value());
    CHECK(!extractSpeak("<speak>unterminated").has_value());
}

TEST_CASE("ensureSpeakRoot wraps bare text only", "[markup]")
{
    CHECK(ensureSpeakRoot("  Hello there. ") == "<speak>Hello there.</speak>");
    CHECK(ensureSpeakRoot("<speak>Hello</speak>") == "<speak>Hello</speak>");
}

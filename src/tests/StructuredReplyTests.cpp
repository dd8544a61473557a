// SPDX-License-Identifier: Apache-2.0
#include <llm/StructuredReply.hpp>

#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mindcast;
using namespace mindcast::test;

TEST_CASE("decodeStrict accepts bare JSON and a single fenced block", "[structured]")
{
    auto bare = decodeStrict("  {\"overall_tone\": \"calm\"}\n");
    REQUIRE(bare.has_value());
    CHECK((*bare)["overall_tone"] == "calm");

    auto fenced = decodeStrict("Here you go:\n```json\n[1, 2, 3]\n```\nThanks.");
    REQUIRE(fenced.has_value());
    CHECK(fenced->size() == 3);
}

TEST_CASE("decodeStrict rejects everything else", "[structured]")
{
    for (auto const* reply: {
             "",
             "The tone should be calm.",
             "{\"unterminated\": ",
             "```json\n{}\n```\n```json\n{}\n```",
             "```json\n{\"a\": 1}",
             "Sure! {\"a\": 1}",
         })
    {
        auto decoded = decodeStrict(reply);
        REQUIRE(!decoded.has_value());
        CHECK(decoded.error().code == ErrorCode::MalformedResponse);
    }
}

TEST_CASE("requireObject checks member types", "[structured]")
{
    auto const check = requireObject({ "tone" }, { "rate" }, { "sections" });

    CHECK(check(nlohmann::json { { "tone", "calm" }, { "rate", nlohmann::json::object() }, { "sections", nlohmann::json::array() } })
              .has_value());
    CHECK(!check(nlohmann::json { { "tone", 1 }, { "rate", nlohmann::json::object() }, { "sections", nlohmann::json::array() } })
               .has_value());
    CHECK(!check(nlohmann::json { { "tone", "calm" }, { "sections", nlohmann::json::array() } }).has_value());
    CHECK(!check(nlohmann::json::array()).has_value());
}

TEST_CASE("requestStructured asks for a reformat after a malformed reply", "[structured]")
{
    auto generator = MockTextGenerator {};
    generator.queueReply("I think the tone should be calm.");
    generator.queueReply(R"({"tone": "calm"})");

    auto session = ChatSession("system");
    session.addUserMessage("Analyse this.");

    auto result = requestStructured(generator,
                                    session,
                                    StructuredRequest {
                                        .purpose = "test",
                                        .validate = requireObject({ "tone" }, {}, {}),
                                        .expectedShape = R"({"tone": "..."})",
                                        .maxReformatAttempts = 1,
                                        .sampler = {},
                                    });
    REQUIRE(result.has_value());
    CHECK((*result)["tone"] == "calm");

    REQUIRE(generator.conversations.size() == 2);
    auto const& retry = generator.conversations[1];
    REQUIRE(retry.size() == 4);
    CHECK(retry[2].role == Role::Assistant);
    CHECK(retry[2].content == "I think the tone should be calm.");
    CHECK(retry[3].role == Role::User);
    CHECK(retry[3].content.find(R"({"tone": "..."})") != std::string::npos);
}

TEST_CASE("requestStructured gives up after the configured attempts", "[structured]")
{
    auto generator = MockTextGenerator {};
    generator.queueReply("not json");
    generator.queueReply(R"({"wrong": true})");
    generator.queueReply(R"({"tone": "too late"})");

    auto session = ChatSession();
    session.addUserMessage("Analyse this.");

    auto result = requestStructured(generator,
                                    session,
                                    StructuredRequest {
                                        .purpose = "test",
                                        .validate = requireObject({ "tone" }, {}, {}),
                                        .expectedShape = "{}",
                                        .maxReformatAttempts = 1,
                                        .sampler = {},
                                    });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::MalformedResponse);
    CHECK(generator.conversations.size() == 2);
}

TEST_CASE("requestStructured passes generator failures through", "[structured]")
{
    auto generator = MockTextGenerator {};
    generator.queueError(ErrorCode::InferenceError, "context overflow");

    auto session = ChatSession();
    session.addUserMessage("Analyse this.");

    auto result = requestStructured(generator, session, StructuredRequest { .purpose = "test" });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InferenceError);
}

// SPDX-License-Identifier: Apache-2.0
#include <pipeline/StateStore.hpp>

#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <set>

using namespace mindcast;
using namespace mindcast::test;

namespace
{

    auto filledState() -> State
    {
        auto state = State { .request = MeditationRequest { .durationMinutes = 20, .languageCode = "es-ES" } };
        state.script = Script {
            .content = "Bienvenido.",
            .sections = { ScriptSection { .type = "introduction", .content = "Bienvenido." } },
        };
        state.prosodyAnalysis = nlohmann::json { { "overall_tone", "warm" } };
        state.markupOutput = "<speak>Bienvenido.</speak>";
        state.markupReview = MarkupReview { .iterations = 1, .notes = { "Round 1: no issues found" } };
        state.audioOutput = AudioOutput {
            .narrationFile = "output/audio/a.mp3",
            .mixedFile = std::nullopt,
            .sampleFile = std::nullopt,
            .status = "generated",
            .summaryFile = std::nullopt,
        };
        state.warnings = { "fallback used" };
        state.currentStep = "speech-synthesis";
        return state;
    }

} // namespace

TEST_CASE("StateStore saves and loads a snapshot", "[store]")
{
    auto dir = TempDir { "store" };
    auto store = StateStore(dir / "states");

    auto const state = filledState();
    auto saved = store.save(state, StageId::SpeechSynthesis);
    REQUIRE(saved.has_value());
    CHECK(saved->parent_path() == dir / "states");
    CHECK(saved->filename().string().starts_with("state_speech-synthesis_"));
    CHECK(saved->extension() == ".json");

    auto loaded = store.load(*saved);
    REQUIRE(loaded.has_value());
    CHECK(*loaded == state);
}

TEST_CASE("StateStore never overwrites snapshots", "[store]")
{
    auto dir = TempDir { "store" };
    auto store = StateStore(dir.path());

    auto names = std::set<std::string> {};
    for (auto i = 0; i < 5; ++i)
    {
        auto state = filledState();
        state.warnings = { std::to_string(i) };
        auto saved = store.save(state, StageId::Script);
        REQUIRE(saved.has_value());
        names.insert(saved->filename().string());
    }
    CHECK(names.size() == 5);

    // Oldest first, so the newest snapshot is the last write
    auto const snapshots = store.snapshots(StageId::Script);
    REQUIRE(snapshots.size() == 5);
    auto newest = store.load(snapshots.back());
    REQUIRE(newest.has_value());
    CHECK(newest->warnings == std::vector<std::string> { "4" });
    CHECK(dir.files().size() == 5);
}

TEST_CASE("StateStore finds the latest snapshot", "[store]")
{
    auto dir = TempDir { "store" };
    auto store = StateStore(dir.path());

    CHECK(store.latest().error().code == ErrorCode::NotFound);

    REQUIRE(store.save(filledState(), StageId::Script).has_value());
    auto const profile = store.save(filledState(), StageId::ProsodyProfile);
    REQUIRE(profile.has_value());
    REQUIRE(store.save(filledState(), StageId::Script).has_value());

    auto furthest = store.latest();
    REQUIRE(furthest.has_value());
    CHECK(*furthest == *profile);

    CHECK(store.latest(StageId::ProsodyProfile).value() == *profile);
    CHECK(store.latest(StageId::AudioMixing).error().code == ErrorCode::NotFound);
}

TEST_CASE("StateStore reports unreadable snapshots", "[store]")
{
    auto dir = TempDir { "store" };
    auto store = StateStore(dir.path());

    SECTION("missing file")
    {
        auto loaded = store.load(dir / "nope.json");
        REQUIRE(!loaded.has_value());
        CHECK(loaded.error().code == ErrorCode::NotFound);
    }

    SECTION("invalid JSON")
    {
        writeFile(dir / "state_script_x.json", "{ not json");
        auto loaded = store.load(dir / "state_script_x.json");
        REQUIRE(!loaded.has_value());
        CHECK(loaded.error().code == ErrorCode::CorruptSnapshot);
    }

    SECTION("wrong layout")
    {
        writeFile(dir / "state_script_x.json", R"({"request": {"duration_minutes": 10}, "script": {"content": 5}})");
        auto loaded = store.load(dir / "state_script_x.json");
        REQUIRE(!loaded.has_value());
        CHECK(loaded.error().code == ErrorCode::CorruptSnapshot);
    }
}

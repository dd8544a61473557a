// SPDX-License-Identifier: Apache-2.0
#include <pipeline/Pipeline.hpp>

#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <stdexcept>

using namespace mindcast;
using namespace mindcast::test;

namespace
{

    /// Stage whose behaviour is supplied by the test.
    class ScriptedStage: public Stage
    {
      public:
        ScriptedStage(StageId id, std::function<State(State)> body): _id(id), _body(std::move(body)) {}

        [[nodiscard]] auto id() const -> StageId override { return _id; }
        [[nodiscard]] auto run(State state) -> State override { return _body(std::move(state)); }

      private:
        StageId _id;
        std::function<State(State)> _body;
    };

    /// Records its own name in State::warnings.
    auto marker(StageId id) -> std::unique_ptr<Stage>
    {
        return std::make_unique<ScriptedStage>(id, [id](State state) {
            state.warnings.emplace_back(stageName(id));
            return state;
        });
    }

    void installMarkers(Pipeline& pipeline)
    {
        for (auto const id: AllStages)
            pipeline.setStage(marker(id));
    }

    auto sampleRequest() -> MeditationRequest
    {
        return MeditationRequest {
            .emotionalState = EmotionalState::Tired,
            .style = MeditationStyle::BodyScan,
            .theme = MeditationTheme::Sleep,
            .durationMinutes = 15,
            .voice = VoiceType::Neutral,
            .languageCode = "en-GB",
            .soundscape = Soundscape::Rain,
        };
    }

} // namespace

TEST_CASE("Pipeline runs every stage in order and snapshots each one", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);

    auto result = pipeline.runAll(sampleRequest());
    REQUIRE(result.has_value());
    CHECK(!result->failed());
    CHECK(result->currentStep == "audio-mixing");
    CHECK(result->request == sampleRequest());

    REQUIRE(result->warnings.size() == StageCount);
    for (auto i = std::size_t { 0 }; i < StageCount; ++i)
        CHECK(result->warnings[i] == stageName(AllStages[i]));

    for (auto const id: AllStages)
    {
        auto const snapshots = store.snapshots(id);
        REQUIRE(snapshots.size() == 1);
        auto loaded = store.load(snapshots.front());
        REQUIRE(loaded.has_value());
        CHECK(loaded->currentStep == stageName(id));
        CHECK(loaded->warnings.size() == stageIndex(id) + 1);
    }
}

TEST_CASE("Pipeline halts at the first failing stage", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);
    pipeline.setStage(std::make_unique<ScriptedStage>(StageId::ProsodyProfile, [](State state) {
        state.error = "prosody-profile: model unavailable";
        return state;
    }));

    auto result = pipeline.runAll(sampleRequest());
    REQUIRE(result.has_value());
    CHECK(result->failed());
    CHECK(result->error == "prosody-profile: model unavailable");
    CHECK(result->currentStep == "prosody-profile");
    CHECK(result->warnings.size() == 2);

    // The failed record is persisted, later stages never run
    auto const failedSnapshots = store.snapshots(StageId::ProsodyProfile);
    REQUIRE(failedSnapshots.size() == 1);
    auto loaded = store.load(failedSnapshots.front());
    REQUIRE(loaded.has_value());
    CHECK(loaded->error == "prosody-profile: model unavailable");
    CHECK(store.snapshots(StageId::MarkupGeneration).empty());
    CHECK(store.snapshots(StageId::AudioMixing).empty());
}

TEST_CASE("Pipeline resumes from the snapshot of the preceding stage", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);

    auto first = pipeline.runRange(StageId::Script, StageId::ProsodyAnalysis, sampleRequest());
    REQUIRE(first.has_value());
    CHECK(first->currentStep == "prosody-analysis");

    // A different request is ignored in favour of the stored one
    auto resumed = pipeline.runRange(StageId::ProsodyProfile, StageId::MarkupGeneration, MeditationRequest {});
    REQUIRE(resumed.has_value());
    CHECK(resumed->request == sampleRequest());
    REQUIRE(resumed->warnings.size() == 4);
    CHECK(resumed->warnings[0] == "script");
    CHECK(resumed->warnings[3] == "markup-generation");
    CHECK(store.snapshots(StageId::Script).size() == 1);
}

TEST_CASE("Pipeline starts from the request when no snapshot exists", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);

    auto result = pipeline.runRange(StageId::SpeechSynthesis, StageId::SpeechSynthesis, sampleRequest());
    REQUIRE(result.has_value());
    CHECK(result->request == sampleRequest());
    CHECK(result->warnings == std::vector<std::string> { "speech-synthesis" });
}

TEST_CASE("Pipeline refuses to resume from a corrupt snapshot", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);

    writeFile(dir / "state_prosody-analysis_20260101_120000_000000.json", "{ not json");

    auto result = pipeline.runRange(StageId::ProsodyProfile, StageId::MarkupGeneration, sampleRequest());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CorruptSnapshot);
    CHECK(store.snapshots(StageId::ProsodyProfile).empty());
    CHECK(store.snapshots(StageId::MarkupGeneration).empty());
}

TEST_CASE("Pipeline runStage continues from a given state", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);

    auto seed = State { .request = sampleRequest() };
    seed.markupOutput = "<speak>Hi</speak>";

    auto result = pipeline.runStage(StageId::MarkupReview, seed);
    REQUIRE(result.has_value());
    CHECK(result->markupOutput == seed.markupOutput);
    CHECK(result->currentStep == "markup-review");
    CHECK(store.snapshots(StageId::MarkupReview).size() == 1);
}

TEST_CASE("Pipeline does not continue a failed seed", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);

    auto seed = State { .request = sampleRequest() };
    seed.error = "script: broken";
    seed.currentStep = "script";

    auto result = pipeline.runRange(StageId::ProsodyAnalysis, StageId::AudioMixing, seed.request, seed);
    REQUIRE(result.has_value());
    CHECK(*result == seed);
    CHECK(dir.files().empty());
}

TEST_CASE("Pipeline converts stage exceptions into errors", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);
    pipeline.setStage(std::make_unique<ScriptedStage>(StageId::ProsodyAnalysis, [](State state) -> State {
        state.warnings.emplace_back("partial");
        throw std::runtime_error("boom");
    }));

    auto result = pipeline.runRange(StageId::Script, StageId::ProsodyProfile, sampleRequest());
    REQUIRE(result.has_value());
    CHECK(result->error == "prosody-analysis: unexpected failure: boom");
    CHECK(result->currentStep == "prosody-analysis");
    CHECK(result->warnings == std::vector<std::string> { "script" });
    CHECK(store.snapshots(StageId::ProsodyProfile).empty());
}

TEST_CASE("Pipeline rejects stages that modify the request", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);
    installMarkers(pipeline);
    pipeline.setStage(std::make_unique<ScriptedStage>(StageId::Script, [](State state) {
        state.request.durationMinutes = 99;
        return state;
    }));

    auto result = pipeline.runAll(sampleRequest());
    REQUIRE(result.has_value());
    CHECK(result->error == "script: stage modified the request");
    CHECK(result->request == sampleRequest());
    CHECK(store.snapshots(StageId::ProsodyAnalysis).empty());
}

TEST_CASE("Pipeline validates the stage range", "[pipeline]")
{
    auto dir = TempDir { "pipeline" };
    auto store = StateStore(dir.path());
    auto pipeline = Pipeline(store);

    SECTION("start after end")
    {
        installMarkers(pipeline);
        auto result = pipeline.runRange(StageId::AudioMixing, StageId::Script, sampleRequest());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("missing implementation")
    {
        pipeline.setStage(marker(StageId::Script));
        auto result = pipeline.runRange(StageId::Script, StageId::ProsodyAnalysis, sampleRequest());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
        CHECK(dir.files().empty());
    }
}

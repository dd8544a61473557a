// SPDX-License-Identifier: Apache-2.0
#include "Pipeline.hpp"

#include <core/Log.hpp>

#include <exception>
#include <format>

namespace mindcast
{

Pipeline::Pipeline(StateStore& store): _store(store)
{
}

void Pipeline::setStage(std::unique_ptr<Stage> stage)
{
    auto const index = stageIndex(stage->id());
    _stages[index] = std::move(stage);
}

auto Pipeline::resolveSeed(StageId start, const MeditationRequest& request) -> Result<State>
{
    if (start == AllStages.front())
        return State { .request = request };

    auto const previous = AllStages[stageIndex(start) - 1];
    auto snapshot = _store.latest(previous);
    if (!snapshot)
    {
        log::info("No snapshot for {}, starting from the request alone", stageName(previous));
        return State { .request = request };
    }

    auto state = _store.load(*snapshot);
    if (!state)
        return std::unexpected(state.error());

    if (state->request != request)
        log::info("Resuming with the request stored in {}", snapshot->filename().string());
    return state;
}

auto Pipeline::execute(Stage& stage, State state) -> State
{
    auto const id = stage.id();
    auto const requestBefore = state.request;
    auto before = state;

    auto result = [&]() -> State {
        try
        {
            return stage.run(std::move(state));
        }
        catch (const std::exception& e)
        {
            log::error("Stage {} threw: {}", stageName(id), e.what());
            auto failed = before;
            failed.error = std::format("{}: unexpected failure: {}", stageName(id), e.what());
            return failed;
        }
    }();

    if (result.request != requestBefore)
    {
        log::error("Stage {} modified the request", stageName(id));
        result.request = requestBefore;
        if (!result.failed())
            result.error = std::format("{}: stage modified the request", stageName(id));
    }

    result.currentStep = std::string(stageName(id));
    return result;
}

auto Pipeline::runRange(StageId start, StageId end, const MeditationRequest& request, std::optional<State> seed)
    -> Result<State>
{
    if (stageIndex(start) > stageIndex(end))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Start stage {} comes after end stage {}", stageName(start), stageName(end)));

    for (auto i = stageIndex(start); i <= stageIndex(end); ++i)
    {
        if (!_stages[i])
            return makeError(ErrorCode::InvalidArgument,
                             std::format("No implementation registered for stage {}", stageName(AllStages[i])));
    }

    auto state = State {};
    if (seed)
        state = std::move(*seed);
    else
    {
        auto resolved = resolveSeed(start, request);
        if (!resolved)
            return std::unexpected(resolved.error());
        state = std::move(*resolved);
    }

    if (state.failed())
    {
        log::warning("Not resuming from a failed state: {}", state.error);
        return state;
    }

    log::info("Running stages {} to {}", stageName(start), stageName(end));

    for (auto i = stageIndex(start); i <= stageIndex(end); ++i)
    {
        auto& stage = *_stages[i];
        auto const name = stageName(stage.id());

        log::info("Stage {} started", name);
        log::debug("State before {}: {}", name, state.summary());

        state = execute(stage, std::move(state));

        log::debug("State after {}: {}", name, state.summary());

        auto saved = _store.save(state, stage.id());
        if (!saved)
            return std::unexpected(saved.error());

        if (state.failed())
        {
            log::error("Stage {} failed: {}", name, state.error);
            return state;
        }
        log::info("Stage {} completed", name);
    }

    return state;
}

auto Pipeline::runStage(StageId stage, State state) -> Result<State>
{
    auto const request = state.request;
    return runRange(stage, stage, request, std::move(state));
}

auto Pipeline::runAll(const MeditationRequest& request) -> Result<State>
{
    return runRange(AllStages.front(), AllStages.back(), request);
}

} // namespace mindcast

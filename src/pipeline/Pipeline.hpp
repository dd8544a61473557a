// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/Stage.hpp>
#include <pipeline/State.hpp>
#include <pipeline/StateStore.hpp>

#include <array>
#include <memory>
#include <optional>

namespace mindcast
{

/// @brief Runs the stages in their fixed order with a snapshot after each one.
class Pipeline
{
  public:
    explicit Pipeline(StateStore& store);

    /// @brief Installs the implementation of a stage, replacing any previous one.
    void setStage(std::unique_ptr<Stage> stage);

    /// @brief Runs every stage from `start` to `end` inclusive.
    ///
    /// Without a seed the newest snapshot of the stage preceding `start` is loaded, or a fresh
    /// record holding only `request` is used if there is none. A seed that already carries an
    /// error is returned unchanged. Execution halts after the first stage whose result carries
    /// an error; that result is still persisted.
    /// @return The final state, or InvalidArgument / CorruptSnapshot / IoError when the run could
    ///         not be carried out at all. Stage failures are reported through State::error.
    [[nodiscard]] auto runRange(StageId start,
                                StageId end,
                                const MeditationRequest& request,
                                std::optional<State> seed = std::nullopt) -> Result<State>;

    /// @brief Runs a single stage on the given state.
    [[nodiscard]] auto runStage(StageId stage, State state) -> Result<State>;

    /// @brief Runs the whole pipeline for a new request.
    [[nodiscard]] auto runAll(const MeditationRequest& request) -> Result<State>;

  private:
    StateStore& _store;
    std::array<std::unique_ptr<Stage>, StageCount> _stages;

    auto resolveSeed(StageId start, const MeditationRequest& request) -> Result<State>;
    auto execute(Stage& stage, State state) -> State;
};

} // namespace mindcast

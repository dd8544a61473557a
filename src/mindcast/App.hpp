// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mindcast/Config.hpp>
#include <pipeline/Stage.hpp>

#include <filesystem>
#include <memory>
#include <optional>

namespace mindcast
{

/// @brief Which part of the pipeline a run covers.
struct RunPlan
{
    /// @brief First stage; when absent it is the stage after the resumed snapshot, else the first.
    std::optional<StageId> start;
    StageId end = AllStages.back();

    /// @brief Snapshot to resume from instead of the newest one of the preceding stage.
    std::optional<std::filesystem::path> resumeFrom;
};

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the run log and registers the stages.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the planned stages.
    ///
    /// The language model and the piper voice are only loaded when a stage of the plan needs them.
    /// @return The final state (which may carry a stage error), or an error if the run could not start.
    [[nodiscard]] auto run(const MeditationRequest& request, const RunPlan& plan) -> Result<State>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mindcast

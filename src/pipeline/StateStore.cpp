// SPDX-License-Identifier: Apache-2.0
#include "StateStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Timestamp.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <ranges>
#include <sstream>
#include <system_error>

namespace mindcast
{

namespace
{

    constexpr auto SnapshotExtension = std::string_view { ".json" };
    constexpr auto MaxSameTimestampWrites = 99;

    auto snapshotPrefix(StageId stage) -> std::string
    {
        return std::format("state_{}_", stageName(stage));
    }

} // namespace

StateStore::StateStore(std::filesystem::path directory): _directory(std::move(directory))
{
}

auto StateStore::save(const State& state, StageId stage) -> Result<std::filesystem::path>
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot create state directory {}: {}", _directory.string(), ec.message()));

    auto const base = std::format("{}{}", snapshotPrefix(stage), fileTimestamp());
    auto target = _directory / std::format("{}{}", base, SnapshotExtension);
    for (auto n = 1; std::filesystem::exists(target); ++n)
    {
        if (n > MaxSameTimestampWrites)
            return makeError(ErrorCode::IoError, std::format("Too many snapshots named {}", base));
        target = _directory / std::format("{}_{:02}{}", base, n, SnapshotExtension);
    }

    auto temporary = target;
    temporary += ".tmp";
    {
        auto stream = std::ofstream(temporary, std::ios::trunc);
        if (!stream)
            return makeError(ErrorCode::IoError, std::format("Cannot write {}", temporary.string()));
        stream << toJson(state).dump(2) << '\n';
        stream.close();
        if (!stream)
        {
            std::filesystem::remove(temporary, ec);
            return makeError(ErrorCode::IoError, std::format("Cannot write {}", temporary.string()));
        }
    }

    std::filesystem::rename(temporary, target, ec);
    if (ec)
    {
        auto const message = ec.message();
        std::filesystem::remove(temporary, ec);
        return makeError(ErrorCode::IoError, std::format("Cannot store snapshot {}: {}", target.string(), message));
    }

    log::info("State saved to {}", target.string());
    return target;
}

auto StateStore::load(const std::filesystem::path& snapshot) const -> Result<State>
{
    if (!std::filesystem::is_regular_file(snapshot))
        return makeError(ErrorCode::NotFound, std::format("Snapshot not found: {}", snapshot.string()));

    auto stream = std::ifstream(snapshot);
    if (!stream)
        return makeError(ErrorCode::IoError, std::format("Cannot read {}", snapshot.string()));

    auto buffer = std::stringstream {};
    buffer << stream.rdbuf();

    auto parsed = json::parse(buffer.str(), ErrorCode::CorruptSnapshot);
    if (!parsed)
        return makeError(ErrorCode::CorruptSnapshot,
                         std::format("Snapshot {} is not valid JSON: {}", snapshot.string(), parsed.error().message));

    auto state = stateFromJson(*parsed);
    if (!state)
        return makeError(ErrorCode::CorruptSnapshot,
                         std::format("Snapshot {} is unusable: {}", snapshot.string(), state.error().message));

    log::info("State loaded from {}", snapshot.string());
    return state;
}

auto StateStore::snapshots(StageId stage) const -> std::vector<std::filesystem::path>
{
    auto found = std::vector<std::filesystem::path> {};

    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator(_directory, ec);
    if (ec)
        return found;

    auto const prefix = snapshotPrefix(stage);
    for (const auto& entry: it)
    {
        auto const name = entry.path().filename().string();
        if (name.starts_with(prefix) && name.ends_with(SnapshotExtension))
            found.push_back(entry.path());
    }

    std::ranges::sort(found, {}, [](const std::filesystem::path& p) { return p.filename().string(); });
    return found;
}

auto StateStore::latest(std::optional<StageId> stage) const -> Result<std::filesystem::path>
{
    if (stage)
    {
        auto found = snapshots(*stage);
        if (found.empty())
            return makeError(ErrorCode::NotFound,
                             std::format("No snapshot for stage {} in {}", stageName(*stage), _directory.string()));
        return found.back();
    }

    for (auto const candidate: std::views::reverse(AllStages))
    {
        auto found = snapshots(candidate);
        if (!found.empty())
            return found.back();
    }
    return makeError(ErrorCode::NotFound, std::format("No snapshots in {}", _directory.string()));
}

} // namespace mindcast

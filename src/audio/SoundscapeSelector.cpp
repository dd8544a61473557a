// SPDX-License-Identifier: Apache-2.0
#include "SoundscapeSelector.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <system_error>

namespace mindcast
{

namespace
{

    auto toLower(std::string_view text) -> std::string
    {
        auto lower = std::string(text);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    auto pickOne(const std::vector<std::filesystem::path>& files, std::mt19937_64& rng) -> std::filesystem::path
    {
        auto dist = std::uniform_int_distribution<std::size_t>(0, files.size() - 1);
        return files[dist(rng)];
    }

} // namespace

SoundscapeSelector::SoundscapeSelector(std::filesystem::path directory,
                                       std::vector<std::string> extensions,
                                       std::mt19937_64& rng):
    _directory(std::move(directory)), _rng(rng)
{
    for (const auto& extension: extensions)
        _extensions.push_back(toLower(extension));
}

auto SoundscapeSelector::candidates() const -> std::vector<std::filesystem::path>
{
    auto files = std::vector<std::filesystem::path> {};

    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator(_directory, ec);
    if (ec)
    {
        log::warning("Cannot read soundscape directory {}: {}", _directory.string(), ec.message());
        return files;
    }

    for (const auto& entry: it)
    {
        if (!entry.is_regular_file(ec))
            continue;
        auto const extension = toLower(entry.path().extension().string());
        if (std::ranges::find(_extensions, extension) != _extensions.end())
            files.push_back(entry.path());
    }

    std::ranges::sort(files);
    return files;
}

auto SoundscapeSelector::select(std::string_view tag) -> Result<std::filesystem::path>
{
    auto const all = candidates();
    if (all.empty())
        return makeError(ErrorCode::NoCandidate, std::format("No soundscape files found in {}", _directory.string()));

    auto const needle = toLower(tag);
    auto matches = std::vector<std::filesystem::path> {};
    for (const auto& file: all)
    {
        if (!needle.empty() && toLower(file.filename().string()).find(needle) != std::string::npos)
            matches.push_back(file);
    }

    if (!matches.empty())
    {
        auto chosen = pickOne(matches, _rng);
        log::info("Selected soundscape {} for '{}' ({} match(es))", chosen.string(), tag, matches.size());
        return chosen;
    }

    auto chosen = pickOne(all, _rng);
    log::info("No soundscape matches '{}', picked {} at random", tag, chosen.string());
    return chosen;
}

} // namespace mindcast

// SPDX-License-Identifier: Apache-2.0
#include "ChunkedSynthesizer.hpp"

#include <core/Log.hpp>

#include <format>
#include <system_error>
#include <vector>

namespace mindcast
{

namespace
{

    void removeFiles(const std::vector<std::filesystem::path>& files)
    {
        for (const auto& file: files)
        {
            auto ec = std::error_code {};
            if (std::filesystem::remove(file, ec))
                log::debug("Removed {}", file.string());
            else if (ec)
                log::warning("Could not remove {}: {}", file.string(), ec.message());
        }
    }

    auto isWritten(const std::filesystem::path& file) -> bool
    {
        auto ec = std::error_code {};
        auto const size = std::filesystem::file_size(file, ec);
        return !ec && size > 0;
    }

} // namespace

ChunkedSynthesizer::ChunkedSynthesizer(SpeechService& service,
                                       AudioTool& audioTool,
                                       markup::ChunkingOptions options):
    _service(service), _audioTool(audioTool), _options(options)
{
}

auto ChunkedSynthesizer::fragmentPath(const std::filesystem::path& output, std::size_t index)
    -> std::filesystem::path
{
    return output.parent_path()
           / std::format("{}_chunk_{}{}", output.stem().string(), index, output.extension().string());
}

auto ChunkedSynthesizer::synthesize(const SpeechRequest& request) -> Result<std::filesystem::path>
{
    auto plan = markup::splitMarkup(request.markup, _options);
    if (!plan)
        return std::unexpected(plan.error());

    if (plan->strategy == markup::SplitStrategy::None)
    {
        log::info("Markup is within limits ({} bytes), synthesizing in one call", request.markup.size());
        if (auto result = _service.synthesize(request); !result)
        {
            removeFiles({ request.outputPath });
            return std::unexpected(result.error());
        }
        if (!isWritten(request.outputPath))
        {
            removeFiles({ request.outputPath });
            return makeError(ErrorCode::SynthesisError,
                             std::format("No audio was written to {}", request.outputPath.string()));
        }
        return request.outputPath;
    }

    auto const count = plan->fragments.size();
    log::info("Markup exceeds {} bytes ({} bytes), synthesizing {} fragments split by {}",
              _options.maxChunkChars,
              request.markup.size(),
              count,
              plan->strategy == markup::SplitStrategy::Paragraphs ? "paragraphs" : "sentences");

    auto written = std::vector<std::filesystem::path> {};
    written.reserve(count);

    for (auto i = std::size_t { 0 }; i < count; ++i)
    {
        auto fragment = request;
        fragment.markup = std::move(plan->fragments[i]);
        fragment.outputPath = fragmentPath(request.outputPath, i);
        written.push_back(fragment.outputPath);

        log::debug("Fragment {}/{}: {} bytes -> {}", i + 1, count, fragment.markup.size(), fragment.outputPath.string());

        auto result = _service.synthesize(fragment);
        if (result && !isWritten(fragment.outputPath))
            result = makeError(ErrorCode::SynthesisError, "no audio was written");

        if (!result)
        {
            log::error("Fragment {}/{} failed, discarding {} fragment file(s)", i + 1, count, written.size());
            removeFiles(written);
            removeFiles({ request.outputPath });
            return makeError(ErrorCode::SynthesisError,
                             std::format("Fragment {}/{} failed: {}", i + 1, count, result.error().message));
        }
    }

    if (count == 1)
    {
        auto ec = std::error_code {};
        std::filesystem::rename(written.front(), request.outputPath, ec);
        if (ec)
        {
            removeFiles(written);
            return makeError(ErrorCode::IoError,
                             std::format("Cannot move {} to {}: {}",
                                         written.front().string(),
                                         request.outputPath.string(),
                                         ec.message()));
        }
        return request.outputPath;
    }

    if (auto joined = _audioTool.concat(written, request.outputPath); !joined)
    {
        removeFiles(written);
        removeFiles({ request.outputPath });
        return makeError(ErrorCode::SynthesisError, std::format("Concatenation failed: {}", joined.error().message));
    }

    removeFiles(written);
    log::info("Combined {} fragments into {}", count, request.outputPath.string());
    return request.outputPath;
}

} // namespace mindcast

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioTool.hpp>
#include <core/Error.hpp>
#include <markup/Chunker.hpp>
#include <speech/SpeechService.hpp>

#include <filesystem>
#include <string>

namespace mindcast
{

/// @brief Turns markup of any length into one audio file.
///
/// Markup within the size limit is synthesized with a single service call. Larger markup is
/// split into fragments that are synthesized strictly in order into `<stem>_chunk_<i>.<ext>`
/// and then joined by stream copy. When any step fails, every fragment written so far and any
/// partial output are deleted before the error is returned.
class ChunkedSynthesizer
{
  public:
    ChunkedSynthesizer(SpeechService& service, AudioTool& audioTool, markup::ChunkingOptions options);

    /// @brief Synthesizes the request's markup into request.outputPath.
    /// @return The output path, or SynthesisError / MalformedMarkup / InvalidArgument.
    [[nodiscard]] auto synthesize(const SpeechRequest& request) -> Result<std::filesystem::path>;

    /// @brief Returns the file name used for fragment `index` of `output`.
    [[nodiscard]] static auto fragmentPath(const std::filesystem::path& output, std::size_t index)
        -> std::filesystem::path;

  private:
    SpeechService& _service;
    AudioTool& _audioTool;
    markup::ChunkingOptions _options;
};

} // namespace mindcast

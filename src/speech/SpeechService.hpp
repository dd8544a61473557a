// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <string>

namespace mindcast
{

/// @brief One request to turn markup into an audio file.
struct SpeechRequest
{
    std::string markup;
    std::string voiceId;
    std::string languageCode = "en-US";
    std::string outputFormat = "mp3";
    std::filesystem::path outputPath;
};

/// @brief Abstract speech-synthesis backend.
///
/// Implementations write exactly one audio file at SpeechRequest::outputPath. On failure no
/// file is left at that path.
class SpeechService
{
  public:
    virtual ~SpeechService() = default;

    /// @brief Synthesizes the request's markup (blocking).
    /// @return Success, or SynthesisError.
    [[nodiscard]] virtual auto synthesize(const SpeechRequest& request) -> VoidResult = 0;

    /// @brief Short backend name for log output.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

} // namespace mindcast

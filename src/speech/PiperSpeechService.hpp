// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <speech/SpeechService.hpp>

#include <memory>
#include <string>

namespace mindcast
{

/// @brief Configuration for the offline piper backend.
struct PiperSpeechConfig
{
    /// @brief Path to the piper voice model (.onnx file).
    std::string modelPath;

    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;
};

/// @brief Synthesizes speech offline using the piper library (linked at build time).
///
/// Markup is reduced to plain text since piper does not interpret it; the voice is the one
/// baked into the model. Output is always 16-bit mono WAV written with miniaudio's encoder.
class PiperSpeechService: public SpeechService
{
  public:
    PiperSpeechService();
    ~PiperSpeechService() override;

    PiperSpeechService(const PiperSpeechService&) = delete;
    PiperSpeechService& operator=(const PiperSpeechService&) = delete;

    /// @brief Creates the piper synthesizer.
    /// @param config The piper configuration.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(const PiperSpeechConfig& config) -> VoidResult;

    [[nodiscard]] auto synthesize(const SpeechRequest& request) -> VoidResult override;
    [[nodiscard]] auto name() const -> std::string_view override { return "piper"; }

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace mindcast

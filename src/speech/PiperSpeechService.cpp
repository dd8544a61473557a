// SPDX-License-Identifier: Apache-2.0
#include "PiperSpeechService.hpp"

#include <core/Log.hpp>
#include <markup/Markup.hpp>

#include <format>
#include <system_error>
#include <vector>

#include <miniaudio.h>

extern "C"
{
#include <piper.h>
}

namespace mindcast
{

namespace
{

    /// @brief Piper output format: float32 PCM, 22050 Hz, mono.
    constexpr auto PiperSampleRate = 22050u;
    constexpr auto PiperChannels = 1u;

    /// @brief Writes float samples as 16-bit PCM WAV.
    auto writeWav(const std::filesystem::path& path, const std::vector<float>& samples) -> VoidResult
    {
        auto pcm = std::vector<ma_int16>(samples.size());
        ma_pcm_f32_to_s16(pcm.data(), samples.data(), samples.size(), ma_dither_mode_none);

        auto const encoderConfig =
            ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, PiperChannels, PiperSampleRate);

        auto encoder = ma_encoder {};
        if (ma_encoder_init_file(path.string().c_str(), &encoderConfig, &encoder) != MA_SUCCESS)
            return makeError(ErrorCode::IoError, std::format("Cannot open {} for writing", path.string()));

        auto framesWritten = ma_uint64 { 0 };
        auto const rc = ma_encoder_write_pcm_frames(&encoder, pcm.data(), pcm.size(), &framesWritten);
        ma_encoder_uninit(&encoder);

        if (rc != MA_SUCCESS || framesWritten != pcm.size())
            return makeError(ErrorCode::IoError,
                             std::format("Writing {} failed ({} of {} frames)", path.string(), framesWritten, pcm.size()));
        return {};
    }

} // namespace

struct PiperSpeechService::Impl
{
    piper_synthesizer* synth = nullptr;

    ~Impl()
    {
        if (synth)
            piper_free(synth);
    }

    /// @brief Synthesizes plain text via the piper C API.
    auto synthesize(const std::string& text) -> Result<std::vector<float>>
    {
        auto opts = piper_default_synthesize_options(synth);
        auto const startResult = piper_synthesize_start(synth, text.c_str(), &opts);
        if (startResult != 0)
            return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_start failed ({})", startResult));

        auto audioData = std::vector<float> {};
        auto chunk = piper_audio_chunk {};

        while (true)
        {
            auto const rc = piper_synthesize_next(synth, &chunk);
            if (rc == 1) // PIPER_DONE
                break;
            if (rc < 0) // PIPER_ERR_GENERIC
                return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));
            // rc == 0: PIPER_OK
            audioData.insert(audioData.end(), chunk.samples, chunk.samples + chunk.num_samples);
        }
        return audioData;
    }
};

PiperSpeechService::PiperSpeechService(): _impl(std::make_unique<Impl>())
{
}

PiperSpeechService::~PiperSpeechService() = default;

auto PiperSpeechService::initialize(const PiperSpeechConfig& config) -> VoidResult
{
    if (config.modelPath.empty())
        return makeError(ErrorCode::ConfigError, "No piper model configured (synthesis.piperModelPath)");

    auto const configPath = config.modelPath + ".json";

    auto const& espeakData =
        config.espeakDataPath.empty() ? std::string(PIPER_ESPEAK_DATA_DIR) : config.espeakDataPath;

    _impl->synth = piper_create(config.modelPath.c_str(), configPath.c_str(), espeakData.c_str());
    if (!_impl->synth)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                     config.modelPath,
                                     configPath,
                                     espeakData));

    log::info("Piper synthesizer initialized (model: {}, espeak: {})", config.modelPath, espeakData);
    return {};
}

auto PiperSpeechService::synthesize(const SpeechRequest& request) -> VoidResult
{
    if (!_impl->synth)
        return makeError(ErrorCode::SynthesisError, "Piper synthesizer is not initialized");

    if (request.outputFormat != "wav")
        return makeError(ErrorCode::SynthesisError,
                         std::format("Piper writes WAV only, '{}' was requested", request.outputFormat));

    auto const text = markup::unescapeEntities(markup::stripTags(request.markup));
    if (text.empty())
        return makeError(ErrorCode::SynthesisError, "Markup contains no text to speak");

    log::debug("Piper: synthesizing {} characters (voice {} ignored)", text.size(), request.voiceId);

    auto samples = _impl->synthesize(text);
    if (!samples)
        return std::unexpected(samples.error());
    if (samples->empty())
        return makeError(ErrorCode::SynthesisError, "Piper produced no audio");

    if (auto written = writeWav(request.outputPath, *samples); !written)
    {
        auto ec = std::error_code {};
        std::filesystem::remove(request.outputPath, ec);
        return makeError(ErrorCode::SynthesisError, written.error().message);
    }
    return {};
}

} // namespace mindcast

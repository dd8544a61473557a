// SPDX-License-Identifier: Apache-2.0
#include "AudioTool.hpp"

#include <core/Log.hpp>

#include <charconv>
#include <format>
#include <fstream>
#include <system_error>

namespace mindcast
{

namespace
{

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    auto seconds(double value) -> std::string
    {
        return std::format("{:.3f}", value);
    }

    /// Codec arguments for the output container, chosen by file extension.
    auto codecArgs(const std::filesystem::path& output) -> std::vector<std::string>
    {
        auto const ext = output.extension().string();
        if (ext == ".mp3")
            return { "-c:a", "libmp3lame", "-q:a", "2" };
        if (ext == ".wav")
            return { "-c:a", "pcm_s16le" };
        return {};
    }

    void removeQuietly(const std::filesystem::path& file)
    {
        auto ec = std::error_code {};
        std::filesystem::remove(file, ec);
        if (ec)
            log::warning("Could not remove {}: {}", file.string(), ec.message());
    }

    /// Quotes a path for the concat demuxer list format.
    auto concatEntry(const std::filesystem::path& file) -> std::string
    {
        auto quoted = std::string { "file '" };
        for (auto const c: std::filesystem::absolute(file).string())
        {
            if (c == '\'')
                quoted += "'\\''";
            else
                quoted += c;
        }
        quoted += "'\n";
        return quoted;
    }

} // namespace

AudioTool::AudioTool(ProcessRunner& runner, AudioToolConfig config): _runner(runner), _config(std::move(config))
{
}

auto AudioTool::probeDuration(const std::filesystem::path& file) -> Result<double>
{
    if (!std::filesystem::exists(file))
        return makeError(ErrorCode::NotFound, std::format("Audio file not found: {}", file.string()));

    auto const spec = ProcessSpec {
        .command = _config.ffprobePath,
        .args = { "-v",
                  "error",
                  "-show_entries",
                  "format=duration",
                  "-of",
                  "default=noprint_wrappers=1:nokey=1",
                  file.string() },
        .timeout = _config.timeout,
    };

    auto output = _runner.run(spec);
    if (!output)
        return makeError(ErrorCode::DecodeError,
                         std::format("Probing {} failed: {}", file.string(), output.error().message));

    if (!output->succeeded())
        return makeError(ErrorCode::DecodeError,
                         std::format("Probing {} failed (exit {}): {}",
                                     file.string(),
                                     output->exitCode,
                                     log::preview(trim(output->standardError))));

    auto const text = trim(output->standardOutput);
    auto duration = 0.0;
    auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), duration);
    if (ec != std::errc {} || ptr != text.data() + text.size() || duration <= 0.0)
        return makeError(ErrorCode::DecodeError,
                         std::format("Unusable duration '{}' reported for {}", text, file.string()));

    log::debug("Duration of {}: {:.2f}s", file.string(), duration);
    return duration;
}

auto AudioTool::overlayFilter(const OverlaySpec& spec) -> std::string
{
    auto background = std::format("[1:a]atrim=start={}:duration={},asetpts=PTS-STARTPTS,volume={}",
                                  seconds(spec.backgroundOffsetSeconds),
                                  seconds(spec.durationSeconds),
                                  seconds(spec.backgroundVolume));

    if (spec.fadeSeconds > 0.0)
    {
        background += std::format(",afade=t=in:st=0:d={},afade=t=out:st={}:d={}",
                                  seconds(spec.fadeSeconds),
                                  seconds(spec.durationSeconds - spec.fadeSeconds),
                                  seconds(spec.fadeSeconds));
    }

    return std::format("{}[bg];[0:a][bg]amix=inputs=2:duration=first:dropout_transition=0:normalize=0[out]",
                       background);
}

auto AudioTool::overlay(const OverlaySpec& spec) -> VoidResult
{
    auto args = std::vector<std::string> { "-y", "-i", spec.narration.string() };
    if (spec.backgroundRepetitions > 1)
    {
        args.emplace_back("-stream_loop");
        args.push_back(std::to_string(spec.backgroundRepetitions - 1));
    }
    args.emplace_back("-i");
    args.push_back(spec.background.string());
    args.emplace_back("-filter_complex");
    args.push_back(overlayFilter(spec));
    args.emplace_back("-map");
    args.emplace_back("[out]");
    args.emplace_back("-t");
    args.push_back(seconds(spec.durationSeconds));
    for (auto& arg: codecArgs(spec.output))
        args.push_back(std::move(arg));
    args.push_back(spec.output.string());

    return runFfmpeg(std::move(args), spec.output, "Mixing");
}

auto AudioTool::extract(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        double startSeconds,
                        double durationSeconds) -> VoidResult
{
    return runFfmpeg(
        {
            "-y",
            "-ss",
            seconds(startSeconds),
            "-t",
            seconds(durationSeconds),
            "-i",
            input.string(),
            "-c",
            "copy",
            output.string(),
        },
        output,
        "Excerpt extraction");
}

auto AudioTool::concat(const std::vector<std::filesystem::path>& inputs, const std::filesystem::path& output)
    -> VoidResult
{
    if (inputs.empty())
        return makeError(ErrorCode::InvalidArgument, "Nothing to concatenate");

    auto listFile = output;
    listFile += ".concat.txt";
    {
        auto stream = std::ofstream(listFile, std::ios::trunc);
        if (!stream)
            return makeError(ErrorCode::IoError, std::format("Cannot write {}", listFile.string()));
        for (const auto& input: inputs)
            stream << concatEntry(input);
        if (!stream)
        {
            removeQuietly(listFile);
            return makeError(ErrorCode::IoError, std::format("Cannot write {}", listFile.string()));
        }
    }

    auto result = runFfmpeg(
        {
            "-y",
            "-f",
            "concat",
            "-safe",
            "0",
            "-i",
            listFile.string(),
            "-c",
            "copy",
            output.string(),
        },
        output,
        "Concatenation");

    removeQuietly(listFile);
    return result;
}

auto AudioTool::runFfmpeg(std::vector<std::string> args, const std::filesystem::path& output, std::string_view what)
    -> VoidResult
{
    auto const spec = ProcessSpec {
        .command = _config.ffmpegPath,
        .args = std::move(args),
        .timeout = _config.timeout,
    };

    log::debug("Running {}", describeCommand(spec));

    auto result = _runner.run(spec);
    if (!result)
    {
        removeQuietly(output);
        return makeError(ErrorCode::MixError, std::format("{} failed: {}", what, result.error().message));
    }

    if (!result->succeeded())
    {
        removeQuietly(output);
        return makeError(ErrorCode::MixError,
                         std::format("{} failed (exit {}): {}",
                                     what,
                                     result->exitCode,
                                     log::preview(trim(result->standardError))));
    }

    if (!std::filesystem::exists(output))
        return makeError(ErrorCode::MixError, std::format("{} produced no file at {}", what, output.string()));

    return {};
}

} // namespace mindcast

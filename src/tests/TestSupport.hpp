// SPDX-License-Identifier: Apache-2.0
#pragma once

// In-memory stand-ins for the external collaborators (text generator, child processes,
// speech backend) so the pipeline can be exercised without models or ffmpeg.

#include <core/ProcessRunner.hpp>
#include <llm/TextGenerator.hpp>
#include <speech/SpeechService.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <queue>
#include <span>
#include <string>
#include <vector>

#include <unistd.h>

namespace mindcast::test
{

/// @brief Creates a fresh directory below the system temp directory and removes it afterwards.
class TempDir
{
  public:
    explicit TempDir(std::string_view name)
    {
        static auto counter = std::atomic<int> { 0 };
        _path = std::filesystem::temp_directory_path()
                / std::format("mindcast_{}_{}_{}", name, ::getpid(), counter.fetch_add(1));
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    ~TempDir()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }
    [[nodiscard]] auto operator/(std::string_view name) const -> std::filesystem::path { return _path / name; }

    /// @brief Names of the regular files currently in the directory.
    [[nodiscard]] auto files() const -> std::vector<std::string>
    {
        auto names = std::vector<std::string> {};
        for (const auto& entry: std::filesystem::directory_iterator(_path))
        {
            if (entry.is_regular_file())
                names.push_back(entry.path().filename().string());
        }
        std::ranges::sort(names);
        return names;
    }

  private:
    std::filesystem::path _path;
};

inline void writeFile(const std::filesystem::path& path, std::string_view content)
{
    auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
    file << content;
}

inline auto readFile(const std::filesystem::path& path) -> std::string
{
    auto file = std::ifstream(path, std::ios::binary);
    return { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
}

/// @brief Text generator replaying queued replies and recording every conversation it saw.
class MockTextGenerator: public TextGenerator
{
  public:
    std::queue<Result<std::string>> replies;
    std::vector<std::vector<ChatMessage>> conversations;

    auto complete(std::span<const ChatMessage> messages, const SamplerConfig& /*sampler*/)
        -> Result<std::string> override
    {
        conversations.emplace_back(messages.begin(), messages.end());
        if (replies.empty())
            return makeError(ErrorCode::InferenceError, "No more mock replies");
        auto reply = std::move(replies.front());
        replies.pop();
        return reply;
    }

    void queueReply(std::string reply) { replies.push(std::move(reply)); }
    void queueError(ErrorCode code, std::string message) { replies.push(makeError(code, std::move(message))); }
};

/// @brief Process runner that records invocations instead of spawning children.
///
/// ffprobe calls answer with the duration registered for the probed file. Every other call
/// succeeds and materialises its last argument as a small file, like an encoder writing its
/// output. A call can be scripted to fail by its index.
class FakeProcessRunner: public ProcessRunner
{
  public:
    std::vector<ProcessSpec> calls;
    std::map<std::string, double> durations;
    std::optional<std::size_t> failingCall;

    auto run(const ProcessSpec& spec) -> Result<ProcessOutput> override
    {
        auto const index = calls.size();
        calls.push_back(spec);

        if (failingCall && *failingCall == index)
            return ProcessOutput { .exitCode = 1, .standardOutput = {}, .standardError = "simulated failure" };

        if (spec.command.ends_with("ffprobe"))
        {
            auto const found = durations.find(std::filesystem::path(spec.args.back()).filename().string());
            if (found == durations.end())
                return ProcessOutput { .exitCode = 1, .standardOutput = {}, .standardError = "Invalid data found" };
            return ProcessOutput { .exitCode = 0, .standardOutput = std::format("{:.6f}\n", found->second), .standardError = {} };
        }

        if (!spec.args.empty())
            writeFile(spec.args.back(), std::format("output of call {}", index));
        return ProcessOutput {};
    }

    /// @brief The calls whose command ends with `command`.
    [[nodiscard]] auto callsTo(std::string_view command) const -> std::vector<ProcessSpec>
    {
        auto matching = std::vector<ProcessSpec> {};
        for (const auto& call: calls)
        {
            if (call.command.ends_with(command))
                matching.push_back(call);
        }
        return matching;
    }
};

/// @brief Speech backend writing the markup it receives as the "audio" content.
class FakeSpeechService: public SpeechService
{
  public:
    std::vector<SpeechRequest> requests;

    /// @brief Index of the request that fails without writing a file.
    std::optional<std::size_t> failingRequest;

    /// @brief Reports success but leaves zero-byte files.
    bool writesEmptyFiles = false;

    auto synthesize(const SpeechRequest& request) -> VoidResult override
    {
        auto const index = requests.size();
        requests.push_back(request);
        if (failingRequest && *failingRequest == index)
            return makeError(ErrorCode::SynthesisError, "simulated provider failure");
        writeFile(request.outputPath, writesEmptyFiles ? std::string_view {} : std::string_view { request.markup });
        return {};
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "fake"; }
};

} // namespace mindcast::test

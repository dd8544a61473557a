// SPDX-License-Identifier: Apache-2.0
#include "StructuredReply.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mindcast
{

namespace
{

    constexpr auto FenceOpen = std::string_view { "```json" };
    constexpr auto FenceClose = std::string_view { "```" };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

} // namespace

auto decodeStrict(std::string_view reply) -> Result<nlohmann::json>
{
    auto const body = trim(reply);
    if (body.empty())
        return makeError(ErrorCode::MalformedResponse, "Reply is empty");

    if (body.front() == '{' || body.front() == '[')
        return json::parse(body);

    auto const open = body.find(FenceOpen);
    if (open == std::string_view::npos)
        return makeError(ErrorCode::MalformedResponse, "Reply contains neither JSON nor a ```json block");

    if (body.find(FenceOpen, open + FenceOpen.size()) != std::string_view::npos)
        return makeError(ErrorCode::MalformedResponse, "Reply contains more than one ```json block");

    auto const contentStart = open + FenceOpen.size();
    auto const close = body.find(FenceClose, contentStart);
    if (close == std::string_view::npos)
        return makeError(ErrorCode::MalformedResponse, "Unterminated ```json block");

    return json::parse(trim(body.substr(contentStart, close - contentStart)));
}

auto requestStructured(TextGenerator& generator, ChatSession& session, const StructuredRequest& request)
    -> Result<nlohmann::json>
{
    auto attempts = 0;

    while (true)
    {
        log::debug("Requesting {} (prompt: {})", request.purpose, log::preview(session.lastUserMessage()));

        auto reply = generator.complete(session.messages(), request.sampler);
        if (!reply)
            return std::unexpected(reply.error());

        log::debug("{} reply: {}", request.purpose, log::preview(*reply));

        auto decoded = decodeStrict(*reply).and_then([&](nlohmann::json value) -> Result<nlohmann::json> {
            if (request.validate)
            {
                auto valid = request.validate(value);
                if (!valid)
                    return std::unexpected(valid.error());
            }
            return value;
        });

        if (decoded)
            return decoded;

        if (attempts >= request.maxReformatAttempts)
            return makeError(ErrorCode::MalformedResponse,
                             std::format("{} reply unusable after {} reformat request(s): {}",
                                         request.purpose,
                                         attempts,
                                         decoded.error().message));

        ++attempts;
        log::warning("{} reply malformed ({}), requesting reformat {}/{}",
                     request.purpose,
                     decoded.error().message,
                     attempts,
                     request.maxReformatAttempts);

        session.addAssistantMessage(std::move(*reply));
        session.addUserMessage(std::format("Your previous reply could not be used: {}.\n"
                                           "Reply again with only valid JSON and no explanation, "
                                           "using exactly this layout:\n{}",
                                           decoded.error().message,
                                           request.expectedShape));
    }
}

auto requireObject(std::vector<std::string> stringKeys,
                   std::vector<std::string> objectKeys,
                   std::vector<std::string> arrayKeys) -> SchemaCheck
{
    return [stringKeys = std::move(stringKeys),
            objectKeys = std::move(objectKeys),
            arrayKeys = std::move(arrayKeys)](const nlohmann::json& value) -> VoidResult {
        if (!value.is_object())
            return makeError(ErrorCode::MalformedResponse, "Expected a JSON object");

        for (const auto& key: stringKeys)
        {
            if (!value.contains(key) || !value[key].is_string())
                return makeError(ErrorCode::MalformedResponse, std::format("Missing string member '{}'", key));
        }
        for (const auto& key: objectKeys)
        {
            if (!value.contains(key) || !value[key].is_object())
                return makeError(ErrorCode::MalformedResponse, std::format("Missing object member '{}'", key));
        }
        for (const auto& key: arrayKeys)
        {
            if (!value.contains(key) || !value[key].is_array())
                return makeError(ErrorCode::MalformedResponse, std::format("Missing array member '{}'", key));
        }
        return {};
    };
}

} // namespace mindcast

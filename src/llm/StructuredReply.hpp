// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <llm/ChatSession.hpp>
#include <llm/Sampler.hpp>
#include <llm/TextGenerator.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace mindcast
{

/// @brief Validates the shape of a decoded reply.
using SchemaCheck = std::function<VoidResult(const nlohmann::json& value)>;

/// @brief Describes a request whose reply must decode into a JSON value of a known shape.
struct StructuredRequest
{
    /// @brief Short label used in log output, e.g. "prosody analysis".
    std::string purpose;

    /// @brief Shape check applied after a successful JSON decode.
    SchemaCheck validate;

    /// @brief Describes the expected JSON layout; sent back when a reformat is requested.
    std::string expectedShape;

    /// @brief Number of reformat requests issued after the first malformed reply.
    int maxReformatAttempts = 1;

    SamplerConfig sampler;
};

/// @brief Decodes a reply strictly.
///
/// Accepts either a reply that is a JSON document in its entirety (surrounding whitespace
/// allowed) or a reply containing exactly one fenced ```json code block. Anything else is
/// MalformedResponse.
[[nodiscard]] auto decodeStrict(std::string_view reply) -> Result<nlohmann::json>;

/// @brief Sends the session's pending user message and decodes the reply.
///
/// On a malformed reply the reply and a reformat instruction are appended to the session
/// and the request is repeated, at most StructuredRequest::maxReformatAttempts times.
/// @return The validated JSON value; MalformedResponse when every attempt failed; the
///         generator's own error when the generator itself failed.
[[nodiscard]] auto requestStructured(TextGenerator& generator, ChatSession& session, const StructuredRequest& request)
    -> Result<nlohmann::json>;

/// @brief Builds a schema check requiring the value to be a JSON object with the given members.
/// @param stringKeys Members that must be strings.
/// @param objectKeys Members that must be objects.
/// @param arrayKeys Members that must be arrays.
[[nodiscard]] auto requireObject(std::vector<std::string> stringKeys,
                                 std::vector<std::string> objectKeys,
                                 std::vector<std::string> arrayKeys) -> SchemaCheck;

} // namespace mindcast

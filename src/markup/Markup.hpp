// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mindcast::markup
{

/// @brief Kind of a node in a parsed markup document.
enum class NodeKind
{
    Element,
    Text,
    Other, ///< Comments and processing instructions.
};

/// @brief A node of a parsed markup document.
///
/// Nodes do not copy text; they record byte offsets into Document::source.
struct Node
{
    NodeKind kind = NodeKind::Text;
    std::string name;

    /// @brief [begin, end) spans the whole node including its tags.
    std::size_t begin = 0;
    std::size_t end = 0;

    /// @brief [contentBegin, contentEnd) spans the element's inner content.
    std::size_t contentBegin = 0;
    std::size_t contentEnd = 0;

    bool selfClosing = false;
    std::vector<Node> children;
};

/// @brief A parsed, well-formed markup document with a single root element.
struct Document
{
    std::string source;
    Node root;

    /// @brief Returns the source text covered by a node.
    [[nodiscard]] auto text(const Node& node) const -> std::string_view
    {
        return std::string_view(source).substr(node.begin, node.end - node.begin);
    }

    /// @brief Returns the opening tag of an element, e.g. `<prosody rate="80%">`.
    [[nodiscard]] auto openTag(const Node& node) const -> std::string_view
    {
        return std::string_view(source).substr(node.begin, node.contentBegin - node.begin);
    }

    /// @brief Returns the closing tag of an element, e.g. `</prosody>`.
    [[nodiscard]] auto closeTag(const Node& node) const -> std::string_view
    {
        return std::string_view(source).substr(node.contentEnd, node.end - node.contentEnd);
    }
};

/// @brief Parses markup into a tree.
///
/// Accepts an optional `<?xml ...?>` prolog and comments around exactly one root element.
/// Mismatched or unclosed tags are reported as MalformedMarkup.
[[nodiscard]] auto parse(std::string_view source) -> Result<Document>;

/// @brief Returns true if the text parses as a well-formed document rooted in `<speak>`.
[[nodiscard]] auto isSpeakDocument(std::string_view source) -> bool;

/// @brief Removes every tag, collapsing whitespace runs to single spaces.
///
/// Entity references such as `&amp;` are kept verbatim so the result can be re-wrapped.
[[nodiscard]] auto stripTags(std::string_view source) -> std::string;

/// @brief Replaces the predefined XML entities and numeric character references with their text.
[[nodiscard]] auto unescapeEntities(std::string_view text) -> std::string;

/// @brief Splits plain text into sentences ending in `.`, `!` or `?` followed by whitespace.
[[nodiscard]] auto splitSentences(std::string_view text) -> std::vector<std::string>;

/// @brief Finds the first `<speak ...>...</speak>` element inside free text.
[[nodiscard]] auto extractSpeak(std::string_view text) -> std::optional<std::string>;

/// @brief Returns the text unchanged if it is wrapped in `<speak>`, otherwise wraps it.
[[nodiscard]] auto ensureSpeakRoot(std::string_view text) -> std::string;

} // namespace mindcast::markup

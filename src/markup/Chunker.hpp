// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mindcast::markup
{

/// @brief Size limits for splitting markup into synthesizable fragments.
struct ChunkingOptions
{
    /// @brief Maximum size of one serialized fragment, in bytes.
    std::size_t maxChunkChars = 2900;

    /// @brief Bytes kept free when packing paragraph elements.
    std::size_t paragraphHeadroom = 10;

    /// @brief Bytes kept free when packing re-wrapped sentences.
    std::size_t sentenceHeadroom = 50;
};

/// @brief How a document was split.
enum class SplitStrategy
{
    None,       ///< The document fits and is passed through unchanged.
    Paragraphs, ///< Packed along existing paragraph-level elements.
    Sentences,  ///< Tags stripped, sentences re-wrapped.
};

/// @brief The ordered fragments of a markup document.
struct ChunkPlan
{
    std::vector<std::string> fragments;
    SplitStrategy strategy = SplitStrategy::None;
};

/// @brief Splits a markup document into fragments of at most `options.maxChunkChars` bytes.
///
/// Every fragment is a complete document rooted in `<speak>`. When paragraph elements (`<p>`, `<s>`)
/// occur at any depth, the top-level children are packed in order; an oversized wrapper is split
/// along its own children and re-opened in each of its fragments. Without paragraph structure the
/// text is stripped of tags, split into sentences and repacked.
/// @return The fragments, or InvalidArgument if the limit cannot hold even an empty wrapper.
[[nodiscard]] auto splitMarkup(std::string_view markup, const ChunkingOptions& options) -> Result<ChunkPlan>;

/// @brief Splits plain text into pieces of at most `limit` bytes at word boundaries.
///
/// Words longer than the limit are cut, never inside a UTF-8 sequence or an entity reference.
[[nodiscard]] auto splitToFit(std::string_view text, std::size_t limit) -> std::vector<std::string>;

} // namespace mindcast::markup

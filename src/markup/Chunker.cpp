// SPDX-License-Identifier: Apache-2.0
#include "Chunker.hpp"

#include <markup/Markup.hpp>

#include <algorithm>
#include <format>
#include <optional>

namespace mindcast::markup
{

namespace
{

    constexpr auto SpeakOpen = std::string_view { "<speak>" };
    constexpr auto SpeakClose = std::string_view { "</speak>" };

    /// Smallest room for text inside a fragment that still allows safe hard splits.
    constexpr auto MinCapacity = std::size_t { 16 };

    /// Longest entity reference (`&#x1F600;`) that a hard split keeps intact.
    constexpr auto MaxEntityLength = std::size_t { 10 };

    auto isSpace(char c) -> bool
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, isSpace);
    }

    auto isParagraph(const Node& node) -> bool
    {
        return node.kind == NodeKind::Element && (node.name == "p" || node.name == "s");
    }

    /// Opening and closing text that every fragment is wrapped in.
    struct Frame
    {
        std::string prefix;
        std::string suffix;

        [[nodiscard]] auto overhead() const -> std::size_t { return prefix.size() + suffix.size(); }
    };

    /// Greedily packs pieces into wrapped fragments no larger than a budget.
    class Packer
    {
      public:
        Packer(const Frame& frame, std::size_t budget, std::string_view separator, std::vector<std::string>& out):
            _frame(frame), _budget(budget), _separator(separator), _out(out)
        {
        }

        Packer(const Packer&) = delete;
        Packer& operator=(const Packer&) = delete;

        /// Room for content in an otherwise empty fragment.
        [[nodiscard]] auto capacity() const -> std::size_t
        {
            return _budget > _frame.overhead() ? _budget - _frame.overhead() : 0;
        }

        /// Appends a piece that is known to fit capacity() on its own.
        void add(std::string_view piece)
        {
            auto const separatorSize = _current.empty() ? 0 : _separator.size();
            if (_current.size() + separatorSize + piece.size() > capacity())
                flush();
            if (!_current.empty())
                _current += _separator;
            _current += piece;
        }

        void flush()
        {
            if (!isBlank(_current))
                _out.push_back(std::format("{}{}{}", _frame.prefix, _current, _frame.suffix));
            _current.clear();
        }

      private:
        const Frame& _frame;
        std::size_t _budget;
        std::string_view _separator;
        std::vector<std::string>& _out;
        std::string _current;
    };

    /// Finds a cut position at or below `limit` that splits neither a UTF-8 sequence nor an entity.
    auto safeCut(std::string_view word, std::size_t limit) -> std::size_t
    {
        auto cut = limit;
        while (cut > 0 && (static_cast<unsigned char>(word[cut]) & 0xC0) == 0x80)
            --cut;
        if (cut == 0)
            return 0;

        auto const amp = word.rfind('&', cut - 1);
        if (amp != std::string_view::npos && amp > 0)
        {
            auto const semicolon = word.find(';', amp);
            if (semicolon != std::string_view::npos && semicolon >= cut && semicolon - amp < MaxEntityLength)
                cut = amp;
        }
        return cut;
    }

    void packSentences(std::string_view plainText,
                       const Frame& frame,
                       std::size_t budget,
                       std::vector<std::string>& out)
    {
        auto packer = Packer(frame, budget, " ", out);
        for (const auto& sentence: splitSentences(plainText))
        {
            if (sentence.size() <= packer.capacity())
            {
                packer.add(sentence);
                continue;
            }
            for (const auto& piece: splitToFit(sentence, packer.capacity()))
                packer.add(piece);
        }
        packer.flush();
    }

    auto containsParagraph(const Node& node) -> bool
    {
        return std::ranges::any_of(node.children,
                                   [](const Node& child) { return isParagraph(child) || containsParagraph(child); });
    }

    /// Frame extended by the tags of `node`, or nullopt if the result leaves too little room.
    auto extendFrame(const Document& document, const Frame& frame, const Node& node, std::size_t budget)
        -> std::optional<Frame>
    {
        auto inner = frame;
        inner.prefix += document.openTag(node);
        inner.suffix.insert(0, document.closeTag(node));
        if (inner.overhead() + MinCapacity > budget)
            return std::nullopt;
        return inner;
    }

    /// Packs the children of `container` in order. Oversized wrappers holding paragraphs are
    /// descended into; other oversized children are re-split by sentences inside their own tags.
    void packChildren(const Document& document,
                      const Node& container,
                      const Frame& frame,
                      const ChunkingOptions& options,
                      std::vector<std::string>& out)
    {
        auto const paragraphBudget = options.maxChunkChars - options.paragraphHeadroom;
        auto const sentenceBudget = options.maxChunkChars - options.sentenceHeadroom;

        auto packer = Packer(frame, paragraphBudget, "", out);
        for (const auto& child: container.children)
        {
            auto const piece = document.text(child);
            if (piece.size() <= packer.capacity())
            {
                packer.add(piece);
                continue;
            }

            packer.flush();
            auto const isWrapper = child.kind == NodeKind::Element && !child.selfClosing;
            if (isWrapper && !isParagraph(child) && containsParagraph(child))
            {
                if (auto inner = extendFrame(document, frame, child, std::min(paragraphBudget, sentenceBudget)))
                {
                    packChildren(document, child, *inner, options, out);
                    continue;
                }
            }

            auto inner = std::optional<Frame> {};
            if (isWrapper)
                inner = extendFrame(document, frame, child, sentenceBudget);
            packSentences(stripTags(piece), inner.value_or(frame), sentenceBudget, out);
        }
        packer.flush();
    }

    /// Splits along paragraph elements, or returns nullopt if the document has none at any depth.
    auto splitStructured(const Document& document, const ChunkingOptions& options)
        -> std::optional<std::vector<std::string>>
    {
        if (!containsParagraph(document.root))
            return std::nullopt;

        auto const frame =
            Frame { .prefix = std::string(document.openTag(document.root)),
                    .suffix = std::string(document.closeTag(document.root)) };
        auto const paragraphBudget = options.maxChunkChars - options.paragraphHeadroom;
        auto const sentenceBudget = options.maxChunkChars - options.sentenceHeadroom;
        if (frame.overhead() + MinCapacity > std::min(paragraphBudget, sentenceBudget))
            return std::nullopt;

        auto fragments = std::vector<std::string> {};
        packChildren(document, document.root, frame, options, fragments);
        return fragments;
    }

} // namespace

auto splitToFit(std::string_view text, std::size_t limit) -> std::vector<std::string>
{
    auto pieces = std::vector<std::string> {};
    if (limit == 0)
        return pieces;

    auto current = std::string {};
    auto flush = [&] {
        if (!current.empty())
            pieces.push_back(std::move(current));
        current.clear();
    };

    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        while (pos < text.size() && isSpace(text[pos]))
            ++pos;
        auto const wordEnd = std::min(text.size(), text.find_first_of(" \t\r\n", pos));
        auto word = text.substr(pos, wordEnd - pos);
        pos = wordEnd;
        if (word.empty())
            continue;

        if (word.size() > limit)
        {
            flush();
            while (word.size() > limit)
            {
                auto const cut = std::max(safeCut(word, limit), std::size_t { 1 });
                pieces.emplace_back(word.substr(0, cut));
                word.remove_prefix(cut);
            }
            current = std::string(word);
            continue;
        }

        if (!current.empty() && current.size() + 1 + word.size() > limit)
            flush();
        if (!current.empty())
            current += ' ';
        current += word;
    }
    flush();
    return pieces;
}

auto splitMarkup(std::string_view markup, const ChunkingOptions& options) -> Result<ChunkPlan>
{
    auto const overhead = SpeakOpen.size() + SpeakClose.size();
    if (options.maxChunkChars < overhead + MinCapacity + std::max(options.sentenceHeadroom, options.paragraphHeadroom))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Chunk size limit {} is too small for wrapped fragments", options.maxChunkChars));

    if (markup.size() <= options.maxChunkChars)
        return ChunkPlan { .fragments = { std::string(markup) }, .strategy = SplitStrategy::None };

    auto document = parse(markup);
    if (!document || document->root.name != "speak")
        document = parse(std::format("{}{}{}", SpeakOpen, markup, SpeakClose));

    if (document)
    {
        if (auto fragments = splitStructured(*document, options); fragments && !fragments->empty())
            return ChunkPlan { .fragments = std::move(*fragments), .strategy = SplitStrategy::Paragraphs };
    }

    auto plan = ChunkPlan { .fragments = {}, .strategy = SplitStrategy::Sentences };
    auto const frame = Frame { .prefix = std::string(SpeakOpen), .suffix = std::string(SpeakClose) };
    packSentences(stripTags(markup), frame, options.maxChunkChars - options.sentenceHeadroom, plan.fragments);

    if (plan.fragments.empty())
        return makeError(ErrorCode::MalformedMarkup, "Markup contains no speakable text");
    return plan;
}

} // namespace mindcast::markup

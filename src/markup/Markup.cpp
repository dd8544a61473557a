// SPDX-License-Identifier: Apache-2.0
#include "Markup.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <format>
#include <utility>

namespace mindcast::markup
{

namespace
{

    constexpr auto MaxDepth = 256;

    auto isSpace(char c) -> bool
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    auto isNameChar(char c) -> bool
    {
        return !isSpace(c) && c != '/' && c != '>' && c != '<' && c != '=';
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    void appendUtf8(std::string& out, std::uint32_t codePoint)
    {
        if (codePoint < 0x80)
            out += static_cast<char>(codePoint);
        else if (codePoint < 0x800)
        {
            out += static_cast<char>(0xC0 | (codePoint >> 6));
            out += static_cast<char>(0x80 | (codePoint & 0x3F));
        }
        else if (codePoint < 0x10000)
        {
            out += static_cast<char>(0xE0 | (codePoint >> 12));
            out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codePoint & 0x3F));
        }
        else if (codePoint < 0x110000)
        {
            out += static_cast<char>(0xF0 | (codePoint >> 18));
            out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codePoint & 0x3F));
        }
    }

    class Parser
    {
      public:
        explicit Parser(std::string_view source): _src(source) {}

        auto parseDocument(Node& root) -> VoidResult
        {
            if (auto r = skipMisc(); !r)
                return r;
            if (atEnd() || _src[_pos] != '<')
                return fail("Expected a root element");

            if (auto r = parseElement(root); !r)
                return r;

            if (auto r = skipMisc(); !r)
                return r;
            if (!atEnd())
                return fail("Unexpected content after the root element");
            return {};
        }

      private:
        std::string_view _src;
        std::size_t _pos = 0;
        int _depth = 0;

        [[nodiscard]] auto atEnd() const -> bool { return _pos >= _src.size(); }

        [[nodiscard]] auto startsWith(std::string_view prefix) const -> bool
        {
            return _src.substr(_pos).starts_with(prefix);
        }

        [[nodiscard]] auto fail(std::string_view what) const -> std::unexpected<Error>
        {
            return makeError(ErrorCode::MalformedMarkup, std::format("{} at offset {}", what, _pos));
        }

        /// Skips whitespace, comments and processing instructions outside the root element.
        auto skipMisc() -> VoidResult
        {
            while (!atEnd())
            {
                if (isSpace(_src[_pos]))
                    ++_pos;
                else if (startsWith("<!--"))
                {
                    if (auto r = skipPast("-->"); !r)
                        return r;
                }
                else if (startsWith("<?"))
                {
                    if (auto r = skipPast("?>"); !r)
                        return r;
                }
                else
                    break;
            }
            return {};
        }

        auto skipPast(std::string_view terminator) -> VoidResult
        {
            auto const found = _src.find(terminator, _pos);
            if (found == std::string_view::npos)
                return fail(std::format("Missing '{}'", terminator));
            _pos = found + terminator.size();
            return {};
        }

        auto readName() -> std::string
        {
            auto const start = _pos;
            while (!atEnd() && isNameChar(_src[_pos]))
                ++_pos;
            return std::string(_src.substr(start, _pos - start));
        }

        /// Parses one element starting at '<'.
        auto parseElement(Node& node) -> VoidResult
        {
            if (++_depth > MaxDepth)
                return fail("Markup nesting too deep");

            node.kind = NodeKind::Element;
            node.begin = _pos;
            ++_pos; // '<'

            node.name = readName();
            if (node.name.empty())
                return fail("Missing element name");

            // Attributes: skip to '>' honouring quoted values
            auto quote = '\0';
            while (true)
            {
                if (atEnd())
                    return fail(std::format("Unterminated start tag <{}>", node.name));

                auto const c = _src[_pos];
                if (quote != '\0')
                {
                    if (c == quote)
                        quote = '\0';
                    ++_pos;
                    continue;
                }
                if (c == '"' || c == '\'')
                {
                    quote = c;
                    ++_pos;
                    continue;
                }
                if (c == '<')
                    return fail(std::format("Unexpected '<' inside start tag <{}>", node.name));
                if (startsWith("/>"))
                {
                    _pos += 2;
                    node.selfClosing = true;
                    node.contentBegin = node.contentEnd = node.end = _pos;
                    --_depth;
                    return {};
                }
                if (c == '>')
                {
                    ++_pos;
                    break;
                }
                ++_pos;
            }

            node.contentBegin = _pos;
            if (auto r = parseContent(node); !r)
                return r;

            // At "</"
            node.contentEnd = _pos;
            _pos += 2;
            auto const closing = readName();
            if (closing != node.name)
                return fail(std::format("Mismatched closing tag </{}> for <{}>", closing, node.name));
            while (!atEnd() && isSpace(_src[_pos]))
                ++_pos;
            if (atEnd() || _src[_pos] != '>')
                return fail(std::format("Unterminated closing tag </{}>", closing));
            ++_pos;
            node.end = _pos;
            --_depth;
            return {};
        }

        /// Parses children until the parent's closing tag.
        auto parseContent(Node& parent) -> VoidResult
        {
            while (true)
            {
                if (atEnd())
                    return fail(std::format("Unclosed element <{}>", parent.name));

                if (startsWith("</"))
                    return {};

                if (startsWith("<!--") || startsWith("<?"))
                {
                    auto other = Node { .kind = NodeKind::Other, .begin = _pos };
                    if (auto r = skipPast(startsWith("<!--") ? "-->" : "?>"); !r)
                        return r;
                    other.end = other.contentEnd = _pos;
                    parent.children.push_back(std::move(other));
                    continue;
                }

                if (startsWith("<![CDATA["))
                {
                    auto cdata = Node { .kind = NodeKind::Text, .begin = _pos };
                    if (auto r = skipPast("]]>"); !r)
                        return r;
                    cdata.end = cdata.contentEnd = _pos;
                    parent.children.push_back(std::move(cdata));
                    continue;
                }

                if (_src[_pos] == '<')
                {
                    auto child = Node {};
                    if (auto r = parseElement(child); !r)
                        return r;
                    parent.children.push_back(std::move(child));
                    continue;
                }

                auto text = Node { .kind = NodeKind::Text, .begin = _pos };
                auto const next = _src.find('<', _pos);
                _pos = next == std::string_view::npos ? _src.size() : next;
                text.end = text.contentEnd = _pos;
                text.contentBegin = text.begin;
                parent.children.push_back(std::move(text));
            }
        }
    };

} // namespace

auto parse(std::string_view source) -> Result<Document>
{
    auto document = Document { .source = std::string(source), .root = {} };
    auto parser = Parser(document.source);
    if (auto r = parser.parseDocument(document.root); !r)
        return std::unexpected(r.error());
    return document;
}

auto isSpeakDocument(std::string_view source) -> bool
{
    auto const document = parse(source);
    return document && document->root.name == "speak";
}

auto stripTags(std::string_view source) -> std::string
{
    auto result = std::string {};
    result.reserve(source.size());

    auto inTag = false;
    auto pendingSpace = false;
    for (auto const c: source)
    {
        if (inTag)
        {
            if (c == '>')
            {
                inTag = false;
                pendingSpace = true;
            }
            continue;
        }
        if (c == '<')
        {
            inTag = true;
            continue;
        }
        if (isSpace(c))
        {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !result.empty())
            result += ' ';
        pendingSpace = false;
        result += c;
    }
    return result;
}

auto unescapeEntities(std::string_view text) -> std::string
{
    static constexpr auto Named = std::array<std::pair<std::string_view, char>, 5> { {
        { "amp", '&' },
        { "lt", '<' },
        { "gt", '>' },
        { "quot", '"' },
        { "apos", '\'' },
    } };

    auto result = std::string {};
    result.reserve(text.size());

    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        auto const amp = text.find('&', pos);
        auto const semicolon = amp == std::string_view::npos ? amp : text.find(';', amp);
        if (semicolon == std::string_view::npos)
        {
            result += text.substr(pos);
            break;
        }

        result += text.substr(pos, amp - pos);
        auto const name = text.substr(amp + 1, semicolon - amp - 1);
        pos = semicolon + 1;

        if (auto const it = std::ranges::find(Named, name, &std::pair<std::string_view, char>::first); it != Named.end())
        {
            result += it->second;
            continue;
        }

        if (name.size() > 1 && name.front() == '#')
        {
            auto const hex = name[1] == 'x' || name[1] == 'X';
            auto const digits = name.substr(hex ? 2 : 1);
            auto codePoint = std::uint32_t { 0 };
            auto const [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), codePoint, hex ? 16 : 10);
            if (ec == std::errc {} && ptr == digits.data() + digits.size() && !digits.empty())
            {
                appendUtf8(result, codePoint);
                continue;
            }
        }

        // Unknown reference: keep verbatim
        result += text.substr(amp, semicolon - amp + 1);
    }
    return result;
}

auto splitSentences(std::string_view text) -> std::vector<std::string>
{
    auto sentences = std::vector<std::string> {};
    auto start = std::size_t { 0 };

    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        auto const c = text[i];
        if (c != '.' && c != '!' && c != '?')
            continue;

        // Closing quotes and brackets belong to the sentence they end
        auto end = i + 1;
        while (end < text.size() && (text[end] == '"' || text[end] == '\'' || text[end] == ')'))
            ++end;

        if (end < text.size() && !isSpace(text[end]))
            continue;

        auto const sentence = trim(text.substr(start, end - start));
        if (!sentence.empty())
            sentences.emplace_back(sentence);
        start = end;
        i = end;
    }

    auto const rest = trim(text.substr(std::min(start, text.size())));
    if (!rest.empty())
        sentences.emplace_back(rest);
    return sentences;
}

auto extractSpeak(std::string_view text) -> std::optional<std::string>
{
    auto searchFrom = std::size_t { 0 };
    while (true)
    {
        auto const open = text.find("<speak", searchFrom);
        if (open == std::string_view::npos)
            return std::nullopt;

        auto const after = open + 6;
        if (after < text.size() && (text[after] == '>' || isSpace(text[after])))
        {
            auto const close = text.find("</speak>", after);
            if (close == std::string_view::npos)
                return std::nullopt;
            return std::string(text.substr(open, close + 8 - open));
        }
        searchFrom = after;
    }
}

auto ensureSpeakRoot(std::string_view text) -> std::string
{
    auto const body = trim(text);
    if (body.starts_with("<speak") && body.ends_with("</speak>"))
        return std::string(body);
    return std::format("<speak>{}</speak>", body);
}

} // namespace mindcast::markup

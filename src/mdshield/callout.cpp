#include "callout.hpp"

#include "ast.hpp"
#include "tree_map.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mdshield {

namespace {

using cc = callout_color;

constexpr std::array<callout_kind, callout_catalogue_size> catalogue{{
    {"note", cc::blue, "pencil", "\xE2\x9C\x8F\xEF\xB8\x8F"},
    {"abstract", cc::cyan, "doc.text", "\xF0\x9F\x93\x8B"},
    {"summary", cc::cyan, "doc.text", "\xF0\x9F\x93\x8B"},
    {"info", cc::blue, "info.circle", "\xE2\x84\xB9\xEF\xB8\x8F"},
    {"todo", cc::blue, "checkmark.circle", "\xE2\x98\x91\xEF\xB8\x8F"},
    {"tip", cc::cyan, "lightbulb", "\xF0\x9F\x92\xA1"},
    {"hint", cc::cyan, "lightbulb", "\xF0\x9F\x92\xA1"},
    {"important", cc::cyan, "lightbulb", "\xF0\x9F\x92\xA1"},
    {"success", cc::green, "checkmark.circle.fill", "\xE2\x9C\x85"},
    {"check", cc::green, "checkmark.circle.fill", "\xE2\x9C\x85"},
    {"done", cc::green, "checkmark.circle.fill", "\xE2\x9C\x85"},
    {"question", cc::orange, "questionmark.circle", "\xE2\x9D\x93"},
    {"help", cc::orange, "questionmark.circle", "\xE2\x9D\x93"},
    {"faq", cc::orange, "questionmark.circle", "\xE2\x9D\x93"},
    {"warning", cc::orange, "exclamationmark.triangle",
        "\xE2\x9A\xA0\xEF\xB8\x8F"},
    {"caution", cc::orange, "exclamationmark.triangle",
        "\xE2\x9A\xA0\xEF\xB8\x8F"},
    {"attention", cc::orange, "exclamationmark.triangle",
        "\xE2\x9A\xA0\xEF\xB8\x8F"},
    {"failure", cc::red, "xmark.circle", "\xE2\x9D\x8C"},
    {"fail", cc::red, "xmark.circle", "\xE2\x9D\x8C"},
    {"missing", cc::red, "xmark.circle", "\xE2\x9D\x8C"},
    {"danger", cc::red, "xmark.octagon", "\xF0\x9F\x9B\x91"},
    {"error", cc::red, "xmark.octagon", "\xF0\x9F\x9B\x91"},
    {"bug", cc::red, "ladybug", "\xF0\x9F\x90\x9B"},
    {"example", cc::purple, "list.bullet", "\xF0\x9F\x93\x9D"},
    {"quote", cc::gray, "quote.opening", "\xF0\x9F\x92\xAC"},
    {"cite", cc::gray, "quote.opening", "\xF0\x9F\x92\xAC"},
}};

constexpr callout_kind neutral_kind{
    "", cc::neutral, "info.circle", "\xE2\x84\xB9\xEF\xB8\x8F"};

[[nodiscard]] bool is_space(const char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] std::string to_lower(const std::string_view s)
{
    std::string result{s};

    std::transform(result.begin(), result.end(), result.begin(),
        [](const unsigned char c) { return std::tolower(c); });

    return result;
}

[[nodiscard]] std::string_view trim_leading(std::string_view s) noexcept
{
    while (!s.empty() && is_space(s.front()))
    {
        s.remove_prefix(1);
    }

    return s;
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    s = trim_leading(s);

    while (!s.empty() && is_space(s.back()))
    {
        s.remove_suffix(1);
    }

    return s;
}

[[nodiscard]] bool is_identifier_char(const char c) noexcept
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           c == '-';
}

struct marker_match
{
    std::string _type;
    std::optional<std::string> _title;
    std::string _rest; // same-line text left after the marker and title
};

// `^\[!([a-zA-Z0-9_-]+)\](?:\s+(.+))?` where `.` stops at a line break.
[[nodiscard]] std::optional<marker_match> match_marker(
    const std::string_view text)
{
    if (text.size() < 4 || text[0] != '[' || text[1] != '!')
    {
        return std::nullopt;
    }

    std::size_t i = 2;
    while (i < text.size() && is_identifier_char(text[i]))
    {
        ++i;
    }

    if (i == 2 || i >= text.size() || text[i] != ']')
    {
        return std::nullopt;
    }

    marker_match result{._type = to_lower(text.substr(2, i - 2)),
        ._title = std::nullopt,
        ._rest = {}};

    std::size_t match_end = i + 1;

    std::size_t title_begin = match_end;
    while (title_begin < text.size() && is_space(text[title_begin]))
    {
        ++title_begin;
    }

    const std::size_t title_end =
        std::min(text.find('\n', title_begin), text.size());

    if (title_begin > match_end && title_end > title_begin)
    {
        const std::string_view title =
            trim(text.substr(title_begin, title_end - title_begin));

        if (!title.empty())
        {
            result._title = std::string{title};
            match_end = title_end;
        }
    }

    result._rest = std::string{trim(text.substr(match_end))};
    return result;
}

// Drops leading soft breaks and whitespace-only text. With
// `trim_first_text`, leading whitespace of the first remaining text goes too.
[[nodiscard]] inline_list strip_leading_blanks(
    inline_list inlines, const bool trim_first_text)
{
    std::size_t n_dropped = 0;

    for (; n_dropped < inlines.size(); ++n_dropped)
    {
        const inline_node& node = inlines[n_dropped];

        if (node.is<inl::soft_break>())
        {
            continue;
        }

        const inl::text* t = node.get_if<inl::text>();
        if (t == nullptr || !trim_leading(t->content).empty())
        {
            break;
        }
    }

    inlines.erase(inlines.begin(), inlines.begin() + n_dropped);

    if (trim_first_text && !inlines.empty())
    {
        if (const inl::text* t = inlines.front().get_if<inl::text>())
        {
            inlines.front() = text(std::string{trim_leading(t->content)});
        }
    }

    return inlines;
}

// Replaces the first paragraph of `children` by `inlines`, or drops it if
// nothing is left.
[[nodiscard]] block_list replace_first_paragraph(
    block_list children, inline_list inlines)
{
    if (inlines.empty())
    {
        children.erase(children.begin());
    }
    else
    {
        children.front() = paragraph(std::move(inlines));
    }

    return children;
}

[[nodiscard]] std::optional<block_node> parse_marker_callout(
    const inline_list& inlines, const block_list& children)
{
    const inl::text* first = inlines.front().get_if<inl::text>();
    if (first == nullptr)
    {
        return std::nullopt;
    }

    std::optional<marker_match> match = match_marker(first->content);
    if (!match.has_value())
    {
        return std::nullopt;
    }

    inline_list remaining = inlines;

    if (match->_rest.empty())
    {
        remaining.erase(remaining.begin());
        remaining = strip_leading_blanks(std::move(remaining), false);
    }
    else
    {
        remaining.front() = text(std::move(match->_rest));
    }

    return callout(std::move(match->_type), std::move(match->_title),
        rewrite_callouts(
            replace_first_paragraph(children, std::move(remaining))));
}

[[nodiscard]] std::optional<block_node> parse_label_callout(
    const inline_list& inlines, const block_list& children)
{
    const inl::strong* label = inlines.front().get_if<inl::strong>();
    if (label == nullptr || label->children.size() != 1)
    {
        return std::nullopt;
    }

    const inl::text* label_text = label->children.front().get_if<inl::text>();
    if (label_text == nullptr)
    {
        return std::nullopt;
    }

    const std::optional<callout_kind> kind =
        find_callout_kind(trim(label_text->content));

    if (!kind.has_value())
    {
        return std::nullopt;
    }

    inline_list remaining{inlines.begin() + 1, inlines.end()};
    remaining = strip_leading_blanks(std::move(remaining), true);

    return callout(std::string{kind->_name}, std::nullopt,
        rewrite_callouts(
            replace_first_paragraph(children, std::move(remaining))));
}

[[nodiscard]] std::optional<block_node> parse_callout(
    const block_list& children)
{
    if (children.empty())
    {
        return std::nullopt;
    }

    const blk::paragraph* first = children.front().get_if<blk::paragraph>();
    if (first == nullptr || first->inlines.empty())
    {
        return std::nullopt;
    }

    if (std::optional<block_node> result =
            parse_marker_callout(first->inlines, children);
        result.has_value())
    {
        return result;
    }

    return parse_label_callout(first->inlines, children);
}

} // namespace

const std::array<callout_kind, callout_catalogue_size>&
callout_catalogue() noexcept
{
    return catalogue;
}

std::optional<callout_kind> find_callout_kind(
    const std::string_view name) noexcept
{
    const auto it = std::find_if(catalogue.begin(), catalogue.end(),
        [&](const callout_kind& kind)
        {
            return std::equal(kind._name.begin(), kind._name.end(),
                name.begin(), name.end(),
                [](const char a, const unsigned char b)
                { return a == std::tolower(b); });
        });

    if (it == catalogue.end())
    {
        return std::nullopt;
    }

    return *it;
}

callout_kind callout_kind_or_neutral(const std::string_view name) noexcept
{
    return find_callout_kind(name).value_or(neutral_kind);
}

std::string_view css_color_of(const callout_color color) noexcept
{
    switch (color)
    {
        case callout_color::blue: return "#3b82f6";
        case callout_color::cyan: return "#06b6d4";
        case callout_color::green: return "#22c55e";
        case callout_color::orange: return "#f97316";
        case callout_color::red: return "#ef4444";
        case callout_color::purple: return "#a855f7";
        case callout_color::gray: return "#6b7280";
        case callout_color::neutral: break;
    }

    return "#6b7280";
}

std::string display_title(const blk::callout& callout)
{
    if (callout.title.has_value())
    {
        return *callout.title;
    }

    std::string result = callout.type;

    if (!result.empty())
    {
        result.front() = static_cast<char>(
            std::toupper(static_cast<unsigned char>(result.front())));
    }

    return result;
}

block_list rewrite_callouts(const block_list& blocks)
{
    block_list result;
    result.reserve(blocks.size());

    for (const block_node& node : blocks)
    {
        if (const blk::blockquote* quote = node.get_if<blk::blockquote>())
        {
            if (std::optional<block_node> c = parse_callout(quote->children);
                c.has_value())
            {
                result.push_back(std::move(*c));
                continue;
            }
        }

        result.push_back(map_block_children(node, rewrite_callouts));
    }

    return result;
}

} // namespace mdshield

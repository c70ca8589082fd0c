#include "restorer.hpp"

#include "ast.hpp"
#include "overloaded.hpp"
#include "sentinel.hpp"
#include "tree_map.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mdshield {

namespace {

// A text leaf is split around the sentinels of the family being restored;
// every other node is kept whole.
using token = std::variant<sentinel, inline_node>;
using token_list = std::vector<token>;

struct pair_rule
{
    sentinel _open;
    std::optional<sentinel> _separator;
    sentinel _close;
};

[[nodiscard]] std::optional<pair_rule> rule_for_open(const sentinel& s)
{
    namespace ss = sentinels;

    constexpr pair_rule rules[]{
        {ss::addition_open, std::nullopt, ss::addition_close},
        {ss::deletion_open, std::nullopt, ss::deletion_close},
        {ss::substitution_open, ss::substitution_separator,
            ss::substitution_close},
        {ss::comment_open, std::nullopt, ss::comment_close},
        {ss::critic_highlight_open, std::nullopt, ss::critic_highlight_close},
        {ss::math_open, std::nullopt, ss::math_close},
    };

    for (const pair_rule& r : rules)
    {
        if (r._open._code_point == s._code_point)
        {
            return r;
        }
    }

    return std::nullopt;
}

[[nodiscard]] inline_node literal_of(const sentinel& s)
{
    return text(std::string{s._literal});
}

[[nodiscard]] bool is_sentinel(const token& t, const sentinel& s) noexcept
{
    const sentinel* const p = std::get_if<sentinel>(&t);
    return p != nullptr && p->_code_point == s._code_point;
}

[[nodiscard]] std::optional<std::size_t> find_sentinel(const token_list& tokens,
    const std::size_t begin, const std::size_t end, const sentinel& s)
{
    for (std::size_t i = begin; i < end; ++i)
    {
        if (is_sentinel(tokens[i], s))
        {
            return i;
        }
    }

    return std::nullopt;
}

[[nodiscard]] inline_list restore_family(
    const inline_list& inlines, syntax_family family);

void split_text(token_list& out, const std::string& content,
    const syntax_family family)
{
    std::size_t segment_begin = 0;

    for (std::size_t i = 0; i < content.size();)
    {
        const std::optional<sentinel> s = sentinel_at(content, i);

        if (!s.has_value() || s->_family != family)
        {
            ++i;
            continue;
        }

        if (i > segment_begin)
        {
            out.emplace_back(
                text(content.substr(segment_begin, i - segment_begin)));
        }

        out.emplace_back(*s);
        i += sentinels::utf8_size;
        segment_begin = i;
    }

    if (segment_begin < content.size())
    {
        out.emplace_back(text(content.substr(segment_begin)));
    }
}

[[nodiscard]] token_list tokenize(
    const inline_list& inlines, const syntax_family family)
{
    token_list result;
    result.reserve(inlines.size());

    const auto on_inlines = [family](const inline_list& children)
    { return restore_family(children, family); };

    const auto on_literal = [family](const std::string& s)
    { return unshield(s, family); };

    for (const inline_node& node : inlines)
    {
        if (const inl::text* t = node.get_if<inl::text>())
        {
            split_text(result, t->content, family);
            continue;
        }

        result.emplace_back(map_inline_children(node, on_inlines, on_literal));
    }

    return result;
}

[[nodiscard]] inline_list assemble(const token_list& tokens, std::size_t begin,
    std::size_t end, syntax_family family);

[[nodiscard]] std::optional<inline_node> make_math(
    const token_list& tokens, const std::size_t begin, const std::size_t end)
{
    std::string expression;

    for (std::size_t i = begin; i < end; ++i)
    {
        const inline_node* node = std::get_if<inline_node>(&tokens[i]);
        if (node == nullptr)
        {
            return std::nullopt;
        }

        const inl::text* t = node->get_if<inl::text>();
        if (t == nullptr)
        {
            return std::nullopt;
        }

        expression += t->content;
    }

    if (expression.empty())
    {
        return std::nullopt;
    }

    return math(std::move(expression));
}

[[nodiscard]] inline_node make_container(
    const sentinel& open, inline_list children)
{
    namespace ss = sentinels;

    const char32_t cp = open._code_point;

    if (cp == ss::addition_open._code_point)
    {
        return critic_addition(std::move(children));
    }

    if (cp == ss::deletion_open._code_point)
    {
        return critic_deletion(std::move(children));
    }

    if (cp == ss::comment_open._code_point)
    {
        return critic_comment(std::move(children));
    }

    return critic_highlight(std::move(children));
}

// Pairs `tokens[idx]` with its nearest closing sentinel inside `[idx, end)`.
// Returns the node and the index of the closing token.
[[nodiscard]] std::optional<std::pair<inline_node, std::size_t>> match_pair(
    const token_list& tokens, const std::size_t idx, const std::size_t end,
    const pair_rule& rule, const syntax_family family)
{
    std::size_t content_begin = idx + 1;
    std::optional<std::size_t> separator_idx;

    if (rule._separator.has_value())
    {
        separator_idx =
            find_sentinel(tokens, content_begin, end, *rule._separator);

        if (!separator_idx.has_value())
        {
            return std::nullopt;
        }

        content_begin = *separator_idx + 1;
    }

    const std::optional<std::size_t> close_idx =
        find_sentinel(tokens, content_begin, end, rule._close);

    if (!close_idx.has_value())
    {
        return std::nullopt;
    }

    if (rule._open._family == syntax_family::math)
    {
        std::optional<inline_node> node =
            make_math(tokens, idx + 1, *close_idx);

        if (!node.has_value())
        {
            return std::nullopt;
        }

        return std::pair{std::move(*node), *close_idx};
    }

    if (separator_idx.has_value())
    {
        return std::pair{
            critic_substitution(
                assemble(tokens, idx + 1, *separator_idx, family),
                assemble(tokens, *separator_idx + 1, *close_idx, family)),
            *close_idx};
    }

    return std::pair{make_container(rule._open,
                         assemble(tokens, idx + 1, *close_idx, family)),
        *close_idx};
}

inline_list assemble(const token_list& tokens, const std::size_t begin,
    const std::size_t end, const syntax_family family)
{
    inline_list result;

    for (std::size_t i = begin; i < end; ++i)
    {
        if (const inline_node* node = std::get_if<inline_node>(&tokens[i]))
        {
            result.push_back(*node);
            continue;
        }

        const sentinel& s = std::get<sentinel>(tokens[i]);

        if (const std::optional<pair_rule> rule = rule_for_open(s);
            rule.has_value())
        {
            if (auto matched = match_pair(tokens, i, end, *rule, family);
                matched.has_value())
            {
                result.push_back(std::move(matched->first));
                i = matched->second;
                continue;
            }
        }

        // Stray closing delimiter, separator, divider or unmatched opening.
        result.push_back(literal_of(s));
    }

    return coalesce_text(std::move(result));
}

//
// Highlights
// ----------------------------------------------------------------------------

enum class highlight_state : std::uint8_t
{
    outside,
    collecting
};

struct highlight_scan
{
    highlight_state _state{highlight_state::outside};
    inline_list _output;
    inline_list _buffer;
};

[[nodiscard]] highlight_scan step_highlight(
    highlight_scan scan, const token& t)
{
    if (const inline_node* node = std::get_if<inline_node>(&t))
    {
        (scan._state == highlight_state::outside ? scan._output : scan._buffer)
            .push_back(*node);

        return scan;
    }

    const sentinel& s = std::get<sentinel>(t);
    const bool is_open =
        s._code_point == sentinels::highlight_open._code_point;

    if (scan._state == highlight_state::outside)
    {
        if (is_open)
        {
            scan._state = highlight_state::collecting;
        }
        else
        {
            scan._output.push_back(literal_of(s));
        }

        return scan;
    }

    if (is_open)
    {
        scan._buffer.push_back(literal_of(s));
        return scan;
    }

    inline_list children = coalesce_text(std::move(scan._buffer));
    scan._buffer.clear();
    scan._state = highlight_state::outside;

    if (children.empty())
    {
        scan._output.push_back(literal_of(sentinels::highlight_open));
        scan._output.push_back(literal_of(s));
        return scan;
    }

    scan._output.push_back(highlight(std::move(children)));
    return scan;
}

// Unterminated highlight: the opening delimiter and everything collected
// after it are emitted as they were.
[[nodiscard]] inline_list finish_highlight_scan(highlight_scan scan)
{
    if (scan._state == highlight_state::collecting)
    {
        scan._output.push_back(literal_of(sentinels::highlight_open));

        for (inline_node& node : scan._buffer)
        {
            scan._output.push_back(std::move(node));
        }
    }

    return coalesce_text(std::move(scan._output));
}

inline_list restore_family(
    const inline_list& inlines, const syntax_family family)
{
    const token_list tokens = tokenize(inlines, family);

    if (family == syntax_family::highlight)
    {
        return finish_highlight_scan(std::accumulate(
            tokens.begin(), tokens.end(), highlight_scan{}, step_highlight));
    }

    return assemble(tokens, 0, tokens.size(), family);
}

[[nodiscard]] block_list restore_family(
    const block_list& blocks, const syntax_family family)
{
    return map_blocks(
        blocks,
        [family](const inline_list& inlines)
        { return restore_family(inlines, family); },
        [family](const std::string& s) { return unshield(s, family); });
}

[[nodiscard]] bool node_contains_sentinels(const inline_node& node)
{
    return std::visit(
        overloaded{
            [](const inl::link& n)
            {
                return contains_sentinel(n.destination) ||
                       contains_sentinels(n.children);
            },
            [](const inl::image& n)
            {
                return contains_sentinel(n.source) ||
                       contains_sentinels(n.children);
            },
            [](const inl::critic_substitution& n)
            {
                return contains_sentinels(n.old_children) ||
                       contains_sentinels(n.new_children);
            },
            []<typename Tag>(const inl::leaf<Tag>& n)
            { return contains_sentinel(n.content); },
            []<typename Tag>(const inl::mark<Tag>&) { return false; },
            []<typename Tag>(const inl::container<Tag>& n)
            { return contains_sentinels(n.children); }},
        node.value);
}

[[nodiscard]] bool any_list_item_contains_sentinels(const auto& items)
{
    return std::any_of(items.begin(), items.end(),
        [](const auto& item) { return contains_sentinels(item.children); });
}

[[nodiscard]] bool node_contains_sentinels(const block_node& node)
{
    return std::visit(
        overloaded{
            [](const blk::blockquote& b)
            { return contains_sentinels(b.children); },
            [](const blk::callout& b)
            {
                return (b.title.has_value() && contains_sentinel(*b.title)) ||
                       contains_sentinels(b.children);
            },
            [](const blk::bulleted_list& b)
            { return any_list_item_contains_sentinels(b.items); },
            [](const blk::numbered_list& b)
            { return any_list_item_contains_sentinels(b.items); },
            [](const blk::task_list& b)
            { return any_list_item_contains_sentinels(b.items); },
            [](const blk::paragraph& b)
            { return contains_sentinels(b.inlines); },
            [](const blk::heading& b)
            { return contains_sentinels(b.inlines); },
            [](const blk::code_block& b)
            {
                return (b.fence_info.has_value() &&
                           contains_sentinel(*b.fence_info)) ||
                       contains_sentinel(b.content);
            },
            [](const blk::html_block& b)
            { return contains_sentinel(b.content); },
            [](const blk::table& b)
            {
                for (const blk::table_row& row : b.rows)
                {
                    for (const blk::table_cell& cell : row.cells)
                    {
                        if (contains_sentinels(cell.inlines))
                        {
                            return true;
                        }
                    }
                }

                return false;
            },
            [](const blk::thematic_break&) { return false; }},
        node.value);
}

} // namespace

inline_list restore_image_dimensions(const inline_list& inlines)
{
    return restore_family(inlines, syntax_family::image_dimensions);
}

block_list restore_image_dimensions(const block_list& blocks)
{
    return restore_family(blocks, syntax_family::image_dimensions);
}

inline_list restore_highlights(const inline_list& inlines)
{
    return restore_family(inlines, syntax_family::highlight);
}

block_list restore_highlights(const block_list& blocks)
{
    return restore_family(blocks, syntax_family::highlight);
}

inline_list restore_critic_markup(const inline_list& inlines)
{
    return restore_family(inlines, syntax_family::critic_markup);
}

block_list restore_critic_markup(const block_list& blocks)
{
    return restore_family(blocks, syntax_family::critic_markup);
}

inline_list restore_math(const inline_list& inlines)
{
    return restore_family(inlines, syntax_family::math);
}

block_list restore_math(const block_list& blocks)
{
    return restore_family(blocks, syntax_family::math);
}

bool contains_sentinels(const inline_list& inlines)
{
    return std::any_of(inlines.begin(), inlines.end(),
        [](const inline_node& n) { return node_contains_sentinels(n); });
}

bool contains_sentinels(const block_list& blocks)
{
    return std::any_of(blocks.begin(), blocks.end(),
        [](const block_node& n) { return node_contains_sentinels(n); });
}

} // namespace mdshield

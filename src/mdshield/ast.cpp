#include "ast.hpp"

#include "overloaded.hpp"

#include <string>
#include <utility>
#include <variant>

namespace mdshield {

namespace inl {

bool operator==(const link& lhs, const link& rhs)
{
    return lhs.destination == rhs.destination && lhs.children == rhs.children;
}

bool operator==(const image& lhs, const image& rhs)
{
    return lhs.source == rhs.source && lhs.children == rhs.children;
}

bool operator==(const critic_substitution& lhs, const critic_substitution& rhs)
{
    return lhs.old_children == rhs.old_children &&
           lhs.new_children == rhs.new_children;
}

} // namespace inl

bool operator==(const inline_node& lhs, const inline_node& rhs)
{
    return lhs.value == rhs.value;
}

namespace blk {

bool operator==(const list_item& lhs, const list_item& rhs)
{
    return lhs.children == rhs.children;
}

bool operator==(const task_list_item& lhs, const task_list_item& rhs)
{
    return lhs.completed == rhs.completed && lhs.children == rhs.children;
}

bool operator==(const table_cell& lhs, const table_cell& rhs)
{
    return lhs.inlines == rhs.inlines;
}

bool operator==(const table_row& lhs, const table_row& rhs)
{
    return lhs.cells == rhs.cells;
}

bool operator==(const blockquote& lhs, const blockquote& rhs)
{
    return lhs.children == rhs.children;
}

bool operator==(const callout& lhs, const callout& rhs)
{
    return lhs.type == rhs.type && lhs.title == rhs.title &&
           lhs.children == rhs.children;
}

bool operator==(const bulleted_list& lhs, const bulleted_list& rhs)
{
    return lhs.tight == rhs.tight && lhs.items == rhs.items;
}

bool operator==(const numbered_list& lhs, const numbered_list& rhs)
{
    return lhs.tight == rhs.tight && lhs.start == rhs.start &&
           lhs.items == rhs.items;
}

bool operator==(const task_list& lhs, const task_list& rhs)
{
    return lhs.tight == rhs.tight && lhs.items == rhs.items;
}

bool operator==(const paragraph& lhs, const paragraph& rhs)
{
    return lhs.inlines == rhs.inlines;
}

bool operator==(const heading& lhs, const heading& rhs)
{
    return lhs.level == rhs.level && lhs.inlines == rhs.inlines;
}

bool operator==(const code_block& lhs, const code_block& rhs)
{
    return lhs.fence_info == rhs.fence_info && lhs.content == rhs.content;
}

bool operator==(const html_block& lhs, const html_block& rhs)
{
    return lhs.content == rhs.content;
}

bool operator==(const table& lhs, const table& rhs)
{
    return lhs.alignments == rhs.alignments && lhs.rows == rhs.rows;
}

bool operator==(const thematic_break&, const thematic_break&)
{
    return true;
}

} // namespace blk

bool operator==(const block_node& lhs, const block_node& rhs)
{
    return lhs.value == rhs.value;
}

// ----------------------------------------------------------------------------

inline_node text(std::string content)
{
    return make_inline(inl::text{std::move(content)});
}

inline_node soft_break()
{
    return make_inline(inl::soft_break{});
}

inline_node line_break()
{
    return make_inline(inl::line_break{});
}

inline_node code(std::string content)
{
    return make_inline(inl::code{std::move(content)});
}

inline_node html(std::string content)
{
    return make_inline(inl::html{std::move(content)});
}

inline_node math(std::string raw_expression)
{
    return make_inline(inl::math{std::move(raw_expression)});
}

inline_node emphasis(inline_list children)
{
    return make_inline(inl::emphasis{std::move(children)});
}

inline_node strong(inline_list children)
{
    return make_inline(inl::strong{std::move(children)});
}

inline_node strikethrough(inline_list children)
{
    return make_inline(inl::strikethrough{std::move(children)});
}

inline_node highlight(inline_list children)
{
    return make_inline(inl::highlight{std::move(children)});
}

inline_node link(std::string destination, inline_list children)
{
    return make_inline(
        inl::link{std::move(destination), std::move(children)});
}

inline_node image(std::string source, inline_list children)
{
    return make_inline(inl::image{std::move(source), std::move(children)});
}

inline_node critic_addition(inline_list children)
{
    return make_inline(inl::critic_addition{std::move(children)});
}

inline_node critic_deletion(inline_list children)
{
    return make_inline(inl::critic_deletion{std::move(children)});
}

inline_node critic_substitution(
    inline_list old_children, inline_list new_children)
{
    return make_inline(inl::critic_substitution{
        std::move(old_children), std::move(new_children)});
}

inline_node critic_comment(inline_list children)
{
    return make_inline(inl::critic_comment{std::move(children)});
}

inline_node critic_highlight(inline_list children)
{
    return make_inline(inl::critic_highlight{std::move(children)});
}

block_node paragraph(inline_list inlines)
{
    return make_block(blk::paragraph{std::move(inlines)});
}

block_node heading(const int level, inline_list inlines)
{
    return make_block(blk::heading{level, std::move(inlines)});
}

block_node blockquote(block_list children)
{
    return make_block(blk::blockquote{std::move(children)});
}

block_node callout(std::string type, std::optional<std::string> title,
    block_list children)
{
    return make_block(blk::callout{
        std::move(type), std::move(title), std::move(children)});
}

// ----------------------------------------------------------------------------

static void append_plain_text(std::string& out, const inline_list& inlines)
{
    for (const inline_node& node : inlines)
    {
        std::visit(
            overloaded{                                               //
                [&](const inl::text& n) { out.append(n.content); },   //
                [&](const inl::code& n) { out.append(n.content); },   //
                [&](const inl::math& n) { out.append(n.content); },   //
                [&](const inl::html&) {},                             //
                [&](const inl::soft_break&) { out.append(1, ' '); },  //
                [&](const inl::line_break&) { out.append(1, ' '); },  //
                [&](const inl::link& n)
                { append_plain_text(out, n.children); },
                [&](const inl::image& n)
                { append_plain_text(out, n.children); },
                [&](const inl::critic_substitution& n)
                {
                    append_plain_text(out, n.old_children);
                    append_plain_text(out, n.new_children);
                },
                [&](const auto& n) { append_plain_text(out, n.children); }},
            node.value);
    }
}

std::string plain_text(const inline_list& inlines)
{
    std::string result;
    append_plain_text(result, inlines);
    return result;
}

inline_list coalesce_text(inline_list inlines)
{
    inline_list result;
    result.reserve(inlines.size());

    for (inline_node& node : inlines)
    {
        if (auto* t = std::get_if<inl::text>(&node.value))
        {
            if (t->content.empty())
            {
                continue;
            }

            if (!result.empty())
            {
                if (auto* prev = std::get_if<inl::text>(&result.back().value))
                {
                    prev->content.append(t->content);
                    continue;
                }
            }
        }

        result.push_back(std::move(node));
    }

    return result;
}

} // namespace mdshield

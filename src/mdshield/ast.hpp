#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mdshield {

struct inline_node;
struct block_node;

using inline_list = std::vector<inline_node>;
using block_list = std::vector<block_node>;

// ----------------------------------------------------------------------------
// Inline nodes
// ----------------------------------------------------------------------------

namespace inl {

template <typename Tag>
struct leaf
{
    std::string content;
};

template <typename Tag>
struct mark
{
};

template <typename Tag>
struct container
{
    inline_list children;
};

struct text_tag;
struct code_tag;
struct html_tag;
struct math_tag;
struct soft_break_tag;
struct line_break_tag;
struct emphasis_tag;
struct strong_tag;
struct strikethrough_tag;
struct highlight_tag;
struct critic_addition_tag;
struct critic_deletion_tag;
struct critic_comment_tag;
struct critic_highlight_tag;

using text = leaf<text_tag>;
using code = leaf<code_tag>;
using html = leaf<html_tag>;
using math = leaf<math_tag>; // `content` is the raw expression

using soft_break = mark<soft_break_tag>;
using line_break = mark<line_break_tag>;

using emphasis = container<emphasis_tag>;
using strong = container<strong_tag>;
using strikethrough = container<strikethrough_tag>;
using highlight = container<highlight_tag>;
using critic_addition = container<critic_addition_tag>;
using critic_deletion = container<critic_deletion_tag>;
using critic_comment = container<critic_comment_tag>;
using critic_highlight = container<critic_highlight_tag>;

struct link
{
    std::string destination;
    inline_list children;
};

struct image
{
    std::string source;
    inline_list children; // alt text
};

struct critic_substitution
{
    inline_list old_children;
    inline_list new_children;
};

template <typename Tag>
[[nodiscard]] bool operator==(const leaf<Tag>& lhs, const leaf<Tag>& rhs)
{
    return lhs.content == rhs.content;
}

template <typename Tag>
[[nodiscard]] bool operator==(const mark<Tag>&, const mark<Tag>&)
{
    return true;
}

template <typename Tag>
[[nodiscard]] bool operator==(
    const container<Tag>& lhs, const container<Tag>& rhs)
{
    return lhs.children == rhs.children;
}

[[nodiscard]] bool operator==(const link& lhs, const link& rhs);
[[nodiscard]] bool operator==(const image& lhs, const image& rhs);
[[nodiscard]] bool operator==(
    const critic_substitution& lhs, const critic_substitution& rhs);

} // namespace inl

struct inline_node
{
    using variant_type = std::variant<inl::text, inl::soft_break,
        inl::line_break, inl::code, inl::html, inl::emphasis, inl::strong,
        inl::strikethrough, inl::highlight, inl::link, inl::image,
        inl::critic_addition, inl::critic_deletion, inl::critic_substitution,
        inl::critic_comment, inl::critic_highlight, inl::math>;

    variant_type value;

    template <typename T>
    [[nodiscard]] bool is() const noexcept
    {
        return std::holds_alternative<T>(value);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept
    {
        return std::get_if<T>(&value);
    }
};

[[nodiscard]] bool operator==(const inline_node& lhs, const inline_node& rhs);

// ----------------------------------------------------------------------------
// Block nodes
// ----------------------------------------------------------------------------

enum class column_alignment : std::uint8_t
{
    none,
    left,
    center,
    right
};

namespace blk {

struct list_item
{
    block_list children;
};

struct task_list_item
{
    bool completed;
    block_list children;
};

struct table_cell
{
    inline_list inlines;
};

struct table_row
{
    std::vector<table_cell> cells;
};

struct blockquote
{
    block_list children;
};

struct callout
{
    std::string type; // lower-cased
    std::optional<std::string> title;
    block_list children;
};

struct bulleted_list
{
    bool tight;
    std::vector<list_item> items;
};

struct numbered_list
{
    bool tight;
    std::uint32_t start;
    std::vector<list_item> items;
};

struct task_list
{
    bool tight;
    std::vector<task_list_item> items;
};

struct paragraph
{
    inline_list inlines;
};

struct heading
{
    int level; // 1-6
    inline_list inlines;
};

struct code_block
{
    std::optional<std::string> fence_info;
    std::string content;
};

struct html_block
{
    std::string content;
};

// The first row is the header row.
struct table
{
    std::vector<column_alignment> alignments;
    std::vector<table_row> rows;
};

struct thematic_break
{
};

[[nodiscard]] bool operator==(const list_item& lhs, const list_item& rhs);
[[nodiscard]] bool operator==(
    const task_list_item& lhs, const task_list_item& rhs);
[[nodiscard]] bool operator==(const table_cell& lhs, const table_cell& rhs);
[[nodiscard]] bool operator==(const table_row& lhs, const table_row& rhs);
[[nodiscard]] bool operator==(const blockquote& lhs, const blockquote& rhs);
[[nodiscard]] bool operator==(const callout& lhs, const callout& rhs);
[[nodiscard]] bool operator==(
    const bulleted_list& lhs, const bulleted_list& rhs);
[[nodiscard]] bool operator==(
    const numbered_list& lhs, const numbered_list& rhs);
[[nodiscard]] bool operator==(const task_list& lhs, const task_list& rhs);
[[nodiscard]] bool operator==(const paragraph& lhs, const paragraph& rhs);
[[nodiscard]] bool operator==(const heading& lhs, const heading& rhs);
[[nodiscard]] bool operator==(const code_block& lhs, const code_block& rhs);
[[nodiscard]] bool operator==(const html_block& lhs, const html_block& rhs);
[[nodiscard]] bool operator==(const table& lhs, const table& rhs);
[[nodiscard]] bool operator==(
    const thematic_break& lhs, const thematic_break& rhs);

} // namespace blk

struct block_node
{
    using variant_type = std::variant<blk::blockquote, blk::callout,
        blk::bulleted_list, blk::numbered_list, blk::task_list,
        blk::paragraph, blk::heading, blk::code_block, blk::html_block,
        blk::table, blk::thematic_break>;

    variant_type value;

    template <typename T>
    [[nodiscard]] bool is() const noexcept
    {
        return std::holds_alternative<T>(value);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept
    {
        return std::get_if<T>(&value);
    }
};

[[nodiscard]] bool operator==(const block_node& lhs, const block_node& rhs);

// ----------------------------------------------------------------------------
// Construction helpers
// ----------------------------------------------------------------------------

template <typename T>
[[nodiscard]] inline_node make_inline(T&& alternative)
{
    return inline_node{std::forward<T>(alternative)};
}

template <typename T>
[[nodiscard]] block_node make_block(T&& alternative)
{
    return block_node{std::forward<T>(alternative)};
}

[[nodiscard]] inline_node text(std::string content);
[[nodiscard]] inline_node soft_break();
[[nodiscard]] inline_node line_break();
[[nodiscard]] inline_node code(std::string content);
[[nodiscard]] inline_node html(std::string content);
[[nodiscard]] inline_node math(std::string raw_expression);
[[nodiscard]] inline_node emphasis(inline_list children);
[[nodiscard]] inline_node strong(inline_list children);
[[nodiscard]] inline_node strikethrough(inline_list children);
[[nodiscard]] inline_node highlight(inline_list children);
[[nodiscard]] inline_node link(std::string destination, inline_list children);
[[nodiscard]] inline_node image(std::string source, inline_list children);
[[nodiscard]] inline_node critic_addition(inline_list children);
[[nodiscard]] inline_node critic_deletion(inline_list children);
[[nodiscard]] inline_node critic_substitution(
    inline_list old_children, inline_list new_children);
[[nodiscard]] inline_node critic_comment(inline_list children);
[[nodiscard]] inline_node critic_highlight(inline_list children);

[[nodiscard]] block_node paragraph(inline_list inlines);
[[nodiscard]] block_node heading(int level, inline_list inlines);
[[nodiscard]] block_node blockquote(block_list children);
[[nodiscard]] block_node callout(std::string type,
    std::optional<std::string> title, block_list children);

// ----------------------------------------------------------------------------
// Queries
// ----------------------------------------------------------------------------

// Concatenates text, code and math content; breaks become spaces.
[[nodiscard]] std::string plain_text(const inline_list& inlines);

// Merges runs of adjacent `text` nodes and drops empty ones.
[[nodiscard]] inline_list coalesce_text(inline_list inlines);

} // namespace mdshield

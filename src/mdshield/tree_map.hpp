#pragma once

#include "ast.hpp"
#include "overloaded.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mdshield {

// Rebuilds a block whose variant owns child blocks, applying `on_blocks` to
// every child sequence (blockquote, callout and list item bodies). Leaf
// blocks and blocks that only hold inlines are returned unchanged.
template <typename BlocksFn>
[[nodiscard]] block_node map_block_children(
    const block_node& node, BlocksFn&& on_blocks)
{
    return std::visit(
        overloaded{
            [&](const blk::blockquote& b)
            { return make_block(blk::blockquote{on_blocks(b.children)}); },
            [&](const blk::callout& b)
            {
                return make_block(
                    blk::callout{b.type, b.title, on_blocks(b.children)});
            },
            [&](const blk::bulleted_list& b)
            {
                std::vector<blk::list_item> items;
                items.reserve(b.items.size());

                for (const blk::list_item& item : b.items)
                {
                    items.push_back(blk::list_item{on_blocks(item.children)});
                }

                return make_block(blk::bulleted_list{b.tight, std::move(items)});
            },
            [&](const blk::numbered_list& b)
            {
                std::vector<blk::list_item> items;
                items.reserve(b.items.size());

                for (const blk::list_item& item : b.items)
                {
                    items.push_back(blk::list_item{on_blocks(item.children)});
                }

                return make_block(
                    blk::numbered_list{b.tight, b.start, std::move(items)});
            },
            [&](const blk::task_list& b)
            {
                std::vector<blk::task_list_item> items;
                items.reserve(b.items.size());

                for (const blk::task_list_item& item : b.items)
                {
                    items.push_back(blk::task_list_item{
                        item.completed, on_blocks(item.children)});
                }

                return make_block(blk::task_list{b.tight, std::move(items)});
            },
            [&](const auto&) { return node; }},
        node.value);
}

// Rebuilds `blocks`, applying `on_inlines` to every block-level inline
// sequence (paragraphs, headings, table cells) and `on_literal` to every
// raw string (code block content and fence info, HTML block content, callout
// titles).
template <typename InlinesFn, typename LiteralFn>
[[nodiscard]] block_list map_blocks(
    const block_list& blocks, InlinesFn&& on_inlines, LiteralFn&& on_literal)
{
    block_list result;
    result.reserve(blocks.size());

    const auto recurse = [&](const block_list& children)
    { return map_blocks(children, on_inlines, on_literal); };

    for (const block_node& node : blocks)
    {
        result.push_back(std::visit(
            overloaded{
                [&](const blk::paragraph& b)
                { return make_block(blk::paragraph{on_inlines(b.inlines)}); },
                [&](const blk::heading& b)
                {
                    return make_block(
                        blk::heading{b.level, on_inlines(b.inlines)});
                },
                [&](const blk::code_block& b)
                {
                    std::optional<std::string> fence_info;
                    if (b.fence_info.has_value())
                    {
                        fence_info = on_literal(*b.fence_info);
                    }

                    return make_block(blk::code_block{
                        std::move(fence_info), on_literal(b.content)});
                },
                [&](const blk::html_block& b)
                { return make_block(blk::html_block{on_literal(b.content)}); },
                [&](const blk::callout& b)
                {
                    std::optional<std::string> title;
                    if (b.title.has_value())
                    {
                        title = on_literal(*b.title);
                    }

                    return make_block(blk::callout{
                        b.type, std::move(title), recurse(b.children)});
                },
                [&](const blk::table& b)
                {
                    std::vector<blk::table_row> rows;
                    rows.reserve(b.rows.size());

                    for (const blk::table_row& row : b.rows)
                    {
                        blk::table_row& new_row = rows.emplace_back();
                        new_row.cells.reserve(row.cells.size());

                        for (const blk::table_cell& cell : row.cells)
                        {
                            new_row.cells.push_back(
                                blk::table_cell{on_inlines(cell.inlines)});
                        }
                    }

                    return make_block(blk::table{b.alignments, std::move(rows)});
                },
                [&](const auto&) { return map_block_children(node, recurse); }},
            node.value));
    }

    return result;
}

// Rebuilds one inline node: container children go through `on_inlines`,
// literal leaves (code, HTML) and link/image targets through `on_literal`.
// `text`, `math` and breaks are returned unchanged.
template <typename InlinesFn, typename LiteralFn>
[[nodiscard]] inline_node map_inline_children(
    const inline_node& node, InlinesFn&& on_inlines, LiteralFn&& on_literal)
{
    return std::visit(
        overloaded{
            [&](const inl::code& n)
            { return make_inline(inl::code{on_literal(n.content)}); },
            [&](const inl::html& n)
            { return make_inline(inl::html{on_literal(n.content)}); },
            [&](const inl::link& n)
            {
                return make_inline(inl::link{
                    on_literal(n.destination), on_inlines(n.children)});
            },
            [&](const inl::image& n)
            {
                return make_inline(
                    inl::image{on_literal(n.source), on_inlines(n.children)});
            },
            [&](const inl::critic_substitution& n)
            {
                return make_inline(inl::critic_substitution{
                    on_inlines(n.old_children), on_inlines(n.new_children)});
            },
            [&]<typename Tag>(const inl::container<Tag>& n)
            {
                return make_inline(
                    inl::container<Tag>{on_inlines(n.children)});
            },
            [&](const auto&) { return node; }},
        node.value);
}

} // namespace mdshield

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mdshield/ast.hpp>
#include <mdshield/restorer.hpp>
#include <mdshield/sentinel.hpp>
#include <mdshield/tree_dump.hpp>

#include <optional>
#include <string>
#include <utility>

namespace ss = mdshield::sentinels;

using mdshield::block_list;
using mdshield::inline_list;

namespace {

[[nodiscard]] std::string s(const mdshield::sentinel& x)
{
    return std::string{x._utf8};
}

void require_same(const inline_list& actual, const inline_list& expected)
{
    REQUIRE(mdshield::dump_tree(actual) == mdshield::dump_tree(expected));
    REQUIRE(actual == expected);
}

void require_same(const block_list& actual, const block_list& expected)
{
    REQUIRE(mdshield::dump_tree(actual) == mdshield::dump_tree(expected));
    REQUIRE(actual == expected);
}

} // namespace

using namespace mdshield;

//
// Highlights
// ----------------------------------------------------------------------------

TEST_CASE("restore_highlights #0")
{
    const inline_list in{
        text("Hello " + s(ss::highlight_open) + "world" +
             s(ss::highlight_close) + ".")};

    require_same(restore_highlights(in),
        {text("Hello "), highlight({text("world")}), text(".")});
}

TEST_CASE("restore_highlights #1")
{
    const inline_list in{
        text("This has " + s(ss::highlight_open) + "highlighted "),
        strong({text("bold")}),
        text(" text" + s(ss::highlight_close) + " here.")};

    require_same(restore_highlights(in),
        {text("This has "),
            highlight({text("highlighted "), strong({text("bold")}),
                text(" text")}),
            text(" here.")});
}

TEST_CASE("restore_highlights #2")
{
    const inline_list in{text(s(ss::highlight_open) + "first" +
                              s(ss::highlight_close) + " and " +
                              s(ss::highlight_open) + "second" +
                              s(ss::highlight_close))};

    require_same(restore_highlights(in),
        {highlight({text("first")}), text(" and "),
            highlight({text("second")})});
}

TEST_CASE("restore_highlights unterminated")
{
    const inline_list in{
        text("a " + s(ss::highlight_open) + "b"), strong({text("c")})};

    require_same(
        restore_highlights(in), {text("a ==b"), strong({text("c")})});
}

TEST_CASE("restore_highlights stray close")
{
    const inline_list in{text("a" + s(ss::highlight_close) + "b")};
    require_same(restore_highlights(in), {text("a==b")});
}

TEST_CASE("restore_highlights nested containers")
{
    const inline_list in{link("https://example.com",
        {text(s(ss::highlight_open) + "x" + s(ss::highlight_close))})};

    require_same(restore_highlights(in),
        {link("https://example.com", {highlight({text("x")})})});
}

TEST_CASE("restore_highlights literal leaves")
{
    const inline_list in{
        code("a" + s(ss::highlight_open) + "b" + s(ss::highlight_close)),
        html("<b>" + s(ss::highlight_open) + "</b>")};

    require_same(
        restore_highlights(in), {code("a==b=="), html("<b>==</b>")});
}

TEST_CASE("restore_highlights leaves other families alone")
{
    const inline_list in{text(s(ss::addition_open) + "x")};
    require_same(restore_highlights(in), in);
}

//
// Editorial markup
// ----------------------------------------------------------------------------

TEST_CASE("restore_critic_markup substitution")
{
    const inline_list in{text("Replace " + s(ss::substitution_open) + "old" +
                              s(ss::substitution_separator) + "new" +
                              s(ss::substitution_close) + " text.")};

    require_same(restore_critic_markup(in),
        {text("Replace "),
            critic_substitution({text("old")}, {text("new")}),
            text(" text.")});
}

TEST_CASE("restore_critic_markup kinds")
{
    const inline_list in{text(s(ss::addition_open) + "a" +
                              s(ss::addition_close) + s(ss::deletion_open) +
                              "d" + s(ss::deletion_close) +
                              s(ss::comment_open) + "c" +
                              s(ss::comment_close) +
                              s(ss::critic_highlight_open) + "h" +
                              s(ss::critic_highlight_close))};

    require_same(restore_critic_markup(in),
        {critic_addition({text("a")}), critic_deletion({text("d")}),
            critic_comment({text("c")}), critic_highlight({text("h")})});
}

TEST_CASE("restore_critic_markup across siblings")
{
    const inline_list in{text("x " + s(ss::addition_open)),
        strong({text("bold")}), text(" text" + s(ss::addition_close) + " y")};

    require_same(restore_critic_markup(in),
        {text("x "), critic_addition({strong({text("bold")}), text(" text")}),
            text(" y")});
}

TEST_CASE("restore_critic_markup nested")
{
    const inline_list in{text(s(ss::addition_open) + "x " +
                              s(ss::comment_open) + "c" +
                              s(ss::comment_close) + s(ss::addition_close))};

    require_same(restore_critic_markup(in),
        {critic_addition({text("x "), critic_comment({text("c")})})});
}

TEST_CASE("restore_critic_markup degradation")
{
    require_same(restore_critic_markup(
                     inline_list{text("a" + s(ss::addition_open) + "b")}),
        {text("a{++b")});

    require_same(restore_critic_markup(
                     inline_list{text("a" + s(ss::deletion_close) + "b")}),
        {text("a--}b")});

    require_same(
        restore_critic_markup(inline_list{text(s(ss::substitution_open) +
                                               "x" +
                                               s(ss::substitution_close))}),
        {text("{~~x~~}")});

    require_same(restore_critic_markup(inline_list{
                     text("a" + s(ss::substitution_separator) + "b")}),
        {text("a~>b")});
}

//
// Math
// ----------------------------------------------------------------------------

TEST_CASE("restore_math #0")
{
    const inline_list in{
        text("e = " + s(ss::math_open) + "mc^2" + s(ss::math_close) + "!")};

    require_same(restore_math(in), {text("e = "), math("mc^2"), text("!")});
}

TEST_CASE("restore_math interrupted")
{
    const inline_list in{text(s(ss::math_open) + "a"), emphasis({text("b")}),
        text(s(ss::math_close))};

    require_same(
        restore_math(in), {text("$a"), emphasis({text("b")}), text("$")});
}

TEST_CASE("restore_math code span")
{
    const inline_list in{
        code(s(ss::math_open) + "a\\*b" + s(ss::math_close))};

    require_same(restore_math(in), {code("$a*b$")});
}

//
// Image dimensions
// ----------------------------------------------------------------------------

TEST_CASE("restore_image_dimensions")
{
    const inline_list in{
        image("a.png", {text("photo" + s(ss::image_divider) + "300")}),
        text(" " + s(ss::image_divider))};

    require_same(restore_image_dimensions(in),
        {image("a.png", {text("photo|300")}), text(" |")});
}

//
// Block traversal
// ----------------------------------------------------------------------------

TEST_CASE("restore passes reach every block")
{
    const std::string hl =
        s(ss::highlight_open) + "x" + s(ss::highlight_close);

    blk::table table{
        .alignments = {column_alignment::none},
        .rows = {blk::table_row{{blk::table_cell{{text("h")}}}},
            blk::table_row{{blk::table_cell{{text(hl)}}}}}};

    blk::bulleted_list list{.tight = true,
        .items = {blk::list_item{{paragraph({text(hl)})}}}};

    const block_list in{blockquote({heading(2, {text(hl)})}),
        callout("note", hl, {paragraph({text(hl)})}),
        make_block(std::move(table)), make_block(std::move(list)),
        make_block(blk::code_block{std::nullopt, hl})};

    blk::table expected_table{
        .alignments = {column_alignment::none},
        .rows = {blk::table_row{{blk::table_cell{{text("h")}}}},
            blk::table_row{
                {blk::table_cell{{highlight({text("x")})}}}}}};

    blk::bulleted_list expected_list{.tight = true,
        .items = {
            blk::list_item{{paragraph({highlight({text("x")})})}}}};

    const block_list expected{
        blockquote({heading(2, {highlight({text("x")})})}),
        callout("note", "==x==", {paragraph({highlight({text("x")})})}),
        make_block(std::move(expected_table)),
        make_block(std::move(expected_list)),
        make_block(blk::code_block{std::nullopt, "==x=="})};

    const block_list out = restore_highlights(in);

    require_same(out, expected);
    REQUIRE(!contains_sentinels(out));
    REQUIRE(contains_sentinels(in));
}

TEST_CASE("restore passes are idempotent")
{
    const block_list in{paragraph({text("a " + s(ss::highlight_open) + "b" +
                                        s(ss::highlight_close) + " " +
                                        s(ss::math_open) + "x" +
                                        s(ss::math_close))})};

    const block_list once = restore_math(restore_highlights(in));
    const block_list twice = restore_math(restore_highlights(once));

    require_same(twice, once);
}

TEST_CASE("contains_sentinels")
{
    REQUIRE(!contains_sentinels(block_list{}));
    REQUIRE(!contains_sentinels(block_list{paragraph({text("plain")})}));

    REQUIRE(contains_sentinels(
        block_list{paragraph({link(s(ss::image_divider), {text("x")})})}));

    REQUIRE(contains_sentinels(inline_list{
        critic_substitution({}, {emphasis({text(s(ss::math_close))})})}));
}

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mdshield/ast.hpp>
#include <mdshield/tree_dump.hpp>

#include <optional>
#include <sstream>
#include <utility>

using namespace mdshield;

TEST_CASE("dump_tree inlines")
{
    const inline_list inlines{text("Hello "), highlight({text("world")}),
        soft_break(), link("u", {code("x")}), math("a\\b")};

    REQUIRE(dump_tree(inlines) == R"(text "Hello "
highlight
  text "world"
soft_break
link "u"
  code "x"
math "a\\b"
)");
}

TEST_CASE("dump_tree escapes")
{
    REQUIRE(dump_tree(inline_list{text("a\"b\n\t\x01")}) ==
            "text \"a\\\"b\\n\\t\\x01\"\n");
}

TEST_CASE("dump_tree critic_substitution")
{
    REQUIRE(dump_tree(inline_list{critic_substitution(
                {text("old")}, {emphasis({text("new")})})}) ==
            R"(critic_substitution
  old
    text "old"
  new
    emphasis
      text "new"
)");
}

TEST_CASE("dump_tree blocks")
{
    blk::task_list tasks{.tight = true,
        .items = {blk::task_list_item{true, {paragraph({text("a")})}},
            blk::task_list_item{false, {paragraph({text("b")})}}}};

    blk::numbered_list numbered{.tight = false,
        .start = 2,
        .items = {blk::list_item{{paragraph({text("c")})}}}};

    blk::table table{.alignments = {column_alignment::none,
                         column_alignment::right},
        .rows = {blk::table_row{{blk::table_cell{{text("h1")}},
            blk::table_cell{{text("h2")}}}}}};

    const block_list blocks{heading(2, {text("T")}),
        callout("note", "Title", {paragraph({text("x")})}),
        make_block(std::move(tasks)), make_block(std::move(numbered)),
        make_block(blk::code_block{"cpp", "int x;\n"}),
        make_block(std::move(table)), make_block(blk::thematic_break{})};

    REQUIRE(dump_tree(blocks) == R"(heading 2
  text "T"
callout "note" "Title"
  paragraph
    text "x"
task_list tight
  item [x]
    paragraph
      text "a"
  item [ ]
    paragraph
      text "b"
numbered_list start=2
  item
    paragraph
      text "c"
code_block "cpp"
  "int x;\n"
table none right
  row
    cell
      text "h1"
    cell
      text "h2"
thematic_break
)");
}

TEST_CASE("dump_tree stream overload")
{
    std::ostringstream oss;
    dump_tree(oss, block_list{blockquote({})});

    REQUIRE(oss.str() == "blockquote\n");
}

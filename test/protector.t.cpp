#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mdshield/protector.hpp>
#include <mdshield/sentinel.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ss = mdshield::sentinels;

namespace {

[[nodiscard]] std::string s(const mdshield::sentinel& x)
{
    return std::string{x._utf8};
}

void require_protected(const mdshield::protect_result& result,
    const std::string_view expected)
{
    REQUIRE(result._matched);
    REQUIRE(result._text == expected);
}

void require_unchanged(
    const mdshield::protect_result& result, const std::string_view source)
{
    REQUIRE(!result._matched);
    REQUIRE(result._text == source);
}

} // namespace

TEST_CASE("mark_code_regions #0")
{
    const std::string_view source = "a `b` c";
    const std::vector<bool> mask = mdshield::mark_code_regions(source);

    REQUIRE(mask.size() == source.size());

    for (std::size_t i = 0; i < source.size(); ++i)
    {
        REQUIRE(mask[i] == (i >= 2 && i <= 4));
    }
}

TEST_CASE("mark_code_regions #1")
{
    const std::string_view source = "x\n```js\na\n```\ny";
    const std::vector<bool> mask = mdshield::mark_code_regions(source);

    REQUIRE(!mask[0]);
    REQUIRE(mask[2]);
    REQUIRE(mask[8]);
    REQUIRE(mask[13]);
    REQUIRE(!mask[source.size() - 1]);
}

TEST_CASE("mark_code_regions #2")
{
    // Unclosed backticks are literal.
    const std::vector<bool> mask = mdshield::mark_code_regions("a ``b` c");

    for (const bool b : mask)
    {
        REQUIRE(!b);
    }
}

TEST_CASE("protect_highlights #0")
{
    require_protected(mdshield::protect_highlights("Hello ==world==."),
        "Hello " + s(ss::highlight_open) + "world" + s(ss::highlight_close) +
            ".");
}

TEST_CASE("protect_highlights #1")
{
    require_protected(
        mdshield::protect_highlights("==first== and ==second=="),
        s(ss::highlight_open) + "first" + s(ss::highlight_close) + " and " +
            s(ss::highlight_open) + "second" + s(ss::highlight_close));
}

TEST_CASE("protect_highlights #2")
{
    require_protected(
        mdshield::protect_highlights("==a **b** c=="),
        s(ss::highlight_open) + "a **b** c" + s(ss::highlight_close));
}

TEST_CASE("protect_highlights unmatched")
{
    require_unchanged(mdshield::protect_highlights("a = b"), "a = b");
    require_unchanged(mdshield::protect_highlights("====="), "=====");
    require_unchanged(mdshield::protect_highlights("===b==="), "===b===");
    require_unchanged(mdshield::protect_highlights("==a\nb=="), "==a\nb==");
    require_unchanged(mdshield::protect_highlights("==open"), "==open");
}

TEST_CASE("protect_highlights code")
{
    require_protected(mdshield::protect_highlights("`==x==` and ==y=="),
        "`==x==` and " + s(ss::highlight_open) + "y" +
            s(ss::highlight_close));

    require_unchanged(mdshield::protect_highlights("```\n==x==\n```\n"),
        "```\n==x==\n```\n");

    require_unchanged(mdshield::protect_highlights("> ~~~\n> ==x==\n> ~~~\n"),
        "> ~~~\n> ==x==\n> ~~~\n");
}

TEST_CASE("protect_highlights fence ends with its container")
{
    const std::string hl =
        s(ss::highlight_open) + "x" + s(ss::highlight_close);

    require_protected(
        mdshield::protect_highlights("> ```\n> code\n\n==x==\n"),
        "> ```\n> code\n\n" + hl + "\n");

    require_protected(
        mdshield::protect_highlights("> ```\n> code\n==x==\n"),
        "> ```\n> code\n" + hl + "\n");

    require_protected(
        mdshield::protect_highlights("- ```\n  code\n- ==x==\n"),
        "- ```\n  code\n- " + hl + "\n");

    require_protected(
        mdshield::protect_highlights("1. a\n\n   ```\n   b\n\n==x==\n"),
        "1. a\n\n   ```\n   b\n\n" + hl + "\n");
}

TEST_CASE("protect_highlights fence inside list item")
{
    require_unchanged(
        mdshield::protect_highlights("- ```\n  ==x==\n\n  ==y==\n  ```\n"),
        "- ```\n  ==x==\n\n  ==y==\n  ```\n");

    require_unchanged(
        mdshield::protect_highlights("> - ~~~\n>   ==x==\n"),
        "> - ~~~\n>   ==x==\n");
}

TEST_CASE("protect_highlights code span stops at block boundaries")
{
    const std::string hl =
        s(ss::highlight_open) + "x" + s(ss::highlight_close);

    require_protected(mdshield::protect_highlights("# a `b\n==x== `c`\n"),
        "# a `b\n" + hl + " `c`\n");

    require_protected(
        mdshield::protect_highlights("- a `b\n- ==x== `c`\n"),
        "- a `b\n- " + hl + " `c`\n");

    require_protected(
        mdshield::protect_highlights("a `b\n> ==x== `c`\n"),
        "a `b\n> " + hl + " `c`\n");

    require_protected(
        mdshield::protect_highlights("a `b\n## ==x== `c`\n"),
        "a `b\n## " + hl + " `c`\n");

    // A paragraph continuation line keeps the span open.
    require_unchanged(mdshield::protect_highlights("a `b\n==x== c`\n"),
        "a `b\n==x== c`\n");

    require_unchanged(
        mdshield::protect_highlights("- a `b\n  ==x== c`\n"),
        "- a `b\n  ==x== c`\n");
}

TEST_CASE("protect_critic_markup #0")
{
    require_protected(
        mdshield::protect_critic_markup("Replace {~~old~>new~~} text."),
        "Replace " + s(ss::substitution_open) + "old" +
            s(ss::substitution_separator) + "new" +
            s(ss::substitution_close) + " text.");
}

TEST_CASE("protect_critic_markup #1")
{
    require_protected(mdshield::protect_critic_markup(
                          "{++add++} {--del--} {>>note<<} {==mark==}"),
        s(ss::addition_open) + "add" + s(ss::addition_close) + " " +
            s(ss::deletion_open) + "del" + s(ss::deletion_close) + " " +
            s(ss::comment_open) + "note" + s(ss::comment_close) + " " +
            s(ss::critic_highlight_open) + "mark" +
            s(ss::critic_highlight_close));
}

TEST_CASE("protect_critic_markup multiline")
{
    require_protected(mdshield::protect_critic_markup("{++first\nsecond++}"),
        s(ss::addition_open) + "first\nsecond" + s(ss::addition_close));
}

TEST_CASE("protect_critic_markup narrowest match")
{
    require_protected(mdshield::protect_critic_markup("{++a++} b {++c++}"),
        s(ss::addition_open) + "a" + s(ss::addition_close) + " b " +
            s(ss::addition_open) + "c" + s(ss::addition_close));
}

TEST_CASE("protect_critic_markup unmatched")
{
    require_unchanged(
        mdshield::protect_critic_markup("{++never closed"), "{++never closed");

    require_unchanged(
        mdshield::protect_critic_markup("{~~no separator~~}"),
        "{~~no separator~~}");

    require_unchanged(mdshield::protect_critic_markup("{++++}"), "{++++}");
}

TEST_CASE("protect_critic_markup code")
{
    require_unchanged(mdshield::protect_critic_markup("`{++x++}`"),
        "`{++x++}`");
}

TEST_CASE("protect_image_dimensions #0")
{
    require_protected(
        mdshield::protect_image_dimensions("![photo|300x200](img.png)"),
        "![photo" + s(ss::image_divider) + "300x200](img.png)");
}

TEST_CASE("protect_image_dimensions #1")
{
    require_protected(
        mdshield::protect_image_dimensions("| ![a|40](x.png) | b |"),
        "| ![a" + s(ss::image_divider) + "40](x.png) | b |");
}

TEST_CASE("protect_image_dimensions unmatched")
{
    require_unchanged(
        mdshield::protect_image_dimensions("![alt](a.png)"), "![alt](a.png)");

    require_unchanged(
        mdshield::protect_image_dimensions("[a|b](x)"), "[a|b](x)");

    require_unchanged(
        mdshield::protect_image_dimensions("![a|b]()"), "![a|b]()");
}

TEST_CASE("protect_inline_math #0")
{
    require_protected(mdshield::protect_inline_math("Energy $E=mc^2$ here"),
        "Energy " + s(ss::math_open) + "E\\=mc\\^2" + s(ss::math_close) +
            " here");
}

TEST_CASE("protect_inline_math #1")
{
    require_protected(mdshield::protect_inline_math("$x$ and $y$"),
        s(ss::math_open) + "x" + s(ss::math_close) + " and " +
            s(ss::math_open) + "y" + s(ss::math_close));
}

TEST_CASE("protect_inline_math unmatched")
{
    require_unchanged(mdshield::protect_inline_math("$$x$$"), "$$x$$");
    require_unchanged(mdshield::protect_inline_math("$5"), "$5");
    require_unchanged(mdshield::protect_inline_math("$a\nb$"), "$a\nb$");
    require_unchanged(mdshield::protect_inline_math("`$x$`"), "`$x$`");
}

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mdshield/sentinel.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace ss = mdshield::sentinels;

namespace {

[[nodiscard]] std::string s(const mdshield::sentinel& x)
{
    return std::string{x._utf8};
}

} // namespace

TEST_CASE("sentinels are distinct private-use code points")
{
    std::set<char32_t> code_points;
    std::set<std::string_view> encodings;

    for (const mdshield::sentinel& x : ss::all)
    {
        REQUIRE(x._code_point >= 0xE000);
        REQUIRE(x._code_point <= 0xF8FF);
        REQUIRE(x._utf8.size() == ss::utf8_size);
        REQUIRE(!x._literal.empty());

        code_points.insert(x._code_point);
        encodings.insert(x._utf8);
    }

    REQUIRE(code_points.size() == ss::all.size());
    REQUIRE(encodings.size() == ss::all.size());
}

TEST_CASE("sentinel_at #0")
{
    const std::string text = "ab" + s(ss::math_open) + "c";

    REQUIRE(!mdshield::sentinel_at(text, 0).has_value());
    REQUIRE(!mdshield::sentinel_at(text, 1).has_value());

    const std::optional<mdshield::sentinel> found =
        mdshield::sentinel_at(text, 2);

    REQUIRE(found.has_value());
    REQUIRE(found->_code_point == ss::math_open._code_point);
    REQUIRE(found->_family == mdshield::syntax_family::math);

    // Continuation bytes never start a sentinel.
    REQUIRE(!mdshield::sentinel_at(text, 3).has_value());
    REQUIRE(!mdshield::sentinel_at(text, 5).has_value());
}

TEST_CASE("sentinel_at #1")
{
    // U+E0FF is private-use but not registered.
    const std::string text = "\xEE\x83\xBF";
    REQUIRE(!mdshield::sentinel_at(text, 0).has_value());
    REQUIRE(!mdshield::contains_sentinel(text));
}

TEST_CASE("contains_sentinel")
{
    REQUIRE(!mdshield::contains_sentinel(""));
    REQUIRE(!mdshield::contains_sentinel("plain == text $ {++ ++}"));
    REQUIRE(mdshield::contains_sentinel("x" + s(ss::comment_close)));
}

TEST_CASE("unshield #0")
{
    const std::string text = s(ss::highlight_open) + "a" +
                             s(ss::addition_open) + "b" +
                             s(ss::addition_close) +
                             s(ss::highlight_close);

    REQUIRE(mdshield::unshield(text, mdshield::syntax_family::highlight) ==
            "==a" + s(ss::addition_open) + "b" + s(ss::addition_close) + "==");

    REQUIRE(mdshield::unshield(text,
                mdshield::syntax_family::critic_markup) ==
            s(ss::highlight_open) + "a{++b++}" + s(ss::highlight_close));
}

TEST_CASE("unshield #1")
{
    const std::string text =
        "\\* " + s(ss::math_open) + "a\\*b\\_c" + s(ss::math_close) + " \\*";

    REQUIRE(mdshield::unshield(text, mdshield::syntax_family::math) ==
            "\\* $a*b_c$ \\*");
}

TEST_CASE("unshield #2")
{
    const std::string text = "![a" + s(ss::image_divider) + "30](x.png)";

    REQUIRE(mdshield::unshield(
                text, mdshield::syntax_family::image_dimensions) ==
            "![a|30](x.png)");
}

TEST_CASE("strip_private_use")
{
    const std::string text = "a" + s(ss::highlight_open) + "b\xEE\x83\xBF" +
                             "c\xEF\xA3\xBF" + "d\xEF\xBF\xBD";

    REQUIRE(mdshield::count_private_use(text) == 3);

    // U+FFFD is outside the private-use area.
    REQUIRE(mdshield::strip_private_use(text) == "abcd\xEF\xBF\xBD");
    REQUIRE(mdshield::strip_private_use("plain") == "plain");
}

TEST_CASE("strip_private_use invalid UTF-8")
{
    // A lead byte without continuation bytes is not a code point.
    REQUIRE(mdshield::strip_private_use("\xEE" "ab!") == "\xEE" "ab!");
    REQUIRE(mdshield::count_private_use("\xEE" "ab!") == 0);

    REQUIRE(mdshield::strip_private_use("\xEF\x80" "a") == "\xEF\x80" "a");
    REQUIRE(mdshield::count_private_use("x\xEE\x80") == 0);
    REQUIRE(!mdshield::sentinel_at("\xEE" "ab", 0).has_value());
}

TEST_CASE("is_ascii_punctuation")
{
    for (const char c : "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~"sv)
    {
        REQUIRE(mdshield::is_ascii_punctuation(c));
    }

    for (const char c : "azAZ09 \n\t"sv)
    {
        REQUIRE(!mdshield::is_ascii_punctuation(c));
    }
}

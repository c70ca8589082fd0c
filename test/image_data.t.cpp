#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mdshield/ast.hpp>
#include <mdshield/image_data.hpp>

#include <optional>

using namespace mdshield;

namespace {

void require_dimensions(const alt_dimensions& parsed, const char* alt,
    const std::optional<double> width, const std::optional<double> height)
{
    REQUIRE(parsed._alt == alt);
    REQUIRE(parsed._width == width);
    REQUIRE(parsed._height == height);
}

} // namespace

TEST_CASE("parse_alt_dimensions #0")
{
    require_dimensions(parse_alt_dimensions("photo|300x200"), "photo", 300.0,
        200.0);
}

TEST_CASE("parse_alt_dimensions #1")
{
    require_dimensions(
        parse_alt_dimensions("photo|300"), "photo", 300.0, std::nullopt);
}

TEST_CASE("parse_alt_dimensions #2")
{
    require_dimensions(
        parse_alt_dimensions("x|y|40"), "x|y", 40.0, std::nullopt);

    require_dimensions(parse_alt_dimensions("|12x3"), "", 12.0, 3.0);
}

TEST_CASE("parse_alt_dimensions no suffix")
{
    require_dimensions(
        parse_alt_dimensions("a|b"), "a|b", std::nullopt, std::nullopt);

    require_dimensions(
        parse_alt_dimensions("a|30x"), "a|30x", std::nullopt, std::nullopt);

    require_dimensions(parse_alt_dimensions("a|30x20px"), "a|30x20px",
        std::nullopt, std::nullopt);

    require_dimensions(
        parse_alt_dimensions("a|"), "a|", std::nullopt, std::nullopt);

    require_dimensions(
        parse_alt_dimensions("plain"), "plain", std::nullopt, std::nullopt);
}

TEST_CASE("image_data_of image")
{
    const std::optional<image_data> data = image_data_of(
        image("img.png", {text("A "), emphasis({text("nice")}),
                             text(" photo|300x200")}));

    REQUIRE(data.has_value());
    REQUIRE(*data ==
            image_data{.source = "img.png",
                .alt = "A nice photo",
                .destination = std::nullopt,
                .max_width = 300.0,
                .max_height = 200.0});
}

TEST_CASE("image_data_of linked image")
{
    const std::optional<image_data> data = image_data_of(link(
        "https://example.com", {image("thumb.png", {text("thumb|64")})}));

    REQUIRE(data.has_value());
    REQUIRE(data->source == "thumb.png");
    REQUIRE(data->alt == "thumb");
    REQUIRE(data->destination == "https://example.com");
    REQUIRE(data->max_width == 64.0);
    REQUIRE(!data->max_height.has_value());
}

TEST_CASE("image_data_of other nodes")
{
    REQUIRE(!image_data_of(text("x")).has_value());
    REQUIRE(!image_data_of(link("u", {text("x")})).has_value());

    REQUIRE(!image_data_of(link("u", {image("a.png", {}), text(" caption")}))
                 .has_value());
}

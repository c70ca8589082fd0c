#pragma once

#include "ast.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace mdshield {

struct image_data
{
    std::string source;
    std::string alt; // without the dimension suffix
    std::optional<std::string> destination;
    std::optional<double> max_width;
    std::optional<double> max_height;
};

[[nodiscard]] bool operator==(const image_data& lhs, const image_data& rhs);

struct alt_dimensions
{
    std::string_view _alt;
    std::optional<double> _width;
    std::optional<double> _height;
};

// Splits `alt|W` or `alt|WxH` at the first `|` followed by the dimensions
// only. Alt text without such a suffix is returned whole.
[[nodiscard]] alt_dimensions parse_alt_dimensions(std::string_view alt);

// Images, and links whose only child is an image; `std::nullopt` otherwise.
[[nodiscard]] std::optional<image_data> image_data_of(const inline_node& node);

} // namespace mdshield

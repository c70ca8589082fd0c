#include "image_data.hpp"

#include "ast.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mdshield {

namespace {

[[nodiscard]] bool is_digit(const char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] std::size_t digit_run(
    const std::string_view s, const std::size_t idx) noexcept
{
    std::size_t i = idx;
    while (i < s.size() && is_digit(s[i]))
    {
        ++i;
    }

    return i - idx;
}

[[nodiscard]] std::optional<double> to_dimension(const std::string_view digits)
{
    double result{};
    const auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), result);

    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        return std::nullopt;
    }

    return result;
}

// `\d+(?:x\d+)?$` starting at `idx`.
[[nodiscard]] std::optional<alt_dimensions> match_suffix(
    const std::string_view alt, const std::size_t idx)
{
    const std::size_t n_width = digit_run(alt, idx);
    if (n_width == 0)
    {
        return std::nullopt;
    }

    alt_dimensions result{._alt = {},
        ._width = to_dimension(alt.substr(idx, n_width)),
        ._height = std::nullopt};

    const std::size_t after_width = idx + n_width;
    if (after_width == alt.size())
    {
        return result;
    }

    if (alt[after_width] != 'x')
    {
        return std::nullopt;
    }

    const std::size_t n_height = digit_run(alt, after_width + 1);
    if (n_height == 0 || after_width + 1 + n_height != alt.size())
    {
        return std::nullopt;
    }

    result._height = to_dimension(alt.substr(after_width + 1, n_height));
    return result;
}

} // namespace

bool operator==(const image_data& lhs, const image_data& rhs)
{
    return lhs.source == rhs.source && lhs.alt == rhs.alt &&
           lhs.destination == rhs.destination &&
           lhs.max_width == rhs.max_width && lhs.max_height == rhs.max_height;
}

alt_dimensions parse_alt_dimensions(const std::string_view alt)
{
    for (std::size_t i = alt.find('|'); i != std::string_view::npos;
         i = alt.find('|', i + 1))
    {
        if (std::optional<alt_dimensions> result = match_suffix(alt, i + 1);
            result.has_value())
        {
            result->_alt = alt.substr(0, i);
            return *result;
        }
    }

    return alt_dimensions{
        ._alt = alt, ._width = std::nullopt, ._height = std::nullopt};
}

std::optional<image_data> image_data_of(const inline_node& node)
{
    if (const inl::image* img = node.get_if<inl::image>())
    {
        const std::string full_alt = plain_text(img->children);
        const alt_dimensions parsed = parse_alt_dimensions(full_alt);

        return image_data{.source = img->source,
            .alt = std::string{parsed._alt},
            .destination = std::nullopt,
            .max_width = parsed._width,
            .max_height = parsed._height};
    }

    if (const inl::link* l = node.get_if<inl::link>();
        l != nullptr && l->children.size() == 1)
    {
        std::optional<image_data> result = image_data_of(l->children.front());

        if (result.has_value())
        {
            result->destination = l->destination;
        }

        return result;
    }

    return std::nullopt;
}

} // namespace mdshield

#pragma once

#include "ast.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mdshield {

enum class callout_color : std::uint8_t
{
    neutral,
    blue,
    cyan,
    green,
    orange,
    red,
    purple,
    gray
};

struct callout_kind
{
    std::string_view _name;
    callout_color _color;
    std::string_view _icon_name; // SF Symbols identifier
    std::string_view _html_icon;
};

inline constexpr std::size_t callout_catalogue_size = 26;

[[nodiscard]] const std::array<callout_kind, callout_catalogue_size>&
callout_catalogue() noexcept;

// Case-insensitive; `std::nullopt` for names outside the catalogue.
[[nodiscard]] std::optional<callout_kind> find_callout_kind(
    std::string_view name) noexcept;

// Known types resolve through the catalogue, unknown ones to the neutral kind.
[[nodiscard]] callout_kind callout_kind_or_neutral(
    std::string_view name) noexcept;

// `#rrggbb`.
[[nodiscard]] std::string_view css_color_of(callout_color color) noexcept;

// The callout's title, or its type with the first letter upper-cased.
[[nodiscard]] std::string display_title(const blk::callout& callout);

// Rewrites every blockquote that opens with `[!type] Title` or `**Type**`
// into a callout. Blockquotes, callouts and list items are searched
// recursively.
[[nodiscard]] block_list rewrite_callouts(const block_list& blocks);

} // namespace mdshield

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mdshield {

enum class syntax_family : std::uint8_t
{
    image_dimensions,
    highlight,
    critic_markup,
    math
};

struct sentinel
{
    char32_t _code_point;
    std::string_view _utf8;
    std::string_view _literal; // the delimiter text it stands for
    syntax_family _family;
};

// Code points are taken from the Unicode private-use area (U+E000-U+F8FF),
// all encoded as three UTF-8 bytes.
namespace sentinels {

inline constexpr sentinel image_divider{
    0xE000, "\xEE\x80\x80", "|", syntax_family::image_dimensions};

inline constexpr sentinel highlight_open{
    0xE001, "\xEE\x80\x81", "==", syntax_family::highlight};
inline constexpr sentinel highlight_close{
    0xE002, "\xEE\x80\x82", "==", syntax_family::highlight};

inline constexpr sentinel addition_open{
    0xE010, "\xEE\x80\x90", "{++", syntax_family::critic_markup};
inline constexpr sentinel addition_close{
    0xE011, "\xEE\x80\x91", "++}", syntax_family::critic_markup};
inline constexpr sentinel deletion_open{
    0xE012, "\xEE\x80\x92", "{--", syntax_family::critic_markup};
inline constexpr sentinel deletion_close{
    0xE013, "\xEE\x80\x93", "--}", syntax_family::critic_markup};
inline constexpr sentinel substitution_open{
    0xE014, "\xEE\x80\x94", "{~~", syntax_family::critic_markup};
inline constexpr sentinel substitution_separator{
    0xE015, "\xEE\x80\x95", "~>", syntax_family::critic_markup};
inline constexpr sentinel substitution_close{
    0xE016, "\xEE\x80\x96", "~~}", syntax_family::critic_markup};
inline constexpr sentinel comment_open{
    0xE017, "\xEE\x80\x97", "{>>", syntax_family::critic_markup};
inline constexpr sentinel comment_close{
    0xE018, "\xEE\x80\x98", "<<}", syntax_family::critic_markup};
inline constexpr sentinel critic_highlight_open{
    0xE019, "\xEE\x80\x99", "{==", syntax_family::critic_markup};
inline constexpr sentinel critic_highlight_close{
    0xE01A, "\xEE\x80\x9A", "==}", syntax_family::critic_markup};

inline constexpr sentinel math_open{
    0xE020, "\xEE\x80\xA0", "$", syntax_family::math};
inline constexpr sentinel math_close{
    0xE021, "\xEE\x80\xA1", "$", syntax_family::math};

inline constexpr std::array<sentinel, 16> all{image_divider, highlight_open,
    highlight_close, addition_open, addition_close, deletion_open,
    deletion_close, substitution_open, substitution_separator,
    substitution_close, comment_open, comment_close, critic_highlight_open,
    critic_highlight_close, math_open, math_close};

inline constexpr std::size_t utf8_size = 3;

} // namespace sentinels

// Returns the registered sentinel encoded at `text[idx]`, if any.
[[nodiscard]] std::optional<sentinel> sentinel_at(
    std::string_view text, std::size_t idx) noexcept;

[[nodiscard]] bool contains_sentinel(std::string_view text) noexcept;

// Replaces every sentinel of `family` with the literal delimiter it stands
// for. For `syntax_family::math` the backslash escapes added by the
// protector inside the expression are removed as well.
[[nodiscard]] std::string unshield(
    std::string_view text, syntax_family family);

// Removes every code point in U+E000-U+F8FF.
[[nodiscard]] std::string strip_private_use(std::string_view text);

[[nodiscard]] std::size_t count_private_use(std::string_view text) noexcept;

[[nodiscard]] bool is_ascii_punctuation(char c) noexcept;

} // namespace mdshield

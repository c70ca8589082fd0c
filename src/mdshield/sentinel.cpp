#include "sentinel.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mdshield {

namespace {

[[nodiscard]] bool is_continuation_byte(const char c) noexcept
{
    const auto byte = static_cast<unsigned char>(c);
    return byte >= 0x80 && byte <= 0xBF;
}

[[nodiscard]] bool is_private_use_at(
    const std::string_view text, const std::size_t idx) noexcept
{
    if (idx + 2 >= text.size() || !is_continuation_byte(text[idx + 1]) ||
        !is_continuation_byte(text[idx + 2]))
    {
        return false;
    }

    const auto lead = static_cast<unsigned char>(text[idx]);
    const auto second = static_cast<unsigned char>(text[idx + 1]);

    // U+E000-U+EFFF
    if (lead == 0xEE)
    {
        return true;
    }

    // U+F000-U+F8FF
    return lead == 0xEF && second <= 0xA3;
}

} // namespace

std::optional<sentinel> sentinel_at(
    const std::string_view text, const std::size_t idx) noexcept
{
    if (!is_private_use_at(text, idx))
    {
        return std::nullopt;
    }

    const std::string_view candidate = text.substr(idx, sentinels::utf8_size);

    for (const sentinel& s : sentinels::all)
    {
        if (s._utf8 == candidate)
        {
            return s;
        }
    }

    return std::nullopt;
}

bool contains_sentinel(const std::string_view text) noexcept
{
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (sentinel_at(text, i).has_value())
        {
            return true;
        }
    }

    return false;
}

bool is_ascii_punctuation(const char c) noexcept
{
    return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') ||
           (c >= '[' && c <= '`') || (c >= '{' && c <= '~');
}

std::string unshield(const std::string_view text, const syntax_family family)
{
    std::string result;
    result.reserve(text.size());

    bool in_math = false;

    for (std::size_t i = 0; i < text.size();)
    {
        if (const std::optional<sentinel> s = sentinel_at(text, i);
            s.has_value() && s->_family == family)
        {
            result.append(s->_literal);
            i += sentinels::utf8_size;

            if (family == syntax_family::math)
            {
                in_math = s->_code_point == sentinels::math_open._code_point;
            }

            continue;
        }

        if (in_math && text[i] == '\\' && i + 1 < text.size() &&
            is_ascii_punctuation(text[i + 1]))
        {
            result.append(1, text[i + 1]);
            i += 2;
            continue;
        }

        result.append(1, text[i]);
        ++i;
    }

    return result;
}

std::string strip_private_use(const std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size();)
    {
        if (is_private_use_at(text, i))
        {
            i += 3;
            continue;
        }

        result.append(1, text[i]);
        ++i;
    }

    return result;
}

std::size_t count_private_use(const std::string_view text) noexcept
{
    std::size_t result = 0;

    for (std::size_t i = 0; i < text.size();)
    {
        if (is_private_use_at(text, i))
        {
            ++result;
            i += 3;
            continue;
        }

        ++i;
    }

    return result;
}

} // namespace mdshield

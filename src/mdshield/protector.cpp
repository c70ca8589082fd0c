#include "protector.hpp"

#include "sentinel.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mdshield {

namespace {

struct fence
{
    char _char;
    std::size_t _length;
    std::size_t _quote_depth;
    std::size_t _indent;
};

// A line split into its blockquote markers, indentation and content.
struct line_layout
{
    std::size_t _end;
    std::size_t _quote_depth;
    std::size_t _indent;
    std::size_t _content_idx;
};

struct replacement
{
    std::size_t _idx;
    std::size_t _length;
    std::string _with;
};

[[nodiscard]] std::size_t run_length(
    const std::string_view source, const std::size_t idx, const char c)
{
    std::size_t result = 0;

    while (idx + result < source.size() && source[idx + result] == c)
    {
        ++result;
    }

    return result;
}

void fill_mask(std::vector<bool>& mask, const std::size_t begin,
    const std::size_t end)
{
    std::fill(mask.begin() + begin, mask.begin() + end, true);
}

[[nodiscard]] bool any_masked(const std::vector<bool>& mask,
    const std::size_t begin, const std::size_t length)
{
    for (std::size_t i = begin; i < begin + length && i < mask.size(); ++i)
    {
        if (mask[i])
        {
            return true;
        }
    }

    return false;
}

[[nodiscard]] bool is_blank_char(const char c)
{
    return c == ' ' || c == '\t' || c == '\r';
}

[[nodiscard]] bool is_blank(const line_layout& line)
{
    return line._content_idx >= line._end;
}

[[nodiscard]] line_layout layout_line(const std::string_view source,
    const std::size_t line_begin, const std::size_t line_end)
{
    line_layout result{._end = line_end,
        ._quote_depth = 0,
        ._indent = 0,
        ._content_idx = line_begin};

    std::size_t idx = line_begin;

    // Each `>` may be preceded by up to three spaces and eats one space.
    while (true)
    {
        std::size_t marker_idx = idx;
        while (marker_idx < line_end && marker_idx - idx < 3 &&
               source[marker_idx] == ' ')
        {
            ++marker_idx;
        }

        if (marker_idx >= line_end || source[marker_idx] != '>')
        {
            break;
        }

        ++result._quote_depth;
        idx = marker_idx + 1;

        if (idx < line_end && source[idx] == ' ')
        {
            ++idx;
        }
    }

    while (idx < line_end && is_blank_char(source[idx]))
    {
        result._indent =
            source[idx] == '\t' ? (result._indent / 4 + 1) * 4
                                 : result._indent + 1;
        ++idx;
    }

    result._content_idx = idx;
    return result;
}

[[nodiscard]] line_layout layout_line_at(
    const std::string_view source, const std::size_t idx)
{
    const std::size_t prev_newline = source.rfind('\n', idx == 0 ? 0 : idx - 1);
    const std::size_t line_begin =
        (idx == 0 || prev_newline == std::string_view::npos)
            ? 0
            : prev_newline + 1;

    const std::size_t line_end =
        std::min(source.find('\n', idx), source.size());

    return layout_line(source, line_begin, line_end);
}

// Width of a list item marker plus the spaces that follow it, which is the
// column where the item's content starts.
[[nodiscard]] std::optional<std::size_t> list_marker_width(
    const std::string_view source, const std::size_t idx,
    const std::size_t line_end)
{
    std::size_t i = idx;

    if (i < line_end &&
        (source[i] == '-' || source[i] == '*' || source[i] == '+'))
    {
        ++i;
    }
    else
    {
        while (i < line_end && i - idx < 9 && source[i] >= '0' &&
               source[i] <= '9')
        {
            ++i;
        }

        if (i == idx || i >= line_end || (source[i] != '.' && source[i] != ')'))
        {
            return std::nullopt;
        }

        ++i;
    }

    if (i < line_end && source[i] != ' ' && source[i] != '\t')
    {
        return std::nullopt;
    }

    std::size_t n_spaces = 0;
    while (i + n_spaces < line_end && source[i + n_spaces] == ' ')
    {
        ++n_spaces;
    }

    const std::size_t marker_length = i - idx;

    if (n_spaces == 0 || n_spaces > 4 || i + n_spaces == line_end)
    {
        return marker_length + 1;
    }

    return marker_length + n_spaces;
}

[[nodiscard]] bool is_atx_heading(const std::string_view source,
    const std::size_t idx, const std::size_t line_end)
{
    const std::size_t n = std::min(run_length(source, idx, '#'), line_end - idx);
    return n >= 1 && n <= 6 &&
           (idx + n == line_end || is_blank_char(source[idx + n]));
}

// Thematic breaks and setext underlines.
[[nodiscard]] bool is_break_line(const std::string_view source,
    const std::size_t idx, const std::size_t line_end)
{
    const char c = source[idx];
    if (c != '-' && c != '=' && c != '*' && c != '_')
    {
        return false;
    }

    std::size_t n = 0;
    for (std::size_t i = idx; i < line_end; ++i)
    {
        if (source[i] == c)
        {
            ++n;
        }
        else if (!is_blank_char(source[i]))
        {
            return false;
        }
    }

    return (c == '-' || c == '=') ? n >= 1 : n >= 3;
}

[[nodiscard]] std::optional<fence> fence_at(const std::string_view source,
    const std::size_t idx, const std::size_t line_end)
{
    if (idx >= line_end || (source[idx] != '`' && source[idx] != '~'))
    {
        return std::nullopt;
    }

    const char c = source[idx];
    const std::size_t n = std::min(run_length(source, idx, c), line_end - idx);

    if (n < 3)
    {
        return std::nullopt;
    }

    // The info string of a backtick fence cannot contain backticks.
    if (c == '`' &&
        source.substr(idx + n, line_end - idx - n).find('`') !=
            std::string_view::npos)
    {
        return std::nullopt;
    }

    return fence{._char = c, ._length = n, ._quote_depth = 0, ._indent = 0};
}

[[nodiscard]] bool closes_fence(const std::string_view source,
    const std::size_t idx, const std::size_t line_end, const fence& f)
{
    const std::size_t n = std::min(run_length(source, idx, f._char),
        line_end > idx ? line_end - idx : 0);

    if (n < f._length)
    {
        return false;
    }

    for (std::size_t i = idx + n; i < line_end; ++i)
    {
        if (source[i] != ' ' && source[i] != '\t' && source[i] != '\r')
        {
            return false;
        }
    }

    return true;
}

[[nodiscard]] bool is_escaped(const std::string_view source, std::size_t idx)
{
    std::size_t n_backslashes = 0;

    while (idx > 0 && source[idx - 1] == '\\')
    {
        ++n_backslashes;
        --idx;
    }

    return n_backslashes % 2 == 1;
}

// A fence ends with its blockquote or list item.
[[nodiscard]] bool leaves_container(const line_layout& line, const fence& f)
{
    if (line._quote_depth < f._quote_depth)
    {
        return true;
    }

    return !is_blank(line) && line._indent < f._indent;
}

// Whether a list marker at `idx` can interrupt a paragraph.
[[nodiscard]] bool starts_list_item(const std::string_view source,
    const std::size_t idx, const std::size_t line_end)
{
    const std::optional<std::size_t> width =
        list_marker_width(source, idx, line_end);

    if (!width.has_value() ||
        std::min(idx + *width, line_end) == line_end)
    {
        return false;
    }

    const char c = source[idx];
    return c == '-' || c == '*' || c == '+' ||
           (c == '1' && idx + 1 < line_end &&
               (source[idx + 1] == '.' || source[idx + 1] == ')'));
}

// Whether the line after `newline_idx` cannot continue the paragraph in which
// a code span was opened on `opening_line`.
[[nodiscard]] bool ends_inline_run(const std::string_view source,
    const line_layout& opening_line, const std::size_t newline_idx)
{
    if (!is_blank(opening_line) &&
        (is_atx_heading(source, opening_line._content_idx, opening_line._end) ||
            source[opening_line._content_idx] == '|'))
    {
        return true;
    }

    const line_layout next = layout_line_at(source, newline_idx + 1);

    if (is_blank(next) || next._quote_depth != opening_line._quote_depth)
    {
        return true;
    }

    if (next._indent >= 4)
    {
        return false;
    }

    const std::size_t idx = next._content_idx;

    return is_atx_heading(source, idx, next._end) ||
           fence_at(source, idx, next._end).has_value() ||
           is_break_line(source, idx, next._end) ||
           starts_list_item(source, idx, next._end) || source[idx] == '|';
}

[[nodiscard]] std::optional<std::size_t> find_closing_backticks(
    const std::string_view source, const std::vector<bool>& mask,
    const line_layout& opening_line, const std::size_t start_idx,
    const std::size_t n_backticks)
{
    for (std::size_t i = start_idx; i < source.size();)
    {
        if (mask[i])
        {
            return std::nullopt;
        }

        if (source[i] == '\n' && ends_inline_run(source, opening_line, i))
        {
            return std::nullopt;
        }

        if (source[i] != '`')
        {
            ++i;
            continue;
        }

        const std::size_t n = run_length(source, i, '`');
        if (n == n_backticks)
        {
            return i;
        }

        i += n;
    }

    return std::nullopt;
}

[[nodiscard]] std::optional<std::size_t> find_outside_code(
    const std::string_view source, const std::vector<bool>& in_code,
    const std::string_view needle, const std::size_t start_idx)
{
    for (std::size_t i = source.find(needle, start_idx);
         i != std::string_view::npos; i = source.find(needle, i + 1))
    {
        if (!any_masked(in_code, i, needle.size()))
        {
            return i;
        }
    }

    return std::nullopt;
}

[[nodiscard]] bool delimiter_at(const std::string_view source,
    const std::vector<bool>& in_code, const std::size_t idx,
    const std::string_view delimiter)
{
    return source.substr(idx, delimiter.size()) == delimiter &&
           !any_masked(in_code, idx, delimiter.size());
}

[[nodiscard]] protect_result apply_replacements(const std::string_view source,
    const std::vector<replacement>& replacements)
{
    if (replacements.empty())
    {
        return protect_result{._text = std::string{source}, ._matched = false};
    }

    std::string result;
    result.reserve(source.size() + replacements.size() * 2);

    std::size_t curr_idx = 0;
    for (const replacement& r : replacements)
    {
        result.append(source.substr(curr_idx, r._idx - curr_idx));
        result.append(r._with);
        curr_idx = r._idx + r._length;
    }

    result.append(source.substr(curr_idx));
    return protect_result{._text = std::move(result), ._matched = true};
}

[[nodiscard]] replacement replace_with_sentinel(const std::size_t idx,
    const std::size_t length, const sentinel& s)
{
    return replacement{
        ._idx = idx, ._length = length, ._with = std::string{s._utf8}};
}

[[nodiscard]] protect_result protect_delimited(const std::string_view source,
    const std::string_view open, const std::string_view close,
    const sentinel& open_sentinel, const sentinel& close_sentinel)
{
    const std::vector<bool> in_code = mark_code_regions(source);
    std::vector<replacement> replacements;

    for (std::size_t i = 0; i < source.size();)
    {
        if (!delimiter_at(source, in_code, i, open))
        {
            ++i;
            continue;
        }

        const std::optional<std::size_t> close_idx =
            find_outside_code(source, in_code, close, i + open.size() + 1);

        if (!close_idx.has_value())
        {
            ++i;
            continue;
        }

        replacements.push_back(
            replace_with_sentinel(i, open.size(), open_sentinel));
        replacements.push_back(
            replace_with_sentinel(*close_idx, close.size(), close_sentinel));

        i = *close_idx + close.size();
    }

    return apply_replacements(source, replacements);
}

[[nodiscard]] protect_result protect_substitutions(
    const std::string_view source)
{
    using namespace std::string_view_literals;

    constexpr auto open = "{~~"sv;
    constexpr auto separator = "~>"sv;
    constexpr auto close = "~~}"sv;

    const std::vector<bool> in_code = mark_code_regions(source);
    std::vector<replacement> replacements;

    for (std::size_t i = 0; i < source.size();)
    {
        if (!delimiter_at(source, in_code, i, open))
        {
            ++i;
            continue;
        }

        const std::optional<std::size_t> separator_idx =
            find_outside_code(source, in_code, separator, i + open.size() + 1);

        if (!separator_idx.has_value())
        {
            ++i;
            continue;
        }

        const std::optional<std::size_t> close_idx = find_outside_code(
            source, in_code, close, *separator_idx + separator.size() + 1);

        if (!close_idx.has_value())
        {
            ++i;
            continue;
        }

        replacements.push_back(
            replace_with_sentinel(i, open.size(), sentinels::substitution_open));
        replacements.push_back(replace_with_sentinel(*separator_idx,
            separator.size(), sentinels::substitution_separator));
        replacements.push_back(replace_with_sentinel(
            *close_idx, close.size(), sentinels::substitution_close));

        i = *close_idx + close.size();
    }

    return apply_replacements(source, replacements);
}

[[nodiscard]] std::optional<std::size_t> match_highlight_at(
    const std::string_view source, const std::vector<bool>& in_code,
    const std::size_t idx)
{
    if (!delimiter_at(source, in_code, idx, "=="))
    {
        return std::nullopt;
    }

    std::size_t i = idx + 2;
    std::size_t content_length = 0;

    // Code spans inside the content are opaque.
    while (i < source.size() &&
           (in_code[i] || (source[i] != '=' && source[i] != '\n')))
    {
        ++i;
        ++content_length;
    }

    if (content_length == 0 || !delimiter_at(source, in_code, i, "=="))
    {
        return std::nullopt;
    }

    if (i + 2 < source.size() && source[i + 2] == '=')
    {
        return std::nullopt;
    }

    return i;
}

[[nodiscard]] std::string escape_math_content(const std::string_view content)
{
    std::string result;
    result.reserve(content.size() * 2);

    for (const char c : content)
    {
        if (is_ascii_punctuation(c))
        {
            result.append(1, '\\');
        }

        result.append(1, c);
    }

    return result;
}

} // namespace

std::vector<bool> mark_code_regions(const std::string_view source)
{
    std::vector<bool> mask(source.size(), false);

    //
    // Fenced code blocks
    // ------------------------------------------------------------------------
    std::optional<fence> open_fence;

    // Content column of the innermost list item, at `list_quote_depth`.
    std::size_t list_indent = 0;
    std::size_t list_quote_depth = 0;

    for (std::size_t line_begin = 0; line_begin < source.size();)
    {
        const std::size_t newline_idx = source.find('\n', line_begin);
        const bool has_newline = newline_idx != std::string_view::npos;
        const std::size_t line_end = has_newline ? newline_idx : source.size();
        const std::size_t next_line = has_newline ? line_end + 1 : line_end;

        const line_layout line = layout_line(source, line_begin, line_end);

        if (open_fence.has_value() && leaves_container(line, *open_fence))
        {
            open_fence.reset();
        }

        if (open_fence.has_value())
        {
            fill_mask(mask, line_begin, next_line);

            if (closes_fence(source, line._content_idx, line_end, *open_fence))
            {
                open_fence.reset();
            }

            line_begin = next_line;
            continue;
        }

        if (is_blank(line))
        {
            line_begin = next_line;
            continue;
        }

        if (line._quote_depth != list_quote_depth ||
            line._indent < list_indent)
        {
            list_indent = 0;
        }

        std::size_t content_idx = line._content_idx;

        if (const std::optional<std::size_t> width =
                list_marker_width(source, line._content_idx, line_end);
            width.has_value() && line._indent < list_indent + 4)
        {
            list_indent = line._indent + *width;
            list_quote_depth = line._quote_depth;
            content_idx = std::min(line._content_idx + *width, line_end);
        }
        else if (line._indent >= list_indent + 4)
        {
            // Indented code, not a fence.
            line_begin = next_line;
            continue;
        }

        if (std::optional<fence> f = fence_at(source, content_idx, line_end);
            f.has_value())
        {
            f->_quote_depth = line._quote_depth;
            f->_indent = list_indent;

            fill_mask(mask, line_begin, next_line);
            open_fence = f;
        }

        line_begin = next_line;
    }

    //
    // Inline code spans
    // ------------------------------------------------------------------------
    for (std::size_t i = 0; i < source.size();)
    {
        if (mask[i] || source[i] != '`' || is_escaped(source, i))
        {
            ++i;
            continue;
        }

        const std::size_t n_backticks = run_length(source, i, '`');
        const std::optional<std::size_t> close_idx =
            find_closing_backticks(source, mask, layout_line_at(source, i),
                i + n_backticks, n_backticks);

        if (!close_idx.has_value())
        {
            i += n_backticks;
            continue;
        }

        fill_mask(mask, i, *close_idx + n_backticks);
        i = *close_idx + n_backticks;
    }

    return mask;
}

protect_result protect_highlights(const std::string_view source)
{
    const std::vector<bool> in_code = mark_code_regions(source);
    std::vector<replacement> replacements;

    for (std::size_t i = 0; i + 1 < source.size();)
    {
        const std::optional<std::size_t> close_idx =
            match_highlight_at(source, in_code, i);

        if (!close_idx.has_value())
        {
            ++i;
            continue;
        }

        replacements.push_back(
            replace_with_sentinel(i, 2, sentinels::highlight_open));
        replacements.push_back(
            replace_with_sentinel(*close_idx, 2, sentinels::highlight_close));

        i = *close_idx + 2;
    }

    return apply_replacements(source, replacements);
}

protect_result protect_critic_markup(const std::string_view source)
{
    bool matched = false;

    const auto step = [&](protect_result&& r)
    {
        matched = matched || r._matched;
        return std::move(r._text);
    };

    std::string result = step(protect_substitutions(source));

    result = step(protect_delimited(result, "{++", "++}",
        sentinels::addition_open, sentinels::addition_close));

    result = step(protect_delimited(result, "{--", "--}",
        sentinels::deletion_open, sentinels::deletion_close));

    result = step(protect_delimited(result, "{>>", "<<}",
        sentinels::comment_open, sentinels::comment_close));

    result = step(protect_delimited(result, "{==", "==}",
        sentinels::critic_highlight_open, sentinels::critic_highlight_close));

    return protect_result{._text = std::move(result), ._matched = matched};
}

protect_result protect_image_dimensions(const std::string_view source)
{
    const std::vector<bool> in_code = mark_code_regions(source);
    std::vector<replacement> replacements;

    for (std::size_t i = 0; i + 1 < source.size();)
    {
        if (!delimiter_at(source, in_code, i, "!["))
        {
            ++i;
            continue;
        }

        const std::size_t alt_begin = i + 2;
        const std::size_t alt_end = source.find(']', alt_begin);

        if (alt_end == std::string_view::npos ||
            source.substr(alt_begin, alt_end - alt_begin).find('|') ==
                std::string_view::npos ||
            alt_end + 1 >= source.size() || source[alt_end + 1] != '(')
        {
            ++i;
            continue;
        }

        const std::size_t url_begin = alt_end + 2;
        const std::size_t url_end = source.find(')', url_begin);

        if (url_end == std::string_view::npos || url_end == url_begin)
        {
            ++i;
            continue;
        }

        for (std::size_t k = alt_begin; k < alt_end; ++k)
        {
            if (source[k] == '|')
            {
                replacements.push_back(
                    replace_with_sentinel(k, 1, sentinels::image_divider));
            }
        }

        i = url_end + 1;
    }

    return apply_replacements(source, replacements);
}

protect_result protect_inline_math(const std::string_view source)
{
    const std::vector<bool> in_code = mark_code_regions(source);
    std::vector<replacement> replacements;

    for (std::size_t i = 0; i < source.size();)
    {
        if (in_code[i] || source[i] != '$' || (i > 0 && source[i - 1] == '$'))
        {
            ++i;
            continue;
        }

        std::size_t close_idx = i + 1;
        while (close_idx < source.size() && source[close_idx] != '$' &&
               source[close_idx] != '\n' && !in_code[close_idx])
        {
            ++close_idx;
        }

        const bool valid = close_idx > i + 1 && close_idx < source.size() &&
                           source[close_idx] == '$' && !in_code[close_idx] &&
                           (close_idx + 1 >= source.size() ||
                               source[close_idx + 1] != '$');

        if (!valid)
        {
            ++i;
            continue;
        }

        const std::string_view content =
            source.substr(i + 1, close_idx - i - 1);

        replacements.push_back(
            replace_with_sentinel(i, 1, sentinels::math_open));
        replacements.push_back(replacement{._idx = i + 1,
            ._length = content.size(),
            ._with = escape_math_content(content)});
        replacements.push_back(
            replace_with_sentinel(close_idx, 1, sentinels::math_close));

        i = close_idx + 1;
    }

    return apply_replacements(source, replacements);
}

} // namespace mdshield

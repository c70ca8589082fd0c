#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mdshield {

struct protect_result
{
    std::string _text;
    bool _matched;
};

// One entry per byte of `source`: `true` when the byte belongs to a fenced
// code block (fence lines included) or to an inline code span (backticks
// included). Protection never places a delimiter inside these ranges.
[[nodiscard]] std::vector<bool> mark_code_regions(std::string_view source);

// `==content==`: content is non-empty, has no `=` or line break, and the
// closing `==` is not followed by another `=`.
[[nodiscard]] protect_result protect_highlights(std::string_view source);

// `{~~old~>new~~}`, then `{++...++}`, `{--...--}`, `{>>...<<}`, `{==...==}`.
// Content may span lines; the nearest closing delimiter wins.
[[nodiscard]] protect_result protect_critic_markup(std::string_view source);

// `![alt|W](url)` and `![alt|WxH](url)`: only the `|` characters inside the
// alt text are replaced.
[[nodiscard]] protect_result protect_image_dimensions(std::string_view source);

// `$expr$` where neither dollar sign touches another one. The expression's
// ASCII punctuation is backslash-escaped so that the markdown engine keeps
// it verbatim.
[[nodiscard]] protect_result protect_inline_math(std::string_view source);

} // namespace mdshield

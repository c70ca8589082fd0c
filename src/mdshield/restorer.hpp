#pragma once

#include "ast.hpp"

namespace mdshield {

// Each pass turns the sentinels of one syntax family back into nodes. A
// sentinel that cannot be paired degrades to the literal delimiter it stands
// for. Sentinels found in code, HTML, link destinations and image sources are
// always turned back into their literal text.

// Image dimension dividers become `|` again; the alt text is otherwise kept.
[[nodiscard]] inline_list restore_image_dimensions(const inline_list& inlines);
[[nodiscard]] block_list restore_image_dimensions(const block_list& blocks);

[[nodiscard]] inline_list restore_highlights(const inline_list& inlines);
[[nodiscard]] block_list restore_highlights(const block_list& blocks);

[[nodiscard]] inline_list restore_critic_markup(const inline_list& inlines);
[[nodiscard]] block_list restore_critic_markup(const block_list& blocks);

// The opening and closing sentinels must be separated by plain text only.
[[nodiscard]] inline_list restore_math(const inline_list& inlines);
[[nodiscard]] block_list restore_math(const block_list& blocks);

// `true` if any string of the tree still holds a registered sentinel.
[[nodiscard]] bool contains_sentinels(const inline_list& inlines);
[[nodiscard]] bool contains_sentinels(const block_list& blocks);

} // namespace mdshield

#pragma once

#include "ast.hpp"

#include <ostream>
#include <string>

namespace mdshield {

// One node per line, children indented by two spaces. String payloads are
// quoted with `"`, `\` and control characters escaped.
//
// Example:
//
//     paragraph
//       text "Hello "
//       highlight
//         text "world"
//
void dump_tree(std::ostream& os, const block_list& blocks);
void dump_tree(std::ostream& os, const inline_list& inlines);

[[nodiscard]] std::string dump_tree(const block_list& blocks);
[[nodiscard]] std::string dump_tree(const inline_list& inlines);

} // namespace mdshield

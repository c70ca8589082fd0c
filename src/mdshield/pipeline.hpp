#pragma once

#include "ast.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mdshield {

// Every protector pass, in order: image dimensions, inline math, editorial
// markup, highlights. Private-use characters already present in `source` are
// removed first.
[[nodiscard]] std::string prepare_for_parsing(const std::string_view source);

// Callout rewriting, then the restorer passes: image dimensions, highlights,
// editorial markup, inline math.
[[nodiscard]] block_list finalize_tree(const block_list& blocks);

class pipeline
{
private:
    class state;

    std::unique_ptr<state> _state;

public:
    struct config
    {
        bool skip_image_dimensions = false;
        bool skip_inline_math = false;
        bool skip_critic_markup = false;
        bool skip_highlights = false;
        bool skip_callouts = false;
        bool strip_private_use = true;
    };

    [[nodiscard]] explicit pipeline(std::ostream& err_stream);
    ~pipeline();

    [[nodiscard]] std::string prepare(
        const config& cfg, const std::string_view source);

    [[nodiscard]] block_list finalize(
        const config& cfg, const block_list& blocks);

    // `prepare`, md4c, then `finalize`. Fails only if md4c does.
    [[nodiscard]] std::optional<block_list> process(
        const config& cfg, const std::string_view source) noexcept;
};

} // namespace mdshield

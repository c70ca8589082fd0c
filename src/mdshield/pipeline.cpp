#include "pipeline.hpp"

#include "callout.hpp"
#include "md4c_parser.hpp"
#include "protector.hpp"
#include "restorer.hpp"
#include "sentinel.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace mdshield {

namespace {

[[nodiscard]] std::string protect(
    const pipeline::config& cfg, std::string source)
{
    const auto apply = [&](const bool skip, auto pass)
    {
        if (!skip)
        {
            source = pass(source)._text;
        }
    };

    apply(cfg.skip_image_dimensions, &protect_image_dimensions);
    apply(cfg.skip_inline_math, &protect_inline_math);
    apply(cfg.skip_critic_markup, &protect_critic_markup);
    apply(cfg.skip_highlights, &protect_highlights);

    return source;
}

[[nodiscard]] block_list restore(
    const pipeline::config& cfg, block_list blocks)
{
    const auto apply = [&](const bool skip, auto pass)
    {
        if (!skip)
        {
            blocks = pass(blocks);
        }
    };

    using block_pass = block_list (*)(const block_list&);

    apply(cfg.skip_callouts, block_pass{&rewrite_callouts});
    apply(cfg.skip_image_dimensions, block_pass{&restore_image_dimensions});
    apply(cfg.skip_highlights, block_pass{&restore_highlights});
    apply(cfg.skip_critic_markup, block_pass{&restore_critic_markup});
    apply(cfg.skip_inline_math, block_pass{&restore_math});

    return blocks;
}

} // namespace

std::string prepare_for_parsing(const std::string_view source)
{
    return protect(pipeline::config{}, strip_private_use(source));
}

block_list finalize_tree(const block_list& blocks)
{
    return restore(pipeline::config{}, blocks);
}

// ----------------------------------------------------------------------------

class pipeline::state
{
private:
    std::ostream& _err_stream;
    md4c_parser _parser;

public:
    [[nodiscard]] explicit state(std::ostream& err_stream)
        : _err_stream{err_stream}, _parser{err_stream}
    {}

    [[nodiscard]] md4c_parser& parser() noexcept
    {
        return _parser;
    }

    [[nodiscard]] std::ostream& warning_diagnostic_stream()
    {
        return _err_stream << "((MDSH WARNING)): ";
    }

    [[nodiscard]] std::ostream& error_diagnostic_stream(const char* type)
    {
        return _err_stream << "((MDSH " << type << " ERROR)): ";
    }
};

pipeline::pipeline(std::ostream& err_stream)
    : _state{std::make_unique<state>(err_stream)}
{}

pipeline::~pipeline() = default;

std::string pipeline::prepare(
    const config& cfg, const std::string_view source)
{
    if (!cfg.strip_private_use)
    {
        return protect(cfg, std::string{source});
    }

    if (const std::size_t n = count_private_use(source); n > 0)
    {
        _state->warning_diagnostic_stream()
            << "Removed " << n << " private-use character(s) from input\n\n";
    }

    return protect(cfg, strip_private_use(source));
}

block_list pipeline::finalize(const config& cfg, const block_list& blocks)
{
    block_list result = restore(cfg, blocks);

    if (contains_sentinels(result))
    {
        _state->error_diagnostic_stream("INTERNAL")
            << "Unrestored sentinel left in the final tree\n\n";
    }

    return result;
}

std::optional<block_list> pipeline::process(
    const config& cfg, const std::string_view source) noexcept
{
    try
    {
        const std::string shielded = prepare(cfg, source);

        std::optional<block_list> parsed = _state->parser().parse(shielded);
        if (!parsed.has_value())
        {
            return std::nullopt;
        }

        return finalize(cfg, *parsed);
    }
    catch (const std::exception& e)
    {
        _state->error_diagnostic_stream("INTERNAL") << e.what() << "\n\n";
        return std::nullopt;
    }
}

} // namespace mdshield

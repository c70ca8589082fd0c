#include <mdshield/ast.hpp>
#include <mdshield/pipeline.hpp>
#include <mdshield/tree_dump.hpp>

#include <iostream>
#include <optional>
#include <string>

int main()
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    std::string source;
    source.reserve(128000);

    std::string line_buffer;
    line_buffer.reserve(512);

    while (std::getline(std::cin, line_buffer))
    {
        source.append(line_buffer);
        source.append(1, '\n');
    }

    mdshield::pipeline pipeline{std::cerr};

    constexpr mdshield::pipeline::config cfg{
        .skip_image_dimensions = false,
        .skip_inline_math = false,
        .skip_critic_markup = false,
        .skip_highlights = false,
        .skip_callouts = false,
        .strip_private_use = true //
    };

    const std::optional<mdshield::block_list> blocks =
        pipeline.process(cfg, source);

    if (!blocks.has_value())
    {
        std::cerr << "((MDSH ERROR)): Fatal error while processing markdown "
                     "input\n"
                  << std::endl;

        return 1;
    }

    mdshield::dump_tree(std::cout, *blocks);
    std::cout << std::flush;

    return 0;
}

#pragma once

#include "ast.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>

namespace mdshield {

// GitHub-flavored markdown to `block_list`, backed by md4c. Private-use
// characters pass through untouched, so the output may still hold sentinels.
class md4c_parser
{
private:
    struct impl;
    std::unique_ptr<impl> _impl;

public:
    [[nodiscard]] explicit md4c_parser(std::ostream& err_stream);
    ~md4c_parser();

    md4c_parser(md4c_parser&&) noexcept;
    md4c_parser& operator=(md4c_parser&&) noexcept;

    [[nodiscard]] std::optional<block_list> parse(
        const std::string_view source) noexcept;
};

} // namespace mdshield

#include "tree_dump.hpp"

#include "ast.hpp"
#include "overloaded.hpp"

#include <cstddef>
#include <cstdio>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mdshield {

namespace {

[[nodiscard]] std::string_view name_of(const inl::text&) noexcept
{
    return "text";
}

[[nodiscard]] std::string_view name_of(const inl::code&) noexcept
{
    return "code";
}

[[nodiscard]] std::string_view name_of(const inl::html&) noexcept
{
    return "html";
}

[[nodiscard]] std::string_view name_of(const inl::math&) noexcept
{
    return "math";
}

[[nodiscard]] std::string_view name_of(const inl::soft_break&) noexcept
{
    return "soft_break";
}

[[nodiscard]] std::string_view name_of(const inl::line_break&) noexcept
{
    return "line_break";
}

[[nodiscard]] std::string_view name_of(const inl::emphasis&) noexcept
{
    return "emphasis";
}

[[nodiscard]] std::string_view name_of(const inl::strong&) noexcept
{
    return "strong";
}

[[nodiscard]] std::string_view name_of(const inl::strikethrough&) noexcept
{
    return "strikethrough";
}

[[nodiscard]] std::string_view name_of(const inl::highlight&) noexcept
{
    return "highlight";
}

[[nodiscard]] std::string_view name_of(const inl::critic_addition&) noexcept
{
    return "critic_addition";
}

[[nodiscard]] std::string_view name_of(const inl::critic_deletion&) noexcept
{
    return "critic_deletion";
}

[[nodiscard]] std::string_view name_of(const inl::critic_comment&) noexcept
{
    return "critic_comment";
}

[[nodiscard]] std::string_view name_of(const inl::critic_highlight&) noexcept
{
    return "critic_highlight";
}

[[nodiscard]] std::string_view name_of(const column_alignment a) noexcept
{
    switch (a)
    {
        case column_alignment::left: return "left";
        case column_alignment::center: return "center";
        case column_alignment::right: return "right";
        case column_alignment::none: break;
    }

    return "none";
}

class dumper
{
private:
    std::ostream& _os;
    std::size_t _depth{0};

    void indent()
    {
        for (std::size_t i = 0; i < _depth; ++i)
        {
            _os << "  ";
        }
    }

    void quoted(const std::string_view s)
    {
        _os << '"';

        for (const char c : s)
        {
            switch (c)
            {
                case '"': _os << "\\\""; break;
                case '\\': _os << "\\\\"; break;
                case '\n': _os << "\\n"; break;
                case '\t': _os << "\\t"; break;
                case '\r': _os << "\\r"; break;

                default:
                {
                    if (static_cast<unsigned char>(c) < 0x20)
                    {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\x%02x",
                            static_cast<unsigned int>(
                                static_cast<unsigned char>(c)));
                        _os << buf;
                    }
                    else
                    {
                        _os << c;
                    }
                }
            }
        }

        _os << '"';
    }

    template <typename F>
    void nested(F&& f)
    {
        ++_depth;
        f();
        --_depth;
    }

    void children(const inline_list& inlines)
    {
        nested([&] { dump(inlines); });
    }

    void children(const block_list& blocks)
    {
        nested([&] { dump(blocks); });
    }

    template <typename Items>
    void items(const Items& list_items)
    {
        nested(
            [&]
            {
                for (const auto& item : list_items)
                {
                    indent();
                    _os << "item";

                    if constexpr (requires { item.completed; })
                    {
                        _os << (item.completed ? " [x]" : " [ ]");
                    }

                    _os << '\n';
                    children(item.children);
                }
            });
    }

    void dump(const inline_node& node)
    {
        indent();

        std::visit(
            overloaded{
                [&](const inl::link& n)
                {
                    _os << "link ";
                    quoted(n.destination);
                    _os << '\n';
                    children(n.children);
                },
                [&](const inl::image& n)
                {
                    _os << "image ";
                    quoted(n.source);
                    _os << '\n';
                    children(n.children);
                },
                [&](const inl::critic_substitution& n)
                {
                    _os << "critic_substitution\n";
                    nested(
                        [&]
                        {
                            indent();
                            _os << "old\n";
                            children(n.old_children);
                            indent();
                            _os << "new\n";
                            children(n.new_children);
                        });
                },
                [&]<typename Tag>(const inl::leaf<Tag>& n)
                {
                    _os << name_of(n) << ' ';
                    quoted(n.content);
                    _os << '\n';
                },
                [&]<typename Tag>(const inl::mark<Tag>& n)
                { _os << name_of(n) << '\n'; },
                [&]<typename Tag>(const inl::container<Tag>& n)
                {
                    _os << name_of(n) << '\n';
                    children(n.children);
                }},
            node.value);
    }

    void dump(const block_node& node)
    {
        indent();

        std::visit(
            overloaded{
                [&](const blk::blockquote& b)
                {
                    _os << "blockquote\n";
                    children(b.children);
                },
                [&](const blk::callout& b)
                {
                    _os << "callout ";
                    quoted(b.type);

                    if (b.title.has_value())
                    {
                        _os << ' ';
                        quoted(*b.title);
                    }

                    _os << '\n';
                    children(b.children);
                },
                [&](const blk::bulleted_list& b)
                {
                    _os << "bulleted_list" << (b.tight ? " tight" : "")
                        << '\n';
                    items(b.items);
                },
                [&](const blk::numbered_list& b)
                {
                    _os << "numbered_list start=" << b.start
                        << (b.tight ? " tight" : "") << '\n';
                    items(b.items);
                },
                [&](const blk::task_list& b)
                {
                    _os << "task_list" << (b.tight ? " tight" : "") << '\n';
                    items(b.items);
                },
                [&](const blk::paragraph& b)
                {
                    _os << "paragraph\n";
                    children(b.inlines);
                },
                [&](const blk::heading& b)
                {
                    _os << "heading " << b.level << '\n';
                    children(b.inlines);
                },
                [&](const blk::code_block& b)
                {
                    _os << "code_block";

                    if (b.fence_info.has_value())
                    {
                        _os << ' ';
                        quoted(*b.fence_info);
                    }

                    _os << '\n';
                    nested(
                        [&]
                        {
                            indent();
                            quoted(b.content);
                            _os << '\n';
                        });
                },
                [&](const blk::html_block& b)
                {
                    _os << "html_block\n";
                    nested(
                        [&]
                        {
                            indent();
                            quoted(b.content);
                            _os << '\n';
                        });
                },
                [&](const blk::table& b)
                {
                    _os << "table";

                    for (const column_alignment a : b.alignments)
                    {
                        _os << ' ' << name_of(a);
                    }

                    _os << '\n';
                    nested([&] { rows(b.rows); });
                },
                [&](const blk::thematic_break&)
                { _os << "thematic_break\n"; }},
            node.value);
    }

    void rows(const std::vector<blk::table_row>& table_rows)
    {
        for (const blk::table_row& row : table_rows)
        {
            indent();
            _os << "row\n";

            nested(
                [&]
                {
                    for (const blk::table_cell& cell : row.cells)
                    {
                        indent();
                        _os << "cell\n";
                        children(cell.inlines);
                    }
                });
        }
    }

public:
    explicit dumper(std::ostream& os) noexcept : _os{os}
    {
    }

    void dump(const inline_list& inlines)
    {
        for (const inline_node& node : inlines)
        {
            dump(node);
        }
    }

    void dump(const block_list& blocks)
    {
        for (const block_node& node : blocks)
        {
            dump(node);
        }
    }
};

} // namespace

void dump_tree(std::ostream& os, const block_list& blocks)
{
    dumper{os}.dump(blocks);
}

void dump_tree(std::ostream& os, const inline_list& inlines)
{
    dumper{os}.dump(inlines);
}

std::string dump_tree(const block_list& blocks)
{
    std::ostringstream oss;
    dump_tree(oss, blocks);
    return oss.str();
}

std::string dump_tree(const inline_list& inlines)
{
    std::ostringstream oss;
    dump_tree(oss, inlines);
    return oss.str();
}

} // namespace mdshield

#include "md4c_parser.hpp"

#include "ast.hpp"

#include <md4c.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mdshield {

namespace {

constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

[[nodiscard]] std::string encode_utf8(const std::uint32_t cp)
{
    std::string encoded;

    if (cp <= 0x7F)
    {
        encoded.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FF)
    {
        encoded.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        encoded.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
        encoded.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        encoded.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        encoded.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0x10FFFF)
    {
        encoded.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        encoded.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        encoded.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        encoded.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }

    return encoded;
}

[[nodiscard]] std::optional<std::uint32_t> parse_code_point(
    const std::string_view digits, const int base)
{
    if (digits.empty() || digits.size() > 7)
    {
        return std::nullopt;
    }

    std::uint32_t result = 0;

    for (const char c : digits)
    {
        std::uint32_t digit;

        if (c >= '0' && c <= '9')
        {
            digit = static_cast<std::uint32_t>(c - '0');
        }
        else if (base == 16 && c >= 'a' && c <= 'f')
        {
            digit = static_cast<std::uint32_t>(c - 'a' + 10);
        }
        else if (base == 16 && c >= 'A' && c <= 'F')
        {
            digit = static_cast<std::uint32_t>(c - 'A' + 10);
        }
        else
        {
            return std::nullopt;
        }

        result = result * static_cast<std::uint32_t>(base) + digit;
    }

    // Surrogates are not scalar values.
    if (result == 0 || result > 0x10FFFF ||
        (result >= 0xD800 && result <= 0xDFFF))
    {
        return std::nullopt;
    }

    return result;
}

// `&name;`, `&#123;` or `&#x7B;`. Unknown entities are kept verbatim.
[[nodiscard]] std::string decode_entity(const std::string_view entity)
{
    struct named
    {
        std::string_view _name;
        std::string_view _utf8;
    };

    constexpr named named_entities[]{
        {"&amp;", "&"},
        {"&lt;", "<"},
        {"&gt;", ">"},
        {"&quot;", "\""},
        {"&apos;", "'"},
        {"&nbsp;", "\xC2\xA0"},
        {"&copy;", "\xC2\xA9"},
        {"&reg;", "\xC2\xAE"},
        {"&trade;", "\xE2\x84\xA2"},
        {"&hellip;", "\xE2\x80\xA6"},
        {"&ndash;", "\xE2\x80\x93"},
        {"&mdash;", "\xE2\x80\x94"},
    };

    for (const named& n : named_entities)
    {
        if (n._name == entity)
        {
            return std::string{n._utf8};
        }
    }

    if (entity.size() > 3 && entity[1] == '#' && entity.back() == ';')
    {
        const bool hex = entity[2] == 'x' || entity[2] == 'X';
        const std::size_t digits_begin = hex ? 3 : 2;

        const std::optional<std::uint32_t> cp = parse_code_point(
            entity.substr(digits_begin, entity.size() - digits_begin - 1),
            hex ? 16 : 10);

        if (cp.has_value())
        {
            return encode_utf8(*cp);
        }

        return std::string{replacement_character};
    }

    return std::string{entity};
}

[[nodiscard]] std::string to_string(const MD_ATTRIBUTE& attr)
{
    std::string result;

    for (std::size_t i = 0; attr.substr_offsets[i] < attr.size; ++i)
    {
        const MD_OFFSET begin = attr.substr_offsets[i];
        const MD_OFFSET end = attr.substr_offsets[i + 1];
        const std::string_view part{attr.text + begin, end - begin};

        switch (attr.substr_types[i])
        {
            case MD_TEXT_ENTITY: result += decode_entity(part); break;
            case MD_TEXT_NULLCHAR: result += replacement_character; break;
            default: result += part; break;
        }
    }

    return result;
}

[[nodiscard]] column_alignment to_alignment(const MD_ALIGN align) noexcept
{
    switch (align)
    {
        case MD_ALIGN_LEFT: return column_alignment::left;
        case MD_ALIGN_CENTER: return column_alignment::center;
        case MD_ALIGN_RIGHT: return column_alignment::right;
        case MD_ALIGN_DEFAULT: break;
    }

    return column_alignment::none;
}

void append_text(inline_list& inlines, const std::string_view s)
{
    if (s.empty())
    {
        return;
    }

    if (!inlines.empty())
    {
        if (auto* t = std::get_if<inl::text>(&inlines.back().value))
        {
            t->content += s;
            return;
        }
    }

    inlines.push_back(text(std::string{s}));
}

struct list_entry
{
    bool _is_task;
    bool _completed;
    block_list _children;
};

// A block being built. Only the fields relevant to `_type` are used.
struct block_frame
{
    MD_BLOCKTYPE _type;
    block_list _children;
    inline_list _inlines;
    std::string _literal;
    std::optional<std::string> _fence_info;
    std::vector<list_entry> _items;
    std::vector<blk::table_row> _rows;
    std::vector<blk::table_cell> _cells;
    std::vector<column_alignment> _alignments;
    column_alignment _alignment{column_alignment::none};
    int _level{0};
    bool _tight{false};
    std::uint32_t _start{1};
    bool _is_task{false};
    bool _completed{false};
};

struct span_frame
{
    MD_SPANTYPE _type;
    std::string _target;
    std::string _code;
    inline_list _children;
};

} // namespace

// ----------------------------------------------------------------------------

struct md4c_parser::impl
{
private:
    std::ostream& _err_stream;
    std::vector<block_frame> _blocks;
    std::vector<span_frame> _spans;
    std::optional<block_list> _result;

    [[nodiscard]] std::ostream& error_diagnostic_stream(const char* type)
    {
        return _err_stream << "((MDSH " << type << " ERROR)): ";
    }

    [[nodiscard]] inline_list& inline_sink() noexcept
    {
        if (!_spans.empty())
        {
            return _spans.back()._children;
        }

        return _blocks.back()._inlines;
    }

    // Tight list items receive their text without an enclosing paragraph.
    static void flush_inlines(block_frame& frame)
    {
        if (frame._inlines.empty())
        {
            return;
        }

        frame._children.push_back(paragraph(std::move(frame._inlines)));
        frame._inlines.clear();
    }

    void deliver(block_node&& node)
    {
        block_frame& parent = _blocks.back();

        flush_inlines(parent);
        parent._children.push_back(std::move(node));
    }

    [[nodiscard]] static block_node make_list(block_frame& frame)
    {
        const bool all_tasks = !frame._items.empty() &&
                               std::all_of(frame._items.begin(),
                                   frame._items.end(),
                                   [](const list_entry& e) { return e._is_task; });

        if (frame._type == MD_BLOCK_UL && all_tasks)
        {
            std::vector<blk::task_list_item> items;
            items.reserve(frame._items.size());

            for (list_entry& e : frame._items)
            {
                items.push_back(blk::task_list_item{
                    e._completed, std::move(e._children)});
            }

            return make_block(blk::task_list{frame._tight, std::move(items)});
        }

        std::vector<blk::list_item> items;
        items.reserve(frame._items.size());

        for (list_entry& e : frame._items)
        {
            items.push_back(blk::list_item{std::move(e._children)});
        }

        if (frame._type == MD_BLOCK_OL)
        {
            return make_block(blk::numbered_list{
                frame._tight, frame._start, std::move(items)});
        }

        return make_block(blk::bulleted_list{frame._tight, std::move(items)});
    }

    // Header and body rows go straight into the table.
    [[nodiscard]] static bool is_row_group(const MD_BLOCKTYPE type) noexcept
    {
        return type == MD_BLOCK_THEAD || type == MD_BLOCK_TBODY;
    }

    void enter_block(const MD_BLOCKTYPE type, void* detail)
    {
        if (is_row_group(type))
        {
            return;
        }

        block_frame& frame = _blocks.emplace_back();
        frame._type = type;

        switch (type)
        {
            case MD_BLOCK_UL:
            {
                const auto* d = static_cast<const MD_BLOCK_UL_DETAIL*>(detail);
                frame._tight = d->is_tight != 0;
                break;
            }

            case MD_BLOCK_OL:
            {
                const auto* d = static_cast<const MD_BLOCK_OL_DETAIL*>(detail);
                frame._tight = d->is_tight != 0;
                frame._start = static_cast<std::uint32_t>(d->start);
                break;
            }

            case MD_BLOCK_LI:
            {
                const auto* d = static_cast<const MD_BLOCK_LI_DETAIL*>(detail);
                frame._is_task = d->is_task != 0;
                frame._completed =
                    d->task_mark == 'x' || d->task_mark == 'X';
                break;
            }

            case MD_BLOCK_H:
            {
                const auto* d = static_cast<const MD_BLOCK_H_DETAIL*>(detail);
                frame._level = static_cast<int>(d->level);
                break;
            }

            case MD_BLOCK_CODE:
            {
                const auto* d =
                    static_cast<const MD_BLOCK_CODE_DETAIL*>(detail);

                if (d->fence_char != 0)
                {
                    std::string info = to_string(d->info);
                    if (!info.empty())
                    {
                        frame._fence_info = std::move(info);
                    }
                }

                break;
            }

            case MD_BLOCK_TH:
            case MD_BLOCK_TD:
            {
                const auto* d = static_cast<const MD_BLOCK_TD_DETAIL*>(detail);
                frame._alignment = to_alignment(d->align);
                break;
            }

            default: break;
        }
    }

    void leave_block(const MD_BLOCKTYPE type)
    {
        if (is_row_group(type))
        {
            return;
        }

        block_frame frame = std::move(_blocks.back());
        _blocks.pop_back();

        switch (type)
        {
            case MD_BLOCK_DOC:
            {
                flush_inlines(frame);
                _result = std::move(frame._children);
                break;
            }

            case MD_BLOCK_QUOTE:
            {
                flush_inlines(frame);
                deliver(make_block(blk::blockquote{std::move(frame._children)}));
                break;
            }

            case MD_BLOCK_UL:
            case MD_BLOCK_OL:
            {
                deliver(make_list(frame));
                break;
            }

            case MD_BLOCK_LI:
            {
                flush_inlines(frame);
                _blocks.back()._items.push_back(list_entry{
                    ._is_task = frame._is_task,
                    ._completed = frame._completed,
                    ._children = std::move(frame._children)});
                break;
            }

            case MD_BLOCK_HR:
            {
                deliver(make_block(blk::thematic_break{}));
                break;
            }

            case MD_BLOCK_H:
            {
                deliver(heading(frame._level, std::move(frame._inlines)));
                break;
            }

            case MD_BLOCK_CODE:
            {
                deliver(make_block(blk::code_block{
                    std::move(frame._fence_info), std::move(frame._literal)}));
                break;
            }

            case MD_BLOCK_HTML:
            {
                deliver(
                    make_block(blk::html_block{std::move(frame._literal)}));
                break;
            }

            case MD_BLOCK_P:
            {
                deliver(paragraph(std::move(frame._inlines)));
                break;
            }

            case MD_BLOCK_TABLE:
            {
                deliver(make_block(blk::table{
                    std::move(frame._alignments), std::move(frame._rows)}));
                break;
            }

            case MD_BLOCK_TR:
            {
                block_frame& table = _blocks.back();

                if (table._rows.empty())
                {
                    table._alignments = std::move(frame._alignments);
                }

                table._rows.push_back(blk::table_row{std::move(frame._cells)});
                break;
            }

            case MD_BLOCK_TH:
            case MD_BLOCK_TD:
            {
                block_frame& row = _blocks.back();

                row._cells.push_back(
                    blk::table_cell{std::move(frame._inlines)});
                row._alignments.push_back(frame._alignment);
                break;
            }

            default: break;
        }
    }

    void enter_span(const MD_SPANTYPE type, void* detail)
    {
        span_frame& frame = _spans.emplace_back();
        frame._type = type;

        if (type == MD_SPAN_A)
        {
            frame._target =
                to_string(static_cast<const MD_SPAN_A_DETAIL*>(detail)->href);
        }
        else if (type == MD_SPAN_IMG)
        {
            frame._target =
                to_string(static_cast<const MD_SPAN_IMG_DETAIL*>(detail)->src);
        }
    }

    void leave_span(const MD_SPANTYPE type)
    {
        span_frame frame = std::move(_spans.back());
        _spans.pop_back();

        inline_list& sink = inline_sink();

        switch (type)
        {
            case MD_SPAN_EM:
                sink.push_back(emphasis(std::move(frame._children)));
                break;

            case MD_SPAN_STRONG:
                sink.push_back(strong(std::move(frame._children)));
                break;

            case MD_SPAN_DEL:
                sink.push_back(strikethrough(std::move(frame._children)));
                break;

            case MD_SPAN_A:
                sink.push_back(link(
                    std::move(frame._target), std::move(frame._children)));
                break;

            case MD_SPAN_IMG:
                sink.push_back(image(
                    std::move(frame._target), std::move(frame._children)));
                break;

            case MD_SPAN_CODE:
                sink.push_back(code(std::move(frame._code)));
                break;

            default:
                for (inline_node& child : frame._children)
                {
                    sink.push_back(std::move(child));
                }

                break;
        }
    }

    [[nodiscard]] bool in_literal_block() const noexcept
    {
        return _spans.empty() && (_blocks.back()._type == MD_BLOCK_CODE ||
                                     _blocks.back()._type == MD_BLOCK_HTML);
    }

    [[nodiscard]] bool in_code_span() const noexcept
    {
        return !_spans.empty() && _spans.back()._type == MD_SPAN_CODE;
    }

    void text(const MD_TEXTTYPE type, const std::string_view content)
    {
        if (in_literal_block())
        {
            _blocks.back()._literal +=
                type == MD_TEXT_NULLCHAR ? replacement_character : content;

            return;
        }

        if (in_code_span())
        {
            _spans.back()._code +=
                type == MD_TEXT_NULLCHAR ? replacement_character : content;

            return;
        }

        inline_list& sink = inline_sink();

        switch (type)
        {
            case MD_TEXT_NULLCHAR:
                append_text(sink, replacement_character);
                break;

            case MD_TEXT_BR: sink.push_back(line_break()); break;
            case MD_TEXT_SOFTBR: sink.push_back(soft_break()); break;

            case MD_TEXT_ENTITY:
                append_text(sink, decode_entity(content));
                break;

            case MD_TEXT_HTML: sink.push_back(html(std::string{content})); break;

            default: append_text(sink, content); break;
        }
    }

    template <typename F>
    [[nodiscard]] int guarded(F&& f) noexcept
    {
        try
        {
            f();
            return 0;
        }
        catch (const std::exception& e)
        {
            error_diagnostic_stream("PARSE") << e.what() << "\n\n";
            return -1;
        }
    }

public:
    [[nodiscard]] explicit impl(std::ostream& err_stream) noexcept
        : _err_stream{err_stream}
    {}

    [[nodiscard]] std::optional<block_list> parse(
        const std::string_view source) noexcept
    {
        _blocks.clear();
        _spans.clear();
        _result.reset();

        MD_PARSER parser{};
        parser.abi_version = 0;
        parser.flags = MD_DIALECT_GITHUB;

        parser.enter_block = [](MD_BLOCKTYPE type, void* detail, void* self)
        {
            return static_cast<impl*>(self)->guarded(
                [&] { static_cast<impl*>(self)->enter_block(type, detail); });
        };

        parser.leave_block = [](MD_BLOCKTYPE type, void*, void* self)
        {
            return static_cast<impl*>(self)->guarded(
                [&] { static_cast<impl*>(self)->leave_block(type); });
        };

        parser.enter_span = [](MD_SPANTYPE type, void* detail, void* self)
        {
            return static_cast<impl*>(self)->guarded(
                [&] { static_cast<impl*>(self)->enter_span(type, detail); });
        };

        parser.leave_span = [](MD_SPANTYPE type, void*, void* self)
        {
            return static_cast<impl*>(self)->guarded(
                [&] { static_cast<impl*>(self)->leave_span(type); });
        };

        parser.text = [](MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size,
                          void* self)
        {
            return static_cast<impl*>(self)->guarded(
                [&]
                {
                    static_cast<impl*>(self)->text(
                        type, std::string_view{text, size});
                });
        };

        const int rc = md_parse(source.data(),
            static_cast<MD_SIZE>(source.size()), &parser, this);

        _blocks.clear();
        _spans.clear();

        if (rc != 0 || !_result.has_value())
        {
            error_diagnostic_stream("PARSE")
                << "md4c failed with code " << rc << "\n\n";

            return std::nullopt;
        }

        return std::exchange(_result, std::nullopt);
    }
};

// ----------------------------------------------------------------------------

md4c_parser::md4c_parser(std::ostream& err_stream)
    : _impl{std::make_unique<impl>(err_stream)}
{}

md4c_parser::~md4c_parser() = default;

md4c_parser::md4c_parser(md4c_parser&&) noexcept = default;
md4c_parser& md4c_parser::operator=(md4c_parser&&) noexcept = default;

std::optional<block_list> md4c_parser::parse(
    const std::string_view source) noexcept
{
    return _impl->parse(source);
}

} // namespace mdshield

#include <libutl/common/utilities.hpp>
#include <libutl/diag/internal/diag.hpp>

namespace {
    // A position is valid if both its line and column components are nonzero.
    constexpr auto is_valid_position(utl::diag::Position const position) noexcept -> bool
    {
        return position.line != 0 && position.column != 0;
    }

    auto level_color(utl::diag::Level const level, utl::diag::Colors const colors) noexcept
        -> utl::Color
    {
        switch (level) {
        case utl::diag::Level::error:
            return colors.error;
        case utl::diag::Level::warning:
            return colors.warning;
        case utl::diag::Level::note:
            return colors.note;
        default:
            utl::unreachable();
        }
    }

    auto level_string(utl::diag::Level const level) noexcept -> std::string_view
    {
        switch (level) {
        case utl::diag::Level::error:
            return "Error";
        case utl::diag::Level::warning:
            return "Warning";
        case utl::diag::Level::note:
            return "Note";
        default:
            utl::unreachable();
        }
    }

    auto caret_count(
        utl::diag::Text_section const& section, std::size_t const line_count) noexcept
        -> std::size_t
    {
        // A section that spans several lines is underlined on its final line only.
        std::size_t const first_column
            = line_count == 1 ? section.start_position.column : std::size_t { 1 };
        return section.stop_position.column > first_column
                 ? section.stop_position.column - first_column
                 : 1;
    }

    auto format_section(
        utl::diag::Text_section const& section,
        utl::Color const               title_color,
        utl::diag::Colors const        colors,
        std::string&                   output) -> void
    {
        auto const lines = utl::diag::internal::get_relevant_lines(
            section.source_string, section.start_position, section.stop_position);
        auto const digits = utl::digit_count(section.stop_position.line);
        auto const gutter = std::string(digits, ' ');
        auto const out    = std::back_inserter(output);

        fmt::format_to(
            out,
            "\n\n{} {}-->{} {}\n{} {}|{}",
            gutter,
            colors.position_info,
            colors.normal,
            section.start_position,
            gutter,
            colors.position_info,
            colors.normal);

        auto line_number = section.start_position.line;
        for (std::string_view const line : lines) {
            fmt::format_to(
                out,
                "\n{}{:>{}} |{} {}",
                colors.position_info,
                line_number++,
                digits,
                colors.normal,
                line);
        }

        std::size_t const indentation = lines.size() == 1 ? section.start_position.column - 1 : 0;

        fmt::format_to(
            out,
            "\n{} {}|{} {}{}{} {}{}",
            gutter,
            colors.position_info,
            colors.normal,
            std::string(indentation, ' '),
            section.note_color.value_or(title_color),
            std::string(caret_count(section, lines.size()), '^'),
            section.note.value_or("here"),
            colors.normal);
    }
} // namespace

auto utl::diag::position_at(std::string_view const text, std::size_t const offset) -> Position
{
    utl::always_assert(offset <= utl::utf8_length(text));
    Position position;
    for (std::size_t index = 0, count = 0; count != offset; ++count) {
        char const character = text[index];
        index                = utl::utf8_advance(text, index, 1);
        if (character == '\n') {
            ++position.line;
            position.column = 1;
        }
        else {
            ++position.column;
        }
    }
    return position;
}

auto utl::diag::Colors::defaults() noexcept -> Colors
{
    return Colors {
        .normal        = Color::white,
        .error         = Color::red,
        .warning       = Color::dark_yellow,
        .note          = Color::cyan,
        .position_info = Color::dark_cyan,
    };
}

auto utl::diag::internal::get_relevant_lines(
    std::string_view const source_string, Position const section_start, Position const section_stop)
    -> std::vector<std::string_view>
{
    utl::always_assert(is_valid_position(section_start));
    utl::always_assert(is_valid_position(section_stop));
    utl::always_assert(section_start <= section_stop);

    auto       source_it  = source_string.begin();
    auto const source_end = source_string.end();

    for (std::size_t line = 1; line != section_start.line; ++line) {
        source_it = std::find(source_it, source_end, '\n');
        // If a newline isn't found, the position was set incorrectly.
        utl::always_assert(source_it != source_end);
        // Set the source iterator to the first character of the next line.
        ++source_it;
    }

    std::vector<std::string_view> lines;
    lines.reserve(1 + section_stop.line - section_start.line);

    for (std::size_t line = section_start.line; line != section_stop.line; ++line) {
        auto const newline_it = std::find(source_it, source_end, '\n');
        // As the last relevant line is yet to be reached, a newline must be found.
        utl::always_assert(newline_it != source_end);
        lines.emplace_back(source_it, newline_it);
        // Set the source iterator to the first character of the next relevant line.
        source_it = newline_it + 1;
    }

    // The final line can be terminated by either a newline or the end of input.
    lines.emplace_back(source_it, std::find(source_it, source_end, '\n'));

    return lines;
}

auto utl::diag::format_diagnostic(
    Diagnostic const& diagnostic, std::string& output, Colors const colors) -> void
{
    auto const original_output_size = output.size();
    auto const title_color          = level_color(diagnostic.level, colors);
    try {
        fmt::format_to(
            std::back_inserter(output),
            "{}{}:{} {}",
            title_color,
            level_string(diagnostic.level),
            colors.normal,
            diagnostic.message);

        for (Text_section const& section : diagnostic.text_sections) {
            format_section(section, title_color, colors, output);
        }

        if (diagnostic.help_note.has_value()) {
            fmt::format_to(
                std::back_inserter(output),
                "\n\n{}Help:{} {}",
                colors.note,
                colors.normal,
                diagnostic.help_note.value());
        }
    }
    catch (...) {
        output.resize(original_output_size);
        throw;
    }
}

auto utl::diag::format_diagnostic(Diagnostic const& diagnostic, Colors const colors)
    -> std::string
{
    auto output = utl::string_with_capacity(64);
    format_diagnostic(diagnostic, output, colors);
    return output;
}

DEFINE_FORMATTER_FOR(utl::diag::Position)
{
    return fmt::format_to(context.out(), "{}:{}", value.line, value.column);
}

DEFINE_FORMATTER_FOR(utl::diag::Level)
{
    return fmt::format_to(context.out(), "{}", level_string(value));
}

#include <libutl/common/utilities.hpp>
#include <liblex/extract.hpp>
#include <liblex/lex.hpp>

lexis::Parse_failure::Parse_failure(
    std::string message, std::size_t const offset, std::optional<std::string> help_note) noexcept
    : Exception { std::move(message) }
    , m_offset { offset }
    , m_help_note { std::move(help_note) }
{}

auto lexis::Parse_failure::message() const noexcept -> std::string_view
{
    return what();
}

auto lexis::Parse_failure::offset() const noexcept -> std::size_t
{
    return m_offset;
}

auto lexis::Parse_failure::help_note() const noexcept -> std::optional<std::string> const&
{
    return m_help_note;
}

auto lexis::lex_token(Cursor& cursor) -> Token
{
    if (!cursor.has()) {
        liblex::error(cursor.index(), "Expected a token, but found the end of input");
    }
    if (cursor.peek(is_whitespace)) {
        liblex::error(cursor.index(), "Expected a token, but found whitespace");
    }

    if (cursor.peek(is_identifier_head)) {
        return liblex::extract_identifier(cursor);
    }
    // A sign belongs to a number only when a digit follows it immediately.
    if (cursor.peek(is_digit) || cursor.peek(is_sign, is_digit)) {
        return liblex::extract_number(cursor);
    }
    if (cursor.peek('\'')) {
        return liblex::extract_character(cursor);
    }
    if (cursor.peek('"')) {
        return liblex::extract_string(cursor);
    }
    return liblex::extract_operator(cursor);
}

auto lexis::lex(std::string_view const input) -> std::vector<Token>
{
    Cursor             cursor { std::string(input) };
    std::vector<Token> tokens;

    while (cursor.has()) {
        while (cursor.match(is_whitespace)) {
            cursor.reset_mark();
        }
        if (cursor.has()) {
            tokens.push_back(lex_token(cursor));
        }
    }

    return tokens;
}

auto lexis::format_parse_failure(
    std::string_view const source, Parse_failure const& failure, utl::diag::Colors const& colors)
    -> std::string
{
    auto const at_end = failure.offset() == utl::utf8_length(source);
    auto const start  = utl::diag::position_at(source, failure.offset());
    auto const stop   = utl::diag::Position { .line = start.line, .column = start.column + 1 };

    utl::diag::Text_section section {
        .source_string  = source,
        .start_position = start,
        .stop_position  = stop,
        .note           = at_end ? "input ends here" : "here",
        .note_color     = std::nullopt,
    };

    return utl::diag::format_diagnostic(
        utl::diag::Diagnostic {
            .text_sections = { std::move(section) },
            .message       = std::string(failure.message()),
            .help_note     = failure.help_note(),
            .level         = utl::diag::Level::error,
        },
        colors);
}

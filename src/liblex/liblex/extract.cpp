#include <libutl/common/utilities.hpp>
#include <liblex/extract.hpp>

using lexis::Cursor;
using lexis::Token;
using lexis::Token_kind;

namespace {
    constexpr auto is_character_content = lexis::is_none_of<"'\\\n\r">;
    constexpr auto is_string_content    = lexis::is_none_of<"\"\\\n\r">;
    constexpr auto is_comparison_head   = lexis::is_one_of<"!=<>">;

    auto escape_sequence_list(std::string_view const escape_letters) -> std::string
    {
        std::string list;
        for (char const letter : escape_letters) {
            if (!list.empty()) {
                list.append(", ");
            }
            list.push_back('\\');
            list.push_back(letter);
        }
        return list;
    }

    auto consume_digits(Cursor& cursor) -> void
    {
        while (cursor.match(lexis::is_digit)) {}
    }
} // namespace

auto liblex::error(
    std::size_t const offset, std::string message, std::optional<std::string> help_note) -> void
{
    throw lexis::Parse_failure { std::move(message), offset, std::move(help_note) };
}

auto liblex::extract_identifier(Cursor& cursor) -> Token
{
    if (!cursor.match(lexis::is_identifier_head)) {
        error(
            cursor.index(),
            "Invalid identifier start",
            "identifiers begin with a letter or an underscore");
    }
    while (cursor.match(lexis::is_identifier_tail)) {}
    return cursor.emit(Token_kind::identifier);
}

auto liblex::extract_number(Cursor& cursor) -> Token
{
    cursor.match(lexis::is_sign);

    // A leading zero forms the whole integer part, so `0123` is two tokens.
    if (!cursor.match('0')) {
        if (!cursor.match(lexis::is_nonzero_digit)) {
            error(cursor.index(), "Invalid number", "a sign must be followed by a digit");
        }
        consume_digits(cursor);
    }

    if (cursor.match('.')) {
        if (!cursor.match(lexis::is_digit)) {
            error(
                cursor.index(),
                "Invalid decimal number",
                "a decimal point must be followed by at least one digit");
        }
        consume_digits(cursor);
        return cursor.emit(Token_kind::decimal);
    }

    return cursor.emit(Token_kind::integer);
}

auto liblex::extract_escape(Cursor& cursor, std::string_view const escape_letters) -> void
{
    if (!cursor.match('\\')) {
        error(cursor.index(), "Expected an escape sequence");
    }
    auto const is_escape_letter = [escape_letters](char const c) {
        return escape_letters.find(c) != std::string_view::npos;
    };
    if (!cursor.match(is_escape_letter)) {
        error(
            cursor.index(),
            "Invalid escape sequence",
            fmt::format("valid escape sequences are {}", escape_sequence_list(escape_letters)));
    }
}

auto liblex::extract_character(Cursor& cursor) -> Token
{
    if (!cursor.match('\'')) {
        error(cursor.index(), "Expected a character literal");
    }

    if (!cursor.has()) {
        error(cursor.index(), "Unterminated character literal");
    }
    else if (cursor.peek('\\')) {
        extract_escape(cursor, character_escape_letters);
    }
    else if (cursor.peek('\'')) {
        error(
            cursor.index(),
            "Empty character literal",
            "character literals contain exactly one character");
    }
    else if (!cursor.match(is_character_content)) {
        error(
            cursor.index(),
            "Invalid character literal",
            "use an escape sequence such as '\\n' for line breaks");
    }

    if (!cursor.match('\'')) {
        error(
            cursor.index(),
            "Unterminated character literal",
            "expected a closing single quote after one character");
    }

    return cursor.emit(Token_kind::character);
}

auto liblex::extract_string(Cursor& cursor) -> Token
{
    if (!cursor.match('"')) {
        error(cursor.index(), "Expected a string literal");
    }

    for (;;) {
        if (cursor.match('"')) {
            return cursor.emit(Token_kind::string);
        }
        if (cursor.peek('\\')) {
            extract_escape(cursor, string_escape_letters);
        }
        else if (!cursor.match(is_string_content)) {
            // Either the end of input or a raw line break.
            error(
                cursor.index(),
                "Unterminated string literal",
                "string literals can not span multiple lines, use '\\n' instead");
        }
    }
}

auto liblex::extract_operator(Cursor& cursor) -> Token
{
    if (cursor.match('&', '&') || cursor.match('|', '|') || cursor.match(is_comparison_head, '=')) {
        return cursor.emit(Token_kind::operator_);
    }
    if (!cursor.has()) {
        error(cursor.index(), "Expected an operator, but found the end of input");
    }
    cursor.advance();
    return cursor.emit(Token_kind::operator_);
}

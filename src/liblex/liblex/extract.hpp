#pragma once

#include <libutl/common/utilities.hpp>
#include <liblex/lex.hpp>

// Token extraction routines, one per token category. Each routine starts at the read
// position of the cursor, consumes one token and emits it, or throws `lexis::Parse_failure`.

namespace liblex {

    constexpr std::string_view character_escape_letters = "bnrt'\"\\";
    constexpr std::string_view string_escape_letters    = "bnrt'\"\\ ";

    [[noreturn]] auto error(
        std::size_t                offset,
        std::string                message,
        std::optional<std::string> help_note = std::nullopt) -> void;

    [[nodiscard]] auto extract_identifier(lexis::Cursor& cursor) -> lexis::Token;
    [[nodiscard]] auto extract_number(lexis::Cursor& cursor) -> lexis::Token;
    [[nodiscard]] auto extract_character(lexis::Cursor& cursor) -> lexis::Token;
    [[nodiscard]] auto extract_string(lexis::Cursor& cursor) -> lexis::Token;
    [[nodiscard]] auto extract_operator(lexis::Cursor& cursor) -> lexis::Token;

    // Consume a backslash followed by one of `escape_letters`.
    auto extract_escape(lexis::Cursor& cursor, std::string_view escape_letters) -> void;

} // namespace liblex

#pragma once

#include <libutl/common/utilities.hpp>
#include <libutl/diag/diag.hpp>
#include <liblex/cursor.hpp>
#include <liblex/token.hpp>

namespace lexis {

    // Thrown when the input can not be tokenized. The offset is the index of the
    // character at which the input became invalid.
    class Parse_failure : public utl::Exception {
        std::size_t                m_offset {};
        std::optional<std::string> m_help_note;
    public:
        Parse_failure(
            std::string                message,
            std::size_t                offset,
            std::optional<std::string> help_note = std::nullopt) noexcept;

        [[nodiscard]] auto message() const noexcept -> std::string_view;
        [[nodiscard]] auto offset() const noexcept -> std::size_t;
        [[nodiscard]] auto help_note() const noexcept -> std::optional<std::string> const&;
    };

    // Tokenize all of `input`. Whitespace separates tokens and produces none.
    [[nodiscard]] auto lex(std::string_view input) -> std::vector<Token>;

    // Tokenize exactly one token at the read position of `cursor`.
    [[nodiscard]] auto lex_token(Cursor& cursor) -> Token;

    // Render `failure`, which was thrown while lexing `source`, as an error diagnostic.
    [[nodiscard]] auto format_parse_failure(
        std::string_view         source,
        Parse_failure const&     failure,
        utl::diag::Colors const& colors = utl::diag::Colors::defaults()) -> std::string;

} // namespace lexis

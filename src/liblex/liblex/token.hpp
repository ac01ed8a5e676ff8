#pragma once

#include <libutl/common/utilities.hpp>

namespace lexis {

    enum class Token_kind {
        identifier,
        integer,
        decimal,
        character,
        string,
        operator_,
        _enumerator_count
    };

    // Lexical token. The lexeme is the exact source text of the token, and the offset is
    // the index of its first character in the lexed input.
    struct Token {
        Token_kind  kind {};
        std::string lexeme;
        std::size_t offset {};

        auto operator==(Token const&) const -> bool = default;
    };

    // A short human readable name of a token kind.
    [[nodiscard]] auto token_kind_name(Token_kind kind) -> std::string_view;

} // namespace lexis

DECLARE_FORMATTER_FOR(lexis::Token_kind);
DECLARE_FORMATTER_FOR(lexis::Token);

#pragma once

#include <libutl/common/utilities.hpp>
#include <liblex/token.hpp>

namespace lexis {

    template <utl::Metastring string>
    constexpr auto is_one_of(char const c) noexcept -> bool
    {
        return string.view().find(c) != std::string_view::npos;
    }

    template <utl::Metastring string>
    constexpr auto is_none_of(char const c) noexcept -> bool
    {
        return !is_one_of<string>(c);
    }

    template <char a, char b>
    constexpr auto is_in_range(char const c) noexcept -> bool
        requires(a < b)
    {
        return a <= c && c <= b;
    }

    template <std::predicate<char> auto... predicates>
    constexpr auto satisfies_one_of(char const c) noexcept -> bool
    {
        return (predicates(c) || ...);
    }

    constexpr auto is_whitespace      = is_one_of<" \b\n\r\t">;
    constexpr auto is_sign            = is_one_of<"+-">;
    constexpr auto is_lowercase       = is_in_range<'a', 'z'>;
    constexpr auto is_uppercase       = is_in_range<'A', 'Z'>;
    constexpr auto is_digit           = is_in_range<'0', '9'>;
    constexpr auto is_nonzero_digit   = is_in_range<'1', '9'>;
    constexpr auto is_letter          = satisfies_one_of<is_lowercase, is_uppercase>;
    constexpr auto is_identifier_head = satisfies_one_of<is_letter, is_one_of<"_">>;
    constexpr auto is_identifier_tail = satisfies_one_of<is_letter, is_digit, is_one_of<"_-">>;

    static_assert(is_whitespace('\b') && !is_whitespace('\f'));
    static_assert(is_identifier_head('_') && !is_identifier_head('-'));
    static_assert(is_identifier_tail('-') && !is_identifier_tail('.'));

    // A pattern is either a literal character or a character class predicate.
    template <class T>
    concept character_pattern = std::same_as<T, char> || std::predicate<T const&, char>;

    template <character_pattern Pattern>
    constexpr auto matches(Pattern const& pattern, char const character) -> bool
    {
        if constexpr (std::same_as<Pattern, char>) {
            return pattern == character;
        }
        else {
            return std::invoke(pattern, character);
        }
    }

    // Scanning state over a single input. Characters consumed since the last mark
    // form the lexeme of the next emitted token. The cursor steps over whole UTF-8
    // sequences, and all offsets it reports count characters, not bytes. Patterns are
    // matched against the first byte of each character.
    class [[nodiscard]] Cursor {
        std::string m_input;
        std::size_t m_index {};          // Byte index of the read position
        std::size_t m_mark {};           // Byte index of the mark
        std::size_t m_index_position {}; // Character offset of the read position
        std::size_t m_mark_position {};  // Character offset of the mark

        [[nodiscard]] auto byte_index(std::size_t offset) const noexcept -> std::size_t;
    public:
        explicit Cursor(std::string input) noexcept;

        Cursor(Cursor const&)                        = delete;
        auto operator=(Cursor const&)                = delete;
        Cursor(Cursor&&) noexcept                    = default;
        auto operator=(Cursor&&) noexcept -> Cursor& = default;
        ~Cursor()                                    = default;

        // Whether the character `offset` positions ahead of the read position exists.
        [[nodiscard]] auto has(std::size_t offset = 0) const noexcept -> bool;

        // The character `offset` positions ahead of the read position. Requires `has(offset)`.
        [[nodiscard]] auto peek_char(std::size_t offset = 0) const noexcept -> char;

        // Consume one character.
        auto advance() noexcept -> void;

        // Discard the characters consumed since the last mark.
        auto reset_mark() noexcept -> void;

        // Emit the characters consumed since the last mark as a token of the given kind.
        [[nodiscard]] auto emit(Token_kind kind) -> Token;

        // Character offsets of the read position and of the mark.
        [[nodiscard]] auto index() const noexcept -> std::size_t;
        [[nodiscard]] auto mark() const noexcept -> std::size_t;
        [[nodiscard]] auto input() const noexcept -> std::string_view;

        // Check whether the upcoming characters match `patterns`, one pattern per character.
        template <character_pattern... Patterns>
        [[nodiscard]] auto peek(Patterns const&... patterns) const -> bool
        {
            std::size_t offset = 0;
            return ((has(offset) && matches(patterns, peek_char(offset++))) && ...);
        }

        // Like `peek`, but consumes the matched characters on success.
        template <character_pattern... Patterns>
        auto match(Patterns const&... patterns) -> bool
        {
            if (!peek(patterns...)) {
                return false;
            }
            for (std::size_t i = 0; i != sizeof...(Patterns); ++i) {
                advance();
            }
            return true;
        }
    };

} // namespace lexis

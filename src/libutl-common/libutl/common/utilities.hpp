#pragma once

// This file is intended to be included by every translation unit in the project.

#include <cstdlib>
#include <cstddef>
#include <cstdint>
#include <climits>

#include <limits>
#include <memory>
#include <utility>
#include <concepts>
#include <exception>
#include <stdexcept>
#include <functional>
#include <type_traits>
#include <source_location>

#include <span>
#include <array>
#include <vector>
#include <optional>

#include <string>
#include <string_view>

#include <ranges>
#include <algorithm>

#include <fmt/format.h>

// 8-bit bytes are assumed
static_assert(CHAR_BIT == 8);

namespace utl {

    constexpr auto filename_without_path(std::string_view path) noexcept -> std::string_view
    {
        if (auto const pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
            path.remove_prefix(pos + 1);
        }
        return path;
    }

    static_assert(filename_without_path("aaa/bbb/ccc") == "ccc");
    static_assert(filename_without_path("aaa\\bbb\\ccc") == "ccc");

    class [[nodiscard]] Exception : public std::exception {
        std::string m_message;
    public:
        explicit Exception(std::string&& message) noexcept : m_message { std::move(message) } {}

        [[nodiscard]] auto what() const noexcept -> char const* override
        {
            return m_message.c_str();
        }
    };

    template <class... Args>
    auto exception(fmt::format_string<Args...> const fmt, Args&&... args) -> Exception
    {
        return Exception { fmt::format(fmt, std::forward<Args>(args)...) };
    }

    [[noreturn]] auto abort(
        std::string_view message = "Invoked utl::abort",
        std::source_location     = std::source_location::current()) -> void;

    [[noreturn]] auto unreachable(std::source_location = std::source_location::current()) -> void;

    auto always_assert(bool, std::source_location = std::source_location::current()) -> void;

    template <class E>
        requires std::is_enum_v<E> && requires { E::_enumerator_count; }
    constexpr std::size_t enumerator_count = static_cast<std::size_t>(E::_enumerator_count);

    template <class E, E min = E {}, E max = E::_enumerator_count>
    [[nodiscard]] constexpr auto is_valid_enumerator(E const e) noexcept -> bool
        requires std::is_enum_v<E>
    {
        return min <= e && max > e;
    }

    template <class E>
    [[nodiscard]] constexpr auto as_index(E const e) noexcept -> std::size_t
        requires std::is_enum_v<E>
    {
        always_assert(is_valid_enumerator(e));
        return static_cast<std::size_t>(e);
    }

    [[nodiscard]] constexpr auto digit_count(std::integral auto integer) noexcept -> std::size_t
    {
        std::size_t digits = 0;
        do {
            integer /= 10;
            ++digits;
        } while (integer != 0);
        return digits;
    }

    static_assert(digit_count(0) == 1);
    static_assert(digit_count(-10) == 2);
    static_assert(digit_count(12345) == 5);

    [[nodiscard]] auto string_with_capacity(std::size_t capacity) -> std::string;

    // The length of the UTF-8 sequence introduced by `lead`.
    // A byte that can not begin a sequence is a character of its own.
    [[nodiscard]] constexpr auto utf8_sequence_length(char const lead) noexcept -> std::size_t
    {
        auto const byte = static_cast<unsigned char>(lead);
        if ((byte & 0xE0) == 0xC0) {
            return 2;
        }
        if ((byte & 0xF0) == 0xE0) {
            return 3;
        }
        if ((byte & 0xF8) == 0xF0) {
            return 4;
        }
        return 1;
    }

    // The byte index of the character `count` characters past the byte index `index`,
    // or the size of `text` if there are fewer characters. Truncated sequences end at
    // the end of `text`.
    [[nodiscard]] constexpr auto utf8_advance(
        std::string_view const text, std::size_t index, std::size_t count) noexcept
        -> std::size_t
    {
        for (; count != 0 && index < text.size(); --count) {
            index += std::min(utf8_sequence_length(text[index]), text.size() - index);
        }
        return std::min(index, text.size());
    }

    // The number of characters in `text`.
    [[nodiscard]] constexpr auto utf8_length(std::string_view const text) noexcept -> std::size_t
    {
        std::size_t length = 0;
        for (std::size_t index = 0; index != text.size(); index = utf8_advance(text, index, 1)) {
            ++length;
        }
        return length;
    }

    static_assert(utf8_sequence_length('a') == 1);
    static_assert(utf8_sequence_length('\xC3') == 2);
    static_assert(utf8_sequence_length('\xA9') == 1);
    static_assert(utf8_length("a\xC3\xA9" "b") == 3);
    static_assert(utf8_length("\xE2\x82") == 1);
    static_assert(utf8_advance("\xF0\x9F\x98\x80x", 0, 1) == 4);

    template <std::size_t length>
    struct [[nodiscard]] Metastring {
        char characters[length];

        consteval Metastring(char const (&string)[length]) noexcept // NOLINT: implicit
        {
            std::copy_n(string, length, characters);
        }

        [[nodiscard]] constexpr auto view() const noexcept -> std::string_view
        {
            return { characters, length - 1 };
        }
    };

    template <std::size_t length>
    Metastring(char const (&)[length]) -> Metastring<length>;

    namespace formatting {
        struct Formatter_base {
            constexpr auto parse(auto& parse_context)
            {
                return parse_context.begin();
            }
        };

        template <std::ranges::input_range Range>
        struct Join_closure {
            Range const*     range {};
            std::string_view delimiter;
        };

        template <std::ranges::input_range Range>
        auto join(Range const& range, std::string_view const delimiter) -> Join_closure<Range>
        {
            return { std::addressof(range), delimiter };
        }
    } // namespace formatting

} // namespace utl

template <class Range>
struct fmt::formatter<utl::formatting::Join_closure<Range>> : utl::formatting::Formatter_base {
    auto format(utl::formatting::Join_closure<Range> const& closure, fmt::format_context& context)
        const
    {
        auto       it  = std::ranges::begin(*closure.range);
        auto const end = std::ranges::end(*closure.range);
        auto       out = context.out();
        if (it == end) {
            return out;
        }
        out = fmt::format_to(out, "{}", *it++);
        while (it != end) {
            out = fmt::format_to(out, "{}{}", closure.delimiter, *it++);
        }
        return out;
    }
};

#define DECLARE_FORMATTER_FOR(...)                                                 \
    template <>                                                                    \
    struct fmt::formatter<__VA_ARGS__> : utl::formatting::Formatter_base {         \
        [[nodiscard]] auto format(__VA_ARGS__ const&, fmt::format_context&) const \
            -> fmt::format_context::iterator;                                      \
    }

#define DEFINE_FORMATTER_FOR(...)                                                        \
    auto fmt::formatter<__VA_ARGS__>::format(                                            \
        __VA_ARGS__ const& value, fmt::format_context& context) const                    \
        -> fmt::format_context::iterator
